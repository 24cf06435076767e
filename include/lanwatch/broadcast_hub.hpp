#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>
#include <nlohmann/json.hpp>

#include "lanwatch/device_types.hpp"

namespace lanwatch::control {

// A connected consumer of the event stream. `deliver` must not block; it
// reports completion of each payload through `on_complete`, from any thread.
class Observer {
public:
    using DeliveryHandler = std::function<void(const boost::system::error_code&)>;

    virtual ~Observer() = default;

    virtual void deliver(std::shared_ptr<const std::string> payload, DeliveryHandler on_complete) = 0;
    virtual void close() = 0;
    virtual std::string describe() const = 0;
};

// Fans events out to every registered observer. All bookkeeping runs on the
// hub's strand; a delivery that fails or does not complete within
// `send_timeout` removes only that observer.
class BroadcastHub {
public:
    using ObserverId = std::uint64_t;
    using SnapshotSource = std::function<std::shared_ptr<const Snapshot>()>;

    BroadcastHub(boost::asio::io_context& io_context, std::chrono::milliseconds send_timeout, std::size_t max_pending);

    BroadcastHub(const BroadcastHub&) = delete;
    BroadcastHub& operator=(const BroadcastHub&) = delete;

    // New observers receive the snapshot returned by `source` as initial_state.
    void set_snapshot_source(SnapshotSource source);

    ObserverId register_observer(std::shared_ptr<Observer> observer);
    void deregister_observer(ObserverId id);
    void broadcast(const nlohmann::json& event);
    void close_all();

    std::size_t observer_count() const { return observer_count_.load(); }

private:
    struct Entry {
        std::shared_ptr<Observer> observer;
        std::size_t pending{0};
    };

    void deliver(ObserverId id, std::shared_ptr<const std::string> payload);
    void on_delivered(ObserverId id, const boost::system::error_code& ec);
    void drop(ObserverId id, const std::string& reason);
    void forget_handle(ObserverId id);

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    const std::chrono::milliseconds send_timeout_;
    const std::size_t max_pending_;
    std::unordered_map<ObserverId, Entry> observers_;
    std::atomic<std::size_t> observer_count_{0};

    mutable std::mutex handles_mutex_;
    std::unordered_map<const Observer*, ObserverId> handles_;
    ObserverId next_id_{1};

    std::mutex source_mutex_;
    SnapshotSource snapshot_source_;
};

}  // namespace lanwatch::control
