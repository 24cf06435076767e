#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include "lanwatch/broadcast_hub.hpp"
#include "lanwatch/device_types.hpp"
#include "lanwatch/discovery_provider.hpp"
#include "lanwatch/presence_store.hpp"
#include "lanwatch/reconciler.hpp"
#include "lanwatch/subnet.hpp"
#include "lanwatch/util/config_loader.hpp"

namespace lanwatch::control {

// Owns the canonical snapshot and runs discovery cycles one at a time.
//
// Cycle state lives on `strand_`; discovery, reconciliation and persistence run
// on a dedicated worker so the io_context stays free for connections. The
// in-flight flag is the only admission control: a trigger that loses the race
// is acknowledged and dropped, never queued.
class ScanLoop {
public:
    enum class Phase { Idle, Scanning, Publishing };
    enum class Trigger { Startup, Timer, Manual };

    ScanLoop(boost::asio::io_context& io_context,
             DiscoveryProvider& provider,
             PresenceStore& store,
             BroadcastHub& hub,
             Subnet subnet,
             ScanSettings settings);
    ~ScanLoop();

    ScanLoop(const ScanLoop&) = delete;
    ScanLoop& operator=(const ScanLoop&) = delete;

    void start();
    void stop();

    // Returns false when a cycle is already running; that cycle answers the request.
    bool trigger_scan_now();

    std::shared_ptr<const Snapshot> snapshot() const;
    Phase phase() const { return phase_.load(); }
    std::uint64_t cycles_completed() const { return cycles_completed_.load(); }
    const Subnet& subnet() const { return subnet_; }

private:
    struct DiscoveryOutcome {
        DiscoveryResult result;
        std::optional<std::string> error;
    };

    bool try_begin(Trigger trigger);
    void begin_cycle(Trigger trigger);
    void run_discovery();
    void on_discovery_complete(DiscoveryOutcome outcome);
    void reconcile_and_persist(const DiscoveryOutcome& outcome);
    void finish_cycle(Snapshot snapshot, Reconciler::Events events, std::optional<std::string> persist_error);
    void schedule_timer();
    void replace_snapshot(std::shared_ptr<const Snapshot> snapshot);
    void log_events(const Reconciler::Events& events) const;

    DiscoveryProvider& provider_;
    PresenceStore& store_;
    BroadcastHub& hub_;
    const Subnet subnet_;
    const ScanSettings settings_;
    const Reconciler reconciler_;

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    boost::asio::thread_pool worker_;

    std::atomic<bool> in_flight_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<Phase> phase_{Phase::Idle};
    std::atomic<std::uint64_t> cycles_completed_{0};

    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const Snapshot> snapshot_;
};

}  // namespace lanwatch::control
