#include "lanwatch/broadcast_hub.hpp"

#include <utility>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include "lanwatch/event_codec.hpp"
#include "lanwatch/util/logging.hpp"

namespace lanwatch::control {

namespace asio = boost::asio;

BroadcastHub::BroadcastHub(asio::io_context& io_context, std::chrono::milliseconds send_timeout,
                           std::size_t max_pending)
    : strand_(asio::make_strand(io_context)), send_timeout_(send_timeout), max_pending_(max_pending) {}

void BroadcastHub::set_snapshot_source(SnapshotSource source) {
    std::lock_guard<std::mutex> lock(source_mutex_);
    snapshot_source_ = std::move(source);
}

BroadcastHub::ObserverId BroadcastHub::register_observer(std::shared_ptr<Observer> observer) {
    ObserverId id = 0;
    {
        std::lock_guard<std::mutex> lock(handles_mutex_);
        auto [it, inserted] = handles_.try_emplace(observer.get(), next_id_);
        if (!inserted) {
            return it->second;
        }
        id = next_id_++;
    }

    asio::post(strand_, [this, id, observer = std::move(observer)]() mutable {
        const auto description = observer->describe();
        observers_.emplace(id, Entry{std::move(observer), 0});
        observer_count_.store(observers_.size());
        util::log::info("Observer " + description + " connected (total: " + std::to_string(observers_.size()) + ")");

        std::shared_ptr<const Snapshot> snapshot;
        {
            std::lock_guard<std::mutex> lock(source_mutex_);
            if (snapshot_source_) {
                snapshot = snapshot_source_();
            }
        }
        if (snapshot) {
            deliver(id, std::make_shared<const std::string>(codec::make_initial_state(*snapshot).dump()));
        }
    });
    return id;
}

void BroadcastHub::deregister_observer(ObserverId id) {
    asio::post(strand_, [this, id] {
        auto it = observers_.find(id);
        if (it == observers_.end()) {
            return;
        }
        const auto description = it->second.observer->describe();
        observers_.erase(it);
        observer_count_.store(observers_.size());
        forget_handle(id);
        util::log::info("Observer " + description + " removed (remaining: " + std::to_string(observers_.size()) + ")");
    });
}

void BroadcastHub::broadcast(const nlohmann::json& event) {
    auto payload = std::make_shared<const std::string>(event.dump());
    asio::post(strand_, [this, payload = std::move(payload)] {
        std::vector<ObserverId> targets;
        targets.reserve(observers_.size());
        for (const auto& [id, _] : observers_) {
            targets.push_back(id);
        }
        for (const auto id : targets) {
            deliver(id, payload);
        }
    });
}

void BroadcastHub::close_all() {
    asio::post(strand_, [this] {
        std::vector<ObserverId> targets;
        for (const auto& [id, _] : observers_) {
            targets.push_back(id);
        }
        for (const auto id : targets) {
            drop(id, "hub shutting down");
        }
    });
}

void BroadcastHub::deliver(ObserverId id, std::shared_ptr<const std::string> payload) {
    auto it = observers_.find(id);
    if (it == observers_.end()) {
        return;
    }
    auto& entry = it->second;
    if (entry.pending >= max_pending_) {
        drop(id, "too many undelivered events");
        return;
    }
    ++entry.pending;

    auto settled = std::make_shared<bool>(false);
    auto timer = std::make_shared<asio::steady_timer>(strand_, send_timeout_);
    timer->async_wait([this, id, settled, timer](const boost::system::error_code& ec) {
        if (ec || *settled) {
            return;
        }
        *settled = true;
        drop(id, "send timed out after " + std::to_string(send_timeout_.count()) + " ms");
    });

    auto observer = entry.observer;
    observer->deliver(std::move(payload), [this, id, settled, timer](const boost::system::error_code& ec) {
        asio::post(strand_, [this, id, settled, timer, ec] {
            if (*settled) {
                return;
            }
            *settled = true;
            timer->cancel();
            on_delivered(id, ec);
        });
    });
}

void BroadcastHub::on_delivered(ObserverId id, const boost::system::error_code& ec) {
    auto it = observers_.find(id);
    if (it == observers_.end()) {
        return;
    }
    if (it->second.pending > 0) {
        --it->second.pending;
    }
    if (ec) {
        drop(id, "delivery failed: " + ec.message());
    }
}

void BroadcastHub::drop(ObserverId id, const std::string& reason) {
    auto it = observers_.find(id);
    if (it == observers_.end()) {
        return;
    }
    auto observer = std::move(it->second.observer);
    observers_.erase(it);
    observer_count_.store(observers_.size());
    forget_handle(id);

    util::log::warn("Dropping observer " + observer->describe() + ": " + reason +
                    " (remaining: " + std::to_string(observers_.size()) + ")");
    observer->close();
}

void BroadcastHub::forget_handle(ObserverId id) {
    std::lock_guard<std::mutex> lock(handles_mutex_);
    for (auto it = handles_.begin(); it != handles_.end(); ++it) {
        if (it->second == id) {
            handles_.erase(it);
            return;
        }
    }
}

}  // namespace lanwatch::control
