#include "lanwatch/scan_loop.hpp"

#include <unordered_map>
#include <utility>

#include <boost/asio/post.hpp>

#include "lanwatch/event_codec.hpp"
#include "lanwatch/util/logging.hpp"

namespace lanwatch::control {

namespace asio = boost::asio;

namespace {

std::string trigger_name(ScanLoop::Trigger trigger) {
    switch (trigger) {
    case ScanLoop::Trigger::Startup:
        return "startup";
    case ScanLoop::Trigger::Timer:
        return "timer";
    case ScanLoop::Trigger::Manual:
        return "manual";
    }
    return "unknown";
}

}  // namespace

ScanLoop::ScanLoop(asio::io_context& io_context,
                   DiscoveryProvider& provider,
                   PresenceStore& store,
                   BroadcastHub& hub,
                   Subnet subnet,
                   ScanSettings settings)
    : provider_(provider),
      store_(store),
      hub_(hub),
      subnet_(std::move(subnet)),
      settings_(std::move(settings)),
      reconciler_(settings_.grace_limit),
      strand_(asio::make_strand(io_context)),
      timer_(strand_),
      worker_(1) {
    // Until the first cycle completes, observers see what the store remembers.
    Snapshot initial;
    initial.interval = settings_.interval;
    for (const auto& record : store_.devices()) {
        initial.devices.push_back(reconciler_.view_of(record, Presence::Existing));
    }
    Reconciler::sort_views(initial.devices);
    snapshot_ = std::make_shared<const Snapshot>(std::move(initial));
}

ScanLoop::~ScanLoop() {
    stopped_ = true;
    worker_.join();
}

void ScanLoop::start() {
    stopped_ = false;
    util::log::info("Starting continuous scanner on " + subnet_.to_string() + " (interval: " +
                    std::to_string(settings_.interval.count()) + "s, grace: " +
                    std::to_string(settings_.grace_limit) + " scans)");
    try_begin(Trigger::Startup);
}

void ScanLoop::stop() {
    stopped_ = true;
    asio::post(strand_, [this] { timer_.cancel(); });
}

bool ScanLoop::trigger_scan_now() {
    return try_begin(Trigger::Manual);
}

std::shared_ptr<const Snapshot> ScanLoop::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

void ScanLoop::replace_snapshot(std::shared_ptr<const Snapshot> snapshot) {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    snapshot_ = std::move(snapshot);
}

bool ScanLoop::try_begin(Trigger trigger) {
    if (stopped_) {
        return false;
    }
    bool expected = false;
    if (!in_flight_.compare_exchange_strong(expected, true)) {
        util::log::debug("Scan already in progress, " + trigger_name(trigger) + " request folded into it");
        return false;
    }
    asio::post(strand_, [this, trigger] { begin_cycle(trigger); });
    return true;
}

void ScanLoop::begin_cycle(Trigger trigger) {
    if (stopped_) {
        in_flight_ = false;
        return;
    }
    timer_.cancel();
    phase_ = Phase::Scanning;

    auto scanning = std::make_shared<Snapshot>(*snapshot());
    scanning->scanning = true;
    replace_snapshot(std::move(scanning));

    util::log::info("Performing network scan (" + trigger_name(trigger) + ")");
    hub_.broadcast(codec::make_message(
        "scan_start", trigger == Trigger::Manual ? "Manual scan requested..." : "Starting network scan..."));

    asio::post(worker_, [this] { run_discovery(); });
}

void ScanLoop::run_discovery() {
    DiscoveryOutcome outcome;
    try {
        outcome.result = provider_.discover(subnet_, settings_.timeout, settings_.retries);
    } catch (const DiscoveryTimeout& ex) {
        outcome.error = std::string("Discovery timed out: ") + ex.what();
    } catch (const DiscoveryError& ex) {
        outcome.error = std::string("Discovery failed: ") + ex.what();
    } catch (const std::exception& ex) {
        outcome.error = std::string("Unexpected discovery failure: ") + ex.what();
    }

    if (outcome.error) {
        util::log::warn(*outcome.error + "; treating this cycle as empty");
        outcome.result.hosts.clear();
        outcome.result.method = "none";
    }
    asio::post(strand_, [this, outcome = std::move(outcome)]() mutable { on_discovery_complete(std::move(outcome)); });
}

void ScanLoop::on_discovery_complete(DiscoveryOutcome outcome) {
    phase_ = Phase::Publishing;
    if (outcome.error) {
        hub_.broadcast(codec::make_message("scan_error", "Scan error: " + *outcome.error));
    }
    asio::post(worker_, [this, outcome = std::move(outcome)] { reconcile_and_persist(outcome); });
}

void ScanLoop::reconcile_and_persist(const DiscoveryOutcome& outcome) {
    const auto now = Clock::now();
    const auto previous = snapshot();
    auto result = reconciler_.reconcile(store_.devices(), previous.get(), outcome.result.hosts, now);

    ScanRecord scan;
    scan.timestamp = now;
    scan.devices_found = outcome.result.hosts.size();
    scan.method = outcome.result.method.empty() ? "none" : outcome.result.method;

    std::optional<std::string> persist_error;
    try {
        const auto committed = store_.commit_cycle(result.records, scan);
        std::unordered_map<std::string, const DeviceRecord*> by_id;
        for (const auto& record : committed) {
            by_id.emplace(record.hardware_id, &record);
        }
        // Pick up notes written while this cycle was running.
        for (auto& view : result.views) {
            if (auto it = by_id.find(view.record.hardware_id); it != by_id.end()) {
                view.record = *it->second;
            }
        }
    } catch (const PersistenceError& ex) {
        persist_error = ex.what();
        util::log::error(std::string("Failed to persist scan results, history for this cycle is lost: ") +
                         ex.what());
    }

    Snapshot snapshot;
    snapshot.devices = std::move(result.views);
    snapshot.timestamp = now;
    snapshot.interval = settings_.interval;
    snapshot.scanning = false;
    snapshot.cycle = previous ? previous->cycle + 1 : 1;
    snapshot.counts = result.events.counts;

    asio::post(strand_, [this, snapshot = std::move(snapshot), events = std::move(result.events),
                         persist_error = std::move(persist_error)]() mutable {
        finish_cycle(std::move(snapshot), std::move(events), std::move(persist_error));
    });
}

void ScanLoop::finish_cycle(Snapshot snapshot, Reconciler::Events events, std::optional<std::string> persist_error) {
    snapshot.next_scan = Clock::now() + settings_.interval;
    auto published = std::make_shared<const Snapshot>(std::move(snapshot));
    replace_snapshot(published);
    ++cycles_completed_;

    const auto& counts = events.counts;
    const auto summary = std::to_string(counts.online_count) + " online, " + std::to_string(counts.new_count) +
                         " new, " + std::to_string(counts.offline_count) + " offline";
    util::log::info("Scan complete: " + summary);
    log_events(events);

    hub_.broadcast(codec::make_message("scan_progress", "Scan complete: " + summary));
    if (persist_error) {
        hub_.broadcast(codec::make_message("scan_error", "Failed to persist scan results: " + *persist_error));
    }
    hub_.broadcast(codec::make_scan_update(*published));

    phase_ = Phase::Idle;
    in_flight_ = false;
    schedule_timer();
}

void ScanLoop::schedule_timer() {
    if (stopped_) {
        return;
    }
    timer_.expires_after(settings_.interval);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || stopped_) {
            return;
        }
        try_begin(Trigger::Timer);
    });
}

void ScanLoop::log_events(const Reconciler::Events& events) const {
    for (const auto& id : events.new_devices) {
        util::log::debug("New device " + id);
    }
    for (const auto& id : events.became_offline) {
        util::log::debug("Device " + id + " went offline");
    }
    for (const auto& id : events.became_online) {
        util::log::debug("Device " + id + " is back online");
    }
}

}  // namespace lanwatch::control
