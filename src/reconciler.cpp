#include "lanwatch/reconciler.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include <boost/asio/ip/address_v4.hpp>

#include "lanwatch/categorizer.hpp"

namespace lanwatch::control {

namespace {

std::uint64_t address_rank(const std::string& address) {
    boost::system::error_code ec;
    const auto parsed = boost::asio::ip::make_address_v4(address, ec);
    if (ec) {
        return std::uint64_t{1} << 32;
    }
    return parsed.to_uint();
}

}  // namespace

Reconciler::Reconciler(std::uint64_t grace_limit) : grace_limit_(grace_limit) {
    if (grace_limit_ == 0) {
        throw std::invalid_argument("grace_limit must be at least 1");
    }
}

Status Reconciler::status_of(const DeviceRecord& record) const {
    return record.consecutive_offline >= grace_limit_ ? Status::Offline : Status::Online;
}

DeviceView Reconciler::view_of(const DeviceRecord& record, Presence presence) const {
    DeviceView view;
    view.record = record;
    view.status = status_of(record);
    view.category = Categorizer::categorize(record);
    view.presence = view.status == Status::Offline ? Presence::Offline : presence;
    return view;
}

void Reconciler::sort_views(std::vector<DeviceView>& views) {
    std::sort(views.begin(), views.end(), [](const DeviceView& a, const DeviceView& b) {
        const auto rank_a = address_rank(a.record.address);
        const auto rank_b = address_rank(b.record.address);
        if (rank_a != rank_b) {
            return rank_a < rank_b;
        }
        return a.record.hardware_id < b.record.hardware_id;
    });
}

Reconciler::Result Reconciler::reconcile(const std::vector<DeviceRecord>& known,
                                         const Snapshot* previous,
                                         const std::vector<DiscoveredHost>& hits,
                                         TimePoint now) const {
    std::unordered_map<std::string, const DiscoveredHost*> seen;
    std::vector<std::string> seen_order;
    for (const auto& hit : hits) {
        auto key = normalize_hardware_id(hit.hardware_id);
        if (key.empty()) {
            continue;
        }
        // A device answering on two addresses keeps the first one reported.
        if (seen.emplace(key, &hit).second) {
            seen_order.push_back(std::move(key));
        }
    }

    Result result;
    result.records.reserve(known.size() + seen.size());
    result.views.reserve(known.size() + seen.size());
    std::unordered_set<std::string> known_ids;

    std::unordered_map<std::string, Status> shown_status;
    if (previous) {
        shown_status.reserve(previous->devices.size());
        for (const auto& view : previous->devices) {
            shown_status.emplace(view.record.hardware_id, view.status);
        }
    }

    for (const auto& existing : known) {
        DeviceRecord record = existing;
        known_ids.insert(record.hardware_id);

        Status prior = status_of(record);
        if (auto shown = shown_status.find(record.hardware_id); shown != shown_status.end()) {
            prior = shown->second;
        }

        record.total_scans += 1;
        record.last_seen = now;

        auto hit = seen.find(record.hardware_id);
        if (hit != seen.end()) {
            record.scans_online += 1;
            record.consecutive_offline = 0;
            record.last_seen_online = now;
            record.address = hit->second->address;
            if (hit->second->name) {
                record.name = hit->second->name;
            }
            ++result.events.counts.online_count;
            if (prior == Status::Offline) {
                result.events.became_online.push_back(record.hardware_id);
                ++result.events.counts.back_online_count;
            }
        } else {
            record.consecutive_offline += 1;
            if (prior == Status::Online && status_of(record) == Status::Offline) {
                result.events.became_offline.push_back(record.hardware_id);
            }
        }

        auto view = view_of(record, Presence::Existing);
        if (view.status == Status::Offline) {
            ++result.events.counts.offline_count;
        }
        result.views.push_back(std::move(view));
        result.records.push_back(std::move(record));
    }

    for (const auto& key : seen_order) {
        if (known_ids.count(key) != 0) {
            continue;
        }
        const auto* hit = seen.at(key);
        DeviceRecord record;
        record.hardware_id = key;
        record.address = hit->address;
        record.name = hit->name;
        record.total_scans = 1;
        record.scans_online = 1;
        record.consecutive_offline = 0;
        record.first_seen = now;
        record.last_seen = now;
        record.last_seen_online = now;

        result.events.new_devices.push_back(key);
        ++result.events.counts.new_count;
        ++result.events.counts.online_count;
        result.views.push_back(view_of(record, Presence::New));
        result.records.push_back(std::move(record));
    }

    sort_views(result.views);
    return result;
}

}  // namespace lanwatch::control
