#include "core/ports/ClassificationView.hpp"

#include <algorithm>
#include <set>
#include <string>

namespace dockports::core {

namespace {

constexpr Protocol kProtocols[] = {Protocol::Tcp, Protocol::Udp};

// Splits one unused run at every hidden boundary of either protocol.
void appendGapSegments(const GapRange& gap, const HiddenPortSet& hidden,
                       std::vector<ViewEntry>& out) {
    std::set<int> cuts;
    cuts.insert(gap.start);
    for (auto protocol : kProtocols) {
        for (const auto& range : hidden.hiddenWithin(protocol, gap.start, gap.end)) {
            cuts.insert(range.start);
            cuts.insert(range.end + 1);
        }
    }
    cuts.insert(gap.end + 1);

    for (auto it = cuts.begin(); std::next(it) != cuts.end(); ++it) {
        int first = *it;
        int last = *std::next(it) - 1;
        if (first < gap.start || last > gap.end || first > last) {
            continue;
        }

        ViewEntry entry;
        entry.kind = ViewEntry::Kind::Gap;
        entry.range = {static_cast<uint16_t>(first), static_cast<uint16_t>(last)};
        entry.tcpHidden = hidden.contains(entry.range.start, Protocol::Tcp);
        entry.udpHidden = hidden.contains(entry.range.start, Protocol::Udp);
        out.push_back(entry);
    }
}

// Removes used ports from a hidden range, leaving the never-used remainder.
void appendUnusedParts(const HiddenPortEntry& entry, const std::vector<uint16_t>& usedPorts,
                       std::vector<HiddenPortEntry>& out) {
    int cursor = entry.start;
    auto it = std::lower_bound(usedPorts.begin(), usedPorts.end(), entry.start);
    for (; it != usedPorts.end() && *it <= entry.end; ++it) {
        if (*it > cursor) {
            out.push_back({entry.protocol, static_cast<uint16_t>(cursor),
                           static_cast<uint16_t>(*it - 1)});
        }
        cursor = *it + 1;
    }
    if (cursor <= entry.end) {
        out.push_back({entry.protocol, static_cast<uint16_t>(cursor), entry.end});
    }
}

} // namespace

PortState ViewEntry::stateFor(Protocol protocol) const {
    if (kind == Kind::Port) {
        return record.protocol == protocol ? record.state : PortState::Available;
    }
    bool isHidden = protocol == Protocol::Tcp ? tcpHidden : udpHidden;
    return isHidden ? PortState::VirtualHidden : PortState::Available;
}

PortState ViewEntry::displayState() const {
    if (kind == Kind::Port) {
        return record.state;
    }
    return (tcpHidden && udpHidden) ? PortState::VirtualHidden : PortState::Available;
}

ClassificationView ClassificationView::classify(const AggregationResult& aggregation,
                                                std::shared_ptr<const HiddenPortSet> hidden) {
    ClassificationView view;
    view.hidden_ = hidden ? std::move(hidden) : std::make_shared<const HiddenPortSet>();
    view.distinctUsedPorts_ = aggregation.distinctUsedPorts();

    const HiddenPortSet& hiddenSet = *view.hidden_;
    std::vector<uint16_t> usedPorts[2];

    for (const auto& item : aggregation.sequence()) {
        if (item.kind == AggregatedEntry::Kind::Gap) {
            appendGapSegments(item.gap, hiddenSet, view.entries_);
            continue;
        }

        PortRecord record = item.record;
        usedPorts[static_cast<size_t>(record.protocol)].push_back(record.port);

        if (hiddenSet.contains(record.port, record.protocol)) {
            record.state = PortState::Hidden;
            view.hiddenRecords_.push_back(record);
        } else {
            record.state = PortState::Used;
            ViewEntry entry;
            entry.kind = ViewEntry::Kind::Port;
            entry.record = record;
            view.entries_.push_back(std::move(entry));
        }
        view.records_.push_back(std::move(record));
    }

    for (auto protocol : kProtocols) {
        const auto& ports = usedPorts[static_cast<size_t>(protocol)];
        for (const auto& entry : hiddenSet.entries(protocol)) {
            appendUnusedParts(entry, ports, view.virtualHidden_);
        }
    }
    std::stable_sort(view.virtualHidden_.begin(), view.virtualHidden_.end(),
                     [](const HiddenPortEntry& a, const HiddenPortEntry& b) {
                         if (a.start != b.start)
                             return a.start < b.start;
                         return a.protocol < b.protocol;
                     });

    return view;
}

PortState ClassificationView::stateOf(uint16_t port, Protocol protocol) const {
    auto it = std::lower_bound(records_.begin(), records_.end(), std::make_pair(port, protocol),
                               [](const PortRecord& record, const std::pair<uint16_t, Protocol>& key) {
                                   return std::make_pair(record.port, record.protocol) < key;
                               });
    if (it != records_.end() && it->port == port && it->protocol == protocol) {
        return it->state;
    }
    return hidden_->contains(port, protocol) ? PortState::VirtualHidden : PortState::Available;
}

ProtocolSummary ClassificationView::summary(Protocol protocol) const {
    ProtocolSummary result;
    for (const auto& record : records_) {
        if (record.protocol != protocol) {
            continue;
        }
        if (record.state == PortState::Hidden) {
            ++result.hidden;
        } else {
            ++result.used;
        }
    }
    result.virtualHidden = hidden_->portCount(protocol) - result.hidden;
    result.available =
        static_cast<uint32_t>(kMaxPort) - result.used - result.hidden - result.virtualHidden;
    return result;
}

size_t ClassificationView::containerCount() const {
    std::set<std::string> names;
    for (const auto& record : records_) {
        if (record.source == PortSource::Container && record.containerName) {
            names.insert(*record.containerName);
        }
    }
    return names.size();
}

} // namespace dockports::core
