#include "core/ports/HiddenPortSet.hpp"

#include <algorithm>
#include <iterator>

namespace dockports::core {

HiddenPortSet::HiddenPortSet(const std::vector<HiddenPortEntry>& entries) {
    for (const auto& entry : entries) {
        if (entry.start == 0 || entry.end < entry.start) {
            continue;
        }
        add(entry.protocol, entry.start, entry.end);
    }
}

uint32_t HiddenPortSet::add(Protocol protocol, uint16_t start, uint16_t end) {
    auto& ranges = rangesFor(protocol);
    uint32_t before = portCount(protocol);

    int first = start;
    int last = end;

    auto it = ranges.upper_bound(start);
    if (it != ranges.begin()) {
        auto prev = std::prev(it);
        if (prev->second + 1 >= first) {
            it = prev;
        }
    }

    // Swallow every range that overlaps or touches [first, last]
    while (it != ranges.end() && it->first <= last + 1) {
        first = std::min<int>(first, it->first);
        last = std::max<int>(last, it->second);
        it = ranges.erase(it);
    }
    ranges[static_cast<uint16_t>(first)] = static_cast<uint16_t>(last);

    return portCount(protocol) - before;
}

uint32_t HiddenPortSet::remove(Protocol protocol, uint16_t start, uint16_t end) {
    auto& ranges = rangesFor(protocol);
    uint32_t before = portCount(protocol);

    auto it = ranges.upper_bound(start);
    if (it != ranges.begin()) {
        auto prev = std::prev(it);
        if (prev->second >= start) {
            it = prev;
        }
    }

    while (it != ranges.end() && it->first <= end) {
        uint16_t rangeStart = it->first;
        uint16_t rangeEnd = it->second;
        it = ranges.erase(it);

        if (rangeStart < start) {
            ranges[rangeStart] = static_cast<uint16_t>(start - 1);
        }
        if (rangeEnd > end) {
            ranges[static_cast<uint16_t>(end + 1)] = rangeEnd;
        }
    }

    return before - portCount(protocol);
}

bool HiddenPortSet::contains(uint16_t port, Protocol protocol) const {
    const auto& ranges = rangesFor(protocol);
    auto it = ranges.upper_bound(port);
    if (it == ranges.begin()) {
        return false;
    }
    return std::prev(it)->second >= port;
}

std::vector<GapRange> HiddenPortSet::hiddenWithin(Protocol protocol, uint16_t start,
                                                  uint16_t end) const {
    std::vector<GapRange> result;
    const auto& ranges = rangesFor(protocol);

    auto it = ranges.upper_bound(start);
    if (it != ranges.begin()) {
        it = std::prev(it);
    }
    for (; it != ranges.end() && it->first <= end; ++it) {
        if (it->second < start) {
            continue;
        }
        result.push_back({std::max(it->first, start), std::min(it->second, end)});
    }
    return result;
}

std::vector<HiddenPortEntry> HiddenPortSet::entries() const {
    auto result = entries(Protocol::Tcp);
    auto udp = entries(Protocol::Udp);
    result.insert(result.end(), udp.begin(), udp.end());

    std::stable_sort(result.begin(), result.end(),
                     [](const HiddenPortEntry& a, const HiddenPortEntry& b) {
                         if (a.start != b.start)
                             return a.start < b.start;
                         return a.protocol < b.protocol;
                     });
    return result;
}

std::vector<HiddenPortEntry> HiddenPortSet::entries(Protocol protocol) const {
    std::vector<HiddenPortEntry> result;
    for (const auto& [start, end] : rangesFor(protocol)) {
        result.push_back({protocol, start, end});
    }
    return result;
}

uint32_t HiddenPortSet::portCount(Protocol protocol) const {
    uint32_t count = 0;
    for (const auto& [start, end] : rangesFor(protocol)) {
        count += static_cast<uint32_t>(end) - start + 1;
    }
    return count;
}

} // namespace dockports::core
