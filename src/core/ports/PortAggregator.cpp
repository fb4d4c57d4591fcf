#include "core/ports/PortAggregator.hpp"

#include <map>
#include <utility>

namespace dockports::core {

std::vector<AggregatedEntry> AggregationResult::sequence() const {
    std::vector<AggregatedEntry> entries;
    entries.reserve(used.size() + gaps.size());

    auto gapIt = gaps.begin();
    for (const auto& record : used) {
        while (gapIt != gaps.end() && gapIt->start < record.port) {
            AggregatedEntry entry;
            entry.kind = AggregatedEntry::Kind::Gap;
            entry.gap = *gapIt++;
            entries.push_back(std::move(entry));
        }
        AggregatedEntry entry;
        entry.kind = AggregatedEntry::Kind::Used;
        entry.record = record;
        entries.push_back(std::move(entry));
    }
    for (; gapIt != gaps.end(); ++gapIt) {
        AggregatedEntry entry;
        entry.kind = AggregatedEntry::Kind::Gap;
        entry.gap = *gapIt;
        entries.push_back(std::move(entry));
    }
    return entries;
}

size_t AggregationResult::distinctUsedPorts() const {
    size_t count = 0;
    int previous = 0;
    for (const auto& record : used) {
        if (record.port != previous) {
            ++count;
            previous = record.port;
        }
    }
    return count;
}

std::vector<PortRecord> PortAggregator::collectContainerCandidates(
    const std::vector<ContainerInfo>& containers) const {
    std::vector<PortRecord> candidates;

    for (const auto& container : containers) {
        for (const auto& binding : container.bindings) {
            if (binding.hostPort == 0) {
                continue;
            }
            PortRecord record;
            record.port = binding.hostPort;
            record.protocol = binding.protocol;
            record.state = PortState::Used;
            record.source = PortSource::Container;
            record.detectionMethod = DetectionMethod::ExplicitBinding;
            record.containerName = container.name;
            record.containerId = container.id;
            record.image = container.image;
            record.containerInternalPort =
                std::to_string(binding.containerPort) + "/" + protocolToString(binding.protocol);
            record.hostNetwork = container.isHostNetwork();
            candidates.push_back(std::move(record));
        }

        if (container.isHostNetwork()) {
            auto inferred = extractor_.extract(container);
            candidates.insert(candidates.end(), std::make_move_iterator(inferred.begin()),
                              std::make_move_iterator(inferred.end()));
        }
    }

    return candidates;
}

std::vector<PortRecord> PortAggregator::collectSystemCandidates(
    const std::vector<ListeningSocket>& sockets) {
    std::vector<PortRecord> candidates;
    candidates.reserve(sockets.size());

    for (const auto& socket : sockets) {
        if (socket.port == 0) {
            continue;
        }
        PortRecord record;
        record.port = socket.port;
        record.protocol = socket.protocol;
        record.state = PortState::Used;
        record.source = PortSource::System;
        record.detectionMethod = DetectionMethod::SystemScan;
        record.processName = socket.processName;
        candidates.push_back(std::move(record));
    }
    return candidates;
}

bool PortAggregator::outranks(const PortRecord& candidate, const PortRecord& current) {
    if (candidate.confidence() != current.confidence()) {
        return candidate.confidence() > current.confidence();
    }
    // Explicit operator intent outranks passive OS observation
    if (candidate.source != current.source) {
        return candidate.source == PortSource::Container;
    }
    // Stable choice regardless of source iteration order
    if (candidate.containerName != current.containerName) {
        return candidate.containerName < current.containerName;
    }
    return candidate.processName < current.processName;
}

std::vector<PortRecord> PortAggregator::mergeCandidates(const std::vector<PortRecord>& candidates) {
    std::map<std::pair<uint16_t, Protocol>, PortRecord> winners;

    for (const auto& candidate : candidates) {
        auto key = std::make_pair(candidate.port, candidate.protocol);
        auto it = winners.find(key);
        if (it == winners.end()) {
            winners.emplace(key, candidate);
            continue;
        }

        PortRecord& current = it->second;
        if (outranks(candidate, current)) {
            auto processName = current.processName;
            current = candidate;
            if (!current.processName) {
                current.processName = std::move(processName);
            }
        } else if (!current.processName && candidate.processName) {
            current.processName = candidate.processName;
        }
    }

    std::vector<PortRecord> merged;
    merged.reserve(winners.size());
    for (auto& [key, record] : winners) {
        record.state = PortState::Used;
        merged.push_back(std::move(record));
    }
    return merged;
}

std::vector<GapRange> PortAggregator::computeGaps(const std::vector<PortRecord>& sortedUsed) {
    std::vector<GapRange> gaps;
    if (sortedUsed.empty()) {
        return gaps;
    }

    uint16_t previous = sortedUsed.front().port;
    for (const auto& record : sortedUsed) {
        if (record.port > previous + 1) {
            gaps.push_back({static_cast<uint16_t>(previous + 1),
                            static_cast<uint16_t>(record.port - 1)});
        }
        if (record.port > previous) {
            previous = record.port;
        }
    }
    return gaps;
}

AggregationResult PortAggregator::aggregate(const std::vector<ContainerInfo>& containers,
                                            const std::vector<ListeningSocket>& sockets) const {
    auto candidates = collectContainerCandidates(containers);
    auto system = collectSystemCandidates(sockets);
    candidates.insert(candidates.end(), std::make_move_iterator(system.begin()),
                      std::make_move_iterator(system.end()));
    return aggregate(candidates);
}

AggregationResult PortAggregator::aggregate(const std::vector<PortRecord>& candidates) {
    AggregationResult result;
    result.used = mergeCandidates(candidates);
    result.gaps = computeGaps(result.used);
    return result;
}

} // namespace dockports::core
