/**
 * @file TimeCounters.cpp
 * @brief Nested clock and execution counter bookkeeping
 */

#include <chronos/sched/TimeCounters.hpp>

#include <algorithm>
#include <utility>

namespace chronos {

TimeCounters::TimeCounters(std::vector<NodeId> nodes) : nodes_(std::move(nodes)) {
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        index_.emplace(nodes_[i], i);
    }
    for (auto &row : totals_) {
        row.assign(nodes_.size(), 0);
    }
    useable_.assign(nodes_.size() * nodes_.size(), 0);
}

void TimeCounters::Increment(TimeScale scale) {
    for (auto &row : times_) {
        ++row[Index(scale)];
    }
}

void TimeCounters::Reset(TimeScale scale) { times_[Index(scale)].fill(0); }

void TimeCounters::RecordExecution(const NodeId &node) {
    const std::size_t self = IndexOf(node);
    const std::size_t n = nodes_.size();

    for (auto &row : totals_) {
        ++row[self];
    }

    // Consume credit held toward this node
    for (std::size_t producer = 0; producer < n; ++producer) {
        useable_[Slot(producer, self)] = 0;
    }

    // Grant credit to every consumer, self included
    for (std::size_t consumer = 0; consumer < n; ++consumer) {
        ++useable_[Slot(self, consumer)];
    }
}

void TimeCounters::ResetTotals(TimeScale scale) {
    auto &row = totals_[Index(scale)];
    std::fill(row.begin(), row.end(), 0);
}

void TimeCounters::ResetUseable() { std::fill(useable_.begin(), useable_.end(), 0); }

std::size_t TimeCounters::IndexOf(const NodeId &node) const {
    auto it = index_.find(node);
    if (it == index_.end()) {
        throw SchedulerError::UnknownNode(node, "no execution counters for this node");
    }
    return it->second;
}

} // namespace chronos
