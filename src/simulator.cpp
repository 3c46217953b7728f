#include "simulator.hpp"

Simulator::Simulator(const std::vector<CacheConfig>& levels) : h_(levels) {}

void Simulator::reset() {
    h_.reset();
    stats_ = {};
    log_.clear();
}

std::vector<EventRecord> Simulator::step(const TraceOp& t) {
    stats_.accesses++;
    if (t.op == AccessType::Read) stats_.reads++;
    else stats_.writes++;

    auto events = h_.access(t.op, t.addr);
    log_.insert(log_.end(), events.begin(), events.end());
    return events;
}

void Simulator::run(const std::vector<TraceOp>& trace) {
    for (const auto& t : trace) step(t);
}
