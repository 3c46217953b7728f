#pragma once
#include <cstdint>
#include <vector>
#include "hierarchy.hpp"
#include "trace.hpp"

struct RunStats {
    uint64_t accesses = 0;
    uint64_t reads = 0;
    uint64_t writes = 0;
};

// Feeds a trace through a CacheHierarchy in order, one access at a time,
// and keeps the full event log.
class Simulator {
public:
    explicit Simulator(const std::vector<CacheConfig>& levels);

    void reset();

    // Returns the events produced by this access (also appended to log()).
    std::vector<EventRecord> step(const TraceOp& t);
    void run(const std::vector<TraceOp>& trace);

    const std::vector<EventRecord>& log() const { return log_; }
    const RunStats& stats() const { return stats_; }
    const CacheHierarchy& hierarchy() const { return h_; }

private:
    CacheHierarchy h_;
    RunStats stats_;
    std::vector<EventRecord> log_;
};
