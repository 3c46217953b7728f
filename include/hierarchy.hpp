#pragma once
#include <optional>
#include <string>
#include <vector>
#include "cache.hpp"

// Backing-store label in event records.
inline const std::string kMemoryName = "MEM";

enum class EventType {
    Read,       // demand read, or a block fetch from the level below
    Write,      // demand write
    Writeback,  // dirty block arriving from the level above
    Invalidate, // back-invalidation forced by an eviction below
};

// One line of the per-access log. Built once, never mutated.
struct EventRecord {
    std::string level;
    EventType type = EventType::Read;
    bool hit = false;
    uint64_t addr = 0;
    bool eviction = false;
    uint64_t evicted_addr = 0;
    bool writeback = false; // evicted/invalidated line was dirty
};

struct HierarchyStats {
    uint64_t mem_reads = 0;
    uint64_t mem_writes = 0;
};

// L1, optionally backed by an inclusive L2, backed by an infinite memory.
// Every block valid in L1 is also valid in L2.
class CacheHierarchy {
public:
    explicit CacheHierarchy(const std::vector<CacheConfig>& levels);

    void reset();

    // Demand access from the CPU. Returns the events in the order they happen,
    // starting with the L1 lookup.
    std::vector<EventRecord> access(AccessType op, uint64_t addr);

    bool has_l2() const { return l2_.has_value(); }
    std::size_t depth() const { return has_l2() ? 2 : 1; }

    const CacheLevel& L1() const { return l1_; }
    const CacheLevel& L2() const;
    const CacheLevel& level(std::size_t i) const { return i == 0 ? l1_ : L2(); }
    const HierarchyStats& hstats() const { return hstats_; }

    bool inclusive() const;

private:
    CacheLevel l1_;
    std::optional<CacheLevel> l2_;
    HierarchyStats hstats_;

private:
    static CacheLevel first_level(const std::vector<CacheConfig>& levels);

    void write_back_below_l1(uint64_t block_addr, std::vector<EventRecord>& out);
    void memory_write(uint64_t block_addr, std::vector<EventRecord>& out);
    void memory_read(uint64_t addr, std::vector<EventRecord>& out);
    void fetch_into_l2(uint64_t addr, std::vector<EventRecord>& out);
};
