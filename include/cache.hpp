#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <cstddef>
#include <memory>
#include "config.hpp"
#include "policy.hpp"

enum class AccessType { Read, Write };

struct CacheStats {
    uint64_t reads = 0, writes = 0;
    uint64_t read_hits = 0, read_misses = 0;
    uint64_t write_hits = 0, write_misses = 0;
    uint64_t evictions = 0;
    uint64_t writebacks = 0;    // dirty lines handed to the next level
    uint64_t invalidations = 0; // lines dropped because the level below evicted them

    uint64_t hits() const { return read_hits + write_hits; }
    uint64_t misses() const { return read_misses + write_misses; }
    double hit_rate() const {
        uint64_t tot = hits() + misses();
        return tot ? (double)hits() / (double)tot : 0.0;
    }
};

struct AccessResult {
    bool hit = false;
    bool eviction = false;
    bool eviction_dirty = false;
    uint64_t evicted_addr = 0; // first byte of the victim block
};

struct Invalidation {
    bool present = false;
    bool dirty = false;
};

// One write-back, write-allocate cache level. It never talks to other levels;
// CacheHierarchy decides what moves between them.
class CacheLevel {
public:
    explicit CacheLevel(const CacheConfig& cfg);

    void reset();

    // Full single-level access: lookup, and on a miss allocate the block
    // (dirty iff write), evicting a victim if the set is full.
    AccessResult access(AccessType op, uint64_t byte_addr);

    // Lookup only. Counts the hit or miss; a hit updates recency and, for a
    // write, marks the line dirty. A miss leaves the set untouched.
    AccessResult probe(AccessType op, uint64_t byte_addr);

    // Victim that make_room() would evict for this address, if the set is full
    // and the block is not already resident.
    bool peek_victim(uint64_t byte_addr, uint64_t& victim_addr) const;

    // Evicts a victim if the block's set has no free way. No-op otherwise.
    AccessResult make_room(uint64_t byte_addr);

    // Places a block into a free way of its set. Throws std::logic_error if none.
    void install(uint64_t byte_addr, bool dirty);

    // make_room() + install(); a resident block only picks up the dirty bit.
    AccessResult fill(uint64_t byte_addr, bool make_dirty);

    // Dirty block arriving from the level above. Not a demand access: no
    // hit/miss counting and no recency update. The block must be resident.
    void writeback_block(uint64_t byte_addr);

    // Drops the block if resident (back-invalidation). Dirty data is reported
    // in the result and counted as a writeback of this level.
    Invalidation invalidate(uint64_t byte_addr);

    bool contains(uint64_t byte_addr) const;
    bool is_dirty(uint64_t byte_addr) const;
    std::size_t free_ways(uint64_t byte_addr) const;
    std::vector<uint64_t> resident_blocks() const;

    const std::string& name() const { return cfg_.name; }
    const CacheConfig& cfg() const { return cfg_; }
    const CacheStats& stats() const { return stats_; }

private:
    struct Line {
        bool valid = false;
        bool dirty = false;
        uint64_t tag = 0;
    };

    CacheConfig cfg_;
    CacheStats stats_;
    std::unique_ptr<EvictionPolicy> policy_;

    std::size_t num_sets_ = 0;
    std::vector<std::vector<Line>> sets_;

private:
    int find_way(std::size_t set_idx, uint64_t tag) const;
    int find_free(std::size_t set_idx) const;
};
