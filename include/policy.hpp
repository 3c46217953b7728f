#pragma once
#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>
#include "config.hpp"

// Ordering ledger for every set of one cache level. Each (set, way) holds a
// stamp from a level-wide counter; 0 means the way holds no block.
// The concrete policy is chosen once, when the level is built.
class EvictionPolicy {
public:
    EvictionPolicy(std::size_t num_sets, std::size_t assoc);
    virtual ~EvictionPolicy() = default;

    virtual ReplacementPolicy kind() const = 0;

    // Demand hit on a resident line.
    virtual void touch(std::size_t set_idx, std::size_t way) = 0;

    // A block was just placed in `way`. Counts as an access for every policy.
    void insert(std::size_t set_idx, std::size_t way);

    // The line in `way` was evicted or invalidated.
    void remove(std::size_t set_idx, std::size_t way);

    // Only meaningful for a full set; throws std::logic_error on an empty one.
    virtual std::size_t choose_victim(std::size_t set_idx) const = 0;

    void reset();

protected:
    uint64_t& stamp(std::size_t set_idx, std::size_t way) { return stamps_[set_idx * assoc_ + way]; }
    void restamp(std::size_t set_idx, std::size_t way) { stamp(set_idx, way) = ++clock_; }

    std::size_t oldest(std::size_t set_idx) const;
    std::size_t newest(std::size_t set_idx) const;

private:
    std::size_t assoc_;
    uint64_t clock_ = 0;
    std::vector<uint64_t> stamps_;
};

// Evicts the line resident longest; hits do not reorder.
class FifoPolicy final : public EvictionPolicy {
public:
    using EvictionPolicy::EvictionPolicy;
    ReplacementPolicy kind() const override { return ReplacementPolicy::FIFO; }
    void touch(std::size_t, std::size_t) override {}
    std::size_t choose_victim(std::size_t set_idx) const override { return oldest(set_idx); }
};

class LruPolicy final : public EvictionPolicy {
public:
    using EvictionPolicy::EvictionPolicy;
    ReplacementPolicy kind() const override { return ReplacementPolicy::LRU; }
    void touch(std::size_t set_idx, std::size_t way) override { restamp(set_idx, way); }
    std::size_t choose_victim(std::size_t set_idx) const override { return oldest(set_idx); }
};

// Same recency ledger as LRU, opposite end.
class MruPolicy final : public EvictionPolicy {
public:
    using EvictionPolicy::EvictionPolicy;
    ReplacementPolicy kind() const override { return ReplacementPolicy::MRU; }
    void touch(std::size_t set_idx, std::size_t way) override { restamp(set_idx, way); }
    std::size_t choose_victim(std::size_t set_idx) const override { return newest(set_idx); }
};

std::unique_ptr<EvictionPolicy> make_policy(ReplacementPolicy p, std::size_t num_sets, std::size_t assoc);
