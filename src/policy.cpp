#include "policy.hpp"
#include <algorithm>
#include <stdexcept>

EvictionPolicy::EvictionPolicy(std::size_t num_sets, std::size_t assoc)
    : assoc_(assoc), stamps_(num_sets * assoc, 0) {}

void EvictionPolicy::insert(std::size_t set_idx, std::size_t way) {
    restamp(set_idx, way);
}

void EvictionPolicy::remove(std::size_t set_idx, std::size_t way) {
    stamp(set_idx, way) = 0;
}

void EvictionPolicy::reset() {
    clock_ = 0;
    std::fill(stamps_.begin(), stamps_.end(), 0);
}

std::size_t EvictionPolicy::oldest(std::size_t set_idx) const {
    const uint64_t* s = &stamps_[set_idx * assoc_];
    std::size_t victim = assoc_;
    for (std::size_t w = 0; w < assoc_; ++w) {
        if (s[w] == 0) continue;
        if (victim == assoc_ || s[w] < s[victim]) victim = w;
    }
    if (victim == assoc_) throw std::logic_error("choose_victim on a set with no resident lines");
    return victim;
}

std::size_t EvictionPolicy::newest(std::size_t set_idx) const {
    const uint64_t* s = &stamps_[set_idx * assoc_];
    std::size_t victim = assoc_;
    for (std::size_t w = 0; w < assoc_; ++w) {
        if (s[w] == 0) continue;
        if (victim == assoc_ || s[w] > s[victim]) victim = w;
    }
    if (victim == assoc_) throw std::logic_error("choose_victim on a set with no resident lines");
    return victim;
}

std::unique_ptr<EvictionPolicy> make_policy(ReplacementPolicy p, std::size_t num_sets, std::size_t assoc) {
    switch (p) {
        case ReplacementPolicy::FIFO: return std::make_unique<FifoPolicy>(num_sets, assoc);
        case ReplacementPolicy::LRU:  return std::make_unique<LruPolicy>(num_sets, assoc);
        case ReplacementPolicy::MRU:  return std::make_unique<MruPolicy>(num_sets, assoc);
    }
    throw std::invalid_argument("unknown replacement policy");
}
