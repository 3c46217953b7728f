#pragma once
#include <cstdint>
#include <cstddef>
#include "config.hpp"

struct DecodedAddress {
    uint64_t tag = 0;
    std::size_t set_idx = 0;
    uint64_t offset = 0;
};

// offset = addr % block, set = (addr / block) % sets, tag = addr / block / sets.
// Any address is accepted; num_sets need not be a power of two.
DecodedAddress decode(uint64_t byte_addr, const CacheConfig& cfg);

// First byte of the block identified by (tag, set_idx).
uint64_t block_base(uint64_t tag, std::size_t set_idx, const CacheConfig& cfg);

inline uint64_t block_align(uint64_t byte_addr, const CacheConfig& cfg) {
    return byte_addr - byte_addr % cfg.block_bytes;
}
