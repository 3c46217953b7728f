#include "address.hpp"

DecodedAddress decode(uint64_t byte_addr, const CacheConfig& cfg) {
    const uint64_t block = cfg.block_bytes;
    const uint64_t sets = cfg.num_sets();

    uint64_t b = byte_addr / block;
    return {
        .tag = b / sets,
        .set_idx = static_cast<std::size_t>(b % sets),
        .offset = byte_addr % block,
    };
}

uint64_t block_base(uint64_t tag, std::size_t set_idx, const CacheConfig& cfg) {
    // reconstruct block number = tag * sets + set_idx
    uint64_t b = tag * static_cast<uint64_t>(cfg.num_sets()) + static_cast<uint64_t>(set_idx);
    return b * static_cast<uint64_t>(cfg.block_bytes);
}
