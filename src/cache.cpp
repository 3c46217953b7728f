#include "cache.hpp"
#include "address.hpp"
#include <stdexcept>

CacheLevel::CacheLevel(const CacheConfig& cfg) : cfg_(cfg) {
    validate_config(cfg_);
    num_sets_ = cfg_.num_sets();
    policy_ = make_policy(cfg_.repl, num_sets_, cfg_.assoc);
    reset();
}

void CacheLevel::reset() {
    stats_ = {};
    policy_->reset();
    sets_.assign(num_sets_, std::vector<Line>(cfg_.assoc));
}

int CacheLevel::find_way(std::size_t set_idx, uint64_t tag) const {
    const auto& set = sets_[set_idx];
    for (std::size_t w = 0; w < set.size(); ++w) {
        if (set[w].valid && set[w].tag == tag) return static_cast<int>(w);
    }
    return -1;
}

int CacheLevel::find_free(std::size_t set_idx) const {
    const auto& set = sets_[set_idx];
    for (std::size_t w = 0; w < set.size(); ++w)
        if (!set[w].valid) return static_cast<int>(w);
    return -1;
}

AccessResult CacheLevel::probe(AccessType op, uint64_t byte_addr) {
    if (op == AccessType::Read) stats_.reads++;
    else stats_.writes++;

    auto d = decode(byte_addr, cfg_);

    int way = find_way(d.set_idx, d.tag);
    if (way >= 0) {
        auto& line = sets_[d.set_idx][static_cast<std::size_t>(way)];
        policy_->touch(d.set_idx, static_cast<std::size_t>(way));

        if (op == AccessType::Read) stats_.read_hits++;
        else {
            stats_.write_hits++;
            line.dirty = true;
        }
        return {.hit = true};
    }

    // miss
    if (op == AccessType::Read) stats_.read_misses++;
    else stats_.write_misses++;

    return {.hit = false};
}

bool CacheLevel::peek_victim(uint64_t byte_addr, uint64_t& victim_addr) const {
    auto d = decode(byte_addr, cfg_);
    if (find_way(d.set_idx, d.tag) >= 0 || find_free(d.set_idx) >= 0) return false;

    std::size_t way = policy_->choose_victim(d.set_idx);
    victim_addr = block_base(sets_[d.set_idx][way].tag, d.set_idx, cfg_);
    return true;
}

AccessResult CacheLevel::make_room(uint64_t byte_addr) {
    auto d = decode(byte_addr, cfg_);
    if (find_way(d.set_idx, d.tag) >= 0 || find_free(d.set_idx) >= 0) return {};

    std::size_t way = policy_->choose_victim(d.set_idx);
    auto& line = sets_[d.set_idx][way];

    AccessResult res;
    res.eviction = true;
    res.evicted_addr = block_base(line.tag, d.set_idx, cfg_);
    if (line.dirty) {
        res.eviction_dirty = true;
        stats_.writebacks++;
    }
    stats_.evictions++;

    line = {};
    policy_->remove(d.set_idx, way);
    return res;
}

void CacheLevel::install(uint64_t byte_addr, bool dirty) {
    auto d = decode(byte_addr, cfg_);
    if (find_way(d.set_idx, d.tag) >= 0)
        throw std::logic_error(cfg_.name + ": install of a block that is already resident");

    int way = find_free(d.set_idx);
    if (way < 0)
        throw std::logic_error(cfg_.name + ": install into a full set");

    auto w = static_cast<std::size_t>(way);
    sets_[d.set_idx][w] = {.valid = true, .dirty = dirty, .tag = d.tag};
    policy_->insert(d.set_idx, w);
}

AccessResult CacheLevel::fill(uint64_t byte_addr, bool make_dirty) {
    auto d = decode(byte_addr, cfg_);

    // If already present, just pick up the dirty bit
    int way = find_way(d.set_idx, d.tag);
    if (way >= 0) {
        if (make_dirty) sets_[d.set_idx][static_cast<std::size_t>(way)].dirty = true;
        return {.hit = true};
    }

    AccessResult res = make_room(byte_addr);
    install(byte_addr, make_dirty);
    return res;
}

AccessResult CacheLevel::access(AccessType op, uint64_t byte_addr) {
    AccessResult res = probe(op, byte_addr);
    if (res.hit) return res;
    return fill(byte_addr, op == AccessType::Write);
}

void CacheLevel::writeback_block(uint64_t byte_addr) {
    auto d = decode(byte_addr, cfg_);
    int way = find_way(d.set_idx, d.tag);
    if (way < 0)
        throw std::logic_error(cfg_.name + ": writeback for non-resident block " + std::to_string(byte_addr));

    sets_[d.set_idx][static_cast<std::size_t>(way)].dirty = true;
}

Invalidation CacheLevel::invalidate(uint64_t byte_addr) {
    auto d = decode(byte_addr, cfg_);
    int way = find_way(d.set_idx, d.tag);
    if (way < 0) return {};

    auto w = static_cast<std::size_t>(way);
    Invalidation inv{.present = true, .dirty = sets_[d.set_idx][w].dirty};
    if (inv.dirty) stats_.writebacks++;
    stats_.invalidations++;

    sets_[d.set_idx][w] = {};
    policy_->remove(d.set_idx, w);
    return inv;
}

bool CacheLevel::contains(uint64_t byte_addr) const {
    auto d = decode(byte_addr, cfg_);
    return find_way(d.set_idx, d.tag) >= 0;
}

bool CacheLevel::is_dirty(uint64_t byte_addr) const {
    auto d = decode(byte_addr, cfg_);
    int way = find_way(d.set_idx, d.tag);
    return way >= 0 && sets_[d.set_idx][static_cast<std::size_t>(way)].dirty;
}

std::size_t CacheLevel::free_ways(uint64_t byte_addr) const {
    auto d = decode(byte_addr, cfg_);
    std::size_t n = 0;
    for (const auto& line : sets_[d.set_idx])
        if (!line.valid) ++n;
    return n;
}

std::vector<uint64_t> CacheLevel::resident_blocks() const {
    std::vector<uint64_t> blocks;
    for (std::size_t s = 0; s < num_sets_; ++s)
        for (const auto& line : sets_[s])
            if (line.valid) blocks.push_back(block_base(line.tag, s, cfg_));
    return blocks;
}
