#include "hierarchy.hpp"
#include <stdexcept>

CacheLevel CacheHierarchy::first_level(const std::vector<CacheConfig>& levels) {
    validate_hierarchy(levels);
    return CacheLevel(levels[0]);
}

CacheHierarchy::CacheHierarchy(const std::vector<CacheConfig>& levels)
    : l1_(first_level(levels)) {
    if (levels.size() == 2) l2_.emplace(levels[1]);
}

void CacheHierarchy::reset() {
    l1_.reset();
    if (l2_) l2_->reset();
    hstats_ = {};
}

const CacheLevel& CacheHierarchy::L2() const {
    if (!l2_) throw std::logic_error("hierarchy has no L2");
    return *l2_;
}

bool CacheHierarchy::inclusive() const {
    if (!l2_) return true;
    for (uint64_t block : l1_.resident_blocks())
        if (!l2_->contains(block)) return false;
    return true;
}

void CacheHierarchy::memory_read(uint64_t addr, std::vector<EventRecord>& out) {
    hstats_.mem_reads++;
    out.push_back({.level = kMemoryName, .type = EventType::Read, .hit = true, .addr = addr});
}

void CacheHierarchy::memory_write(uint64_t block_addr, std::vector<EventRecord>& out) {
    hstats_.mem_writes++;
    out.push_back({.level = kMemoryName, .type = EventType::Writeback, .hit = true, .addr = block_addr});
}

void CacheHierarchy::write_back_below_l1(uint64_t block_addr, std::vector<EventRecord>& out) {
    if (!l2_) {
        memory_write(block_addr, out);
        return;
    }
    l2_->writeback_block(block_addr);
    out.push_back({.level = l2_->name(), .type = EventType::Writeback, .hit = true, .addr = block_addr});
}

void CacheHierarchy::fetch_into_l2(uint64_t addr, std::vector<EventRecord>& out) {
    // L2 only ever sees block fetches; the demand write stays in L1
    auto r2 = l2_->probe(AccessType::Read, addr);
    if (r2.hit) {
        out.push_back({.level = l2_->name(), .type = EventType::Read, .hit = true, .addr = addr});
        return;
    }

    // Back-invalidate L2's victim in L1 before L2 evicts it, so dirty L1 data
    // lands in L2 and is carried to memory by the L2 eviction.
    std::vector<EventRecord> inval;
    uint64_t victim = 0;
    if (l2_->peek_victim(addr, victim)) {
        auto inv = l1_.invalidate(victim);
        if (inv.present) {
            inval.push_back({.level = l1_.name(), .type = EventType::Invalidate, .hit = true,
                             .addr = victim, .writeback = inv.dirty});
            if (inv.dirty) {
                l2_->writeback_block(victim);
                inval.push_back({.level = l2_->name(), .type = EventType::Writeback, .hit = true, .addr = victim});
            }
        }
    }

    auto ev2 = l2_->make_room(addr);
    out.push_back({.level = l2_->name(), .type = EventType::Read, .hit = false, .addr = addr,
                   .eviction = ev2.eviction, .evicted_addr = ev2.evicted_addr,
                   .writeback = ev2.eviction_dirty});
    out.insert(out.end(), inval.begin(), inval.end());

    if (ev2.eviction_dirty) memory_write(ev2.evicted_addr, out);
    memory_read(addr, out);

    l2_->install(addr, /*dirty=*/false);
}

std::vector<EventRecord> CacheHierarchy::access(AccessType op, uint64_t addr) {
    std::vector<EventRecord> events;
    EventType type = (op == AccessType::Read) ? EventType::Read : EventType::Write;

    // -----------------------------
    // 1) L1 access
    // -----------------------------
    auto r1 = l1_.probe(op, addr);
    if (r1.hit) {
        events.push_back({.level = l1_.name(), .type = type, .hit = true, .addr = addr});
        return events;
    }

    // L1 frees a way before the fetch goes down; its dirty victim is still
    // resident in L2 at this point.
    auto ev1 = l1_.make_room(addr);
    events.push_back({.level = l1_.name(), .type = type, .hit = false, .addr = addr,
                      .eviction = ev1.eviction, .evicted_addr = ev1.evicted_addr,
                      .writeback = ev1.eviction_dirty});
    if (ev1.eviction_dirty) write_back_below_l1(ev1.evicted_addr, events);

    // -----------------------------
    // 2) L2 / memory fetch
    // -----------------------------
    if (l2_) fetch_into_l2(addr, events);
    else memory_read(addr, events);

    // -----------------------------
    // 3) Fill L1 (write-allocate)
    // -----------------------------
    l1_.install(addr, op == AccessType::Write);
    return events;
}
