#include <gtest/gtest.h>
#include <map>
#include <random>
#include <stdexcept>
#include "hierarchy.hpp"
#include "util.hpp"

namespace {

CacheConfig level(const std::string& name, std::size_t size, std::size_t block, std::size_t assoc,
                  ReplacementPolicy repl) {
    return CacheConfig{.name = name, .size_bytes = size, .block_bytes = block, .assoc = assoc, .repl = repl};
}

// "64 8 2 LRU WB L1" / "128 8 4 FIFO WB L2": 4 sets each, addresses 32 apart share a set.
std::vector<CacheConfig> example_levels() {
    return {level("L1", 64, 8, 2, ReplacementPolicy::LRU),
            level("L2", 128, 8, 4, ReplacementPolicy::FIFO)};
}

void expect_event(const EventRecord& ev, const std::string& lvl, EventType type, bool hit, uint64_t addr) {
    EXPECT_EQ(ev.level, lvl);
    EXPECT_EQ(ev.type, type);
    EXPECT_EQ(ev.hit, hit);
    EXPECT_EQ(ev.addr, addr);
}

} // namespace

TEST(CacheHierarchy, ColdReadThenRepeat) {
    CacheHierarchy h(example_levels());

    auto ev = h.access(AccessType::Read, 0x0);
    ASSERT_EQ(ev.size(), 3u);
    expect_event(ev[0], "L1", EventType::Read, false, 0x0);
    expect_event(ev[1], "L2", EventType::Read, false, 0x0);
    expect_event(ev[2], kMemoryName, EventType::Read, true, 0x0);
    EXPECT_FALSE(ev[0].eviction);
    EXPECT_FALSE(ev[1].eviction);

    ev = h.access(AccessType::Read, 0x0);
    ASSERT_EQ(ev.size(), 1u);
    expect_event(ev[0], "L1", EventType::Read, true, 0x0);

    EXPECT_EQ(h.L1().stats().read_hits, 1u);
    EXPECT_EQ(h.L2().stats().reads, 1u);
    EXPECT_EQ(h.hstats().mem_reads, 1u);
}

TEST(CacheHierarchy, L2HitFillsL1) {
    CacheHierarchy h(example_levels());
    h.access(AccessType::Read, 0x0);
    h.access(AccessType::Read, 0x20);
    h.access(AccessType::Read, 0x40); // L1 evicts 0x0, L2 keeps it

    ASSERT_FALSE(h.L1().contains(0x0));
    auto ev = h.access(AccessType::Read, 0x0);
    ASSERT_EQ(ev.size(), 2u);
    expect_event(ev[0], "L1", EventType::Read, false, 0x0);
    EXPECT_TRUE(ev[0].eviction);
    EXPECT_EQ(ev[0].evicted_addr, 0x20u);
    expect_event(ev[1], "L2", EventType::Read, true, 0x0);
    EXPECT_TRUE(h.L1().contains(0x0));
    EXPECT_EQ(h.hstats().mem_reads, 3u);
}

TEST(CacheHierarchy, WriteStaysDirtyInL1Only) {
    CacheHierarchy h(example_levels());
    auto ev = h.access(AccessType::Write, 0x8);
    ASSERT_EQ(ev.size(), 3u);
    EXPECT_EQ(ev[0].type, EventType::Write);
    EXPECT_EQ(ev[1].type, EventType::Read); // block fetch

    EXPECT_TRUE(h.L1().is_dirty(0x8));
    EXPECT_TRUE(h.L2().contains(0x8));
    EXPECT_FALSE(h.L2().is_dirty(0x8));
    EXPECT_EQ(h.L1().stats().write_misses, 1u);
    EXPECT_EQ(h.L2().stats().writes, 0u);
    EXPECT_EQ(h.L2().stats().read_misses, 1u);
}

TEST(CacheHierarchy, DirtyL1VictimIsWrittenBackToL2) {
    CacheHierarchy h(example_levels());
    h.access(AccessType::Write, 0x0);
    h.access(AccessType::Read, 0x20);

    auto ev = h.access(AccessType::Read, 0x40);
    ASSERT_EQ(ev.size(), 4u);
    expect_event(ev[0], "L1", EventType::Read, false, 0x40);
    EXPECT_TRUE(ev[0].eviction);
    EXPECT_TRUE(ev[0].writeback);
    EXPECT_EQ(ev[0].evicted_addr, 0x0u);
    expect_event(ev[1], "L2", EventType::Writeback, true, 0x0);
    expect_event(ev[2], "L2", EventType::Read, false, 0x40);
    expect_event(ev[3], kMemoryName, EventType::Read, true, 0x40);

    EXPECT_TRUE(h.L2().is_dirty(0x0));
    EXPECT_FALSE(h.L1().contains(0x0));
    EXPECT_EQ(h.L1().stats().writebacks, 1u);
    EXPECT_EQ(h.hstats().mem_writes, 0u);
}

TEST(CacheHierarchy, L2EvictionBackInvalidatesL1) {
    // L1: 2 sets x 2 ways LRU, L2: 2 sets x 4 ways FIFO. Even blocks share set 0.
    CacheHierarchy h({level("L1", 32, 8, 2, ReplacementPolicy::LRU),
                      level("L2", 64, 8, 4, ReplacementPolicy::FIFO)});

    h.access(AccessType::Write, 0x0);
    h.access(AccessType::Read, 0x10);
    h.access(AccessType::Read, 0x0);
    h.access(AccessType::Read, 0x20);
    h.access(AccessType::Read, 0x0);
    h.access(AccessType::Read, 0x30);
    h.access(AccessType::Read, 0x0);
    ASSERT_TRUE(h.L1().is_dirty(0x0));

    // L2 set 0 is full and 0x0 is its oldest block, while L1 still holds it dirty
    auto ev = h.access(AccessType::Read, 0x40);
    ASSERT_EQ(ev.size(), 6u);
    expect_event(ev[0], "L1", EventType::Read, false, 0x40);
    EXPECT_TRUE(ev[0].eviction);
    EXPECT_EQ(ev[0].evicted_addr, 0x30u);
    EXPECT_FALSE(ev[0].writeback);

    expect_event(ev[1], "L2", EventType::Read, false, 0x40);
    EXPECT_TRUE(ev[1].eviction);
    EXPECT_EQ(ev[1].evicted_addr, 0x0u);
    EXPECT_TRUE(ev[1].writeback);

    expect_event(ev[2], "L1", EventType::Invalidate, true, 0x0);
    EXPECT_TRUE(ev[2].writeback);
    expect_event(ev[3], "L2", EventType::Writeback, true, 0x0);
    expect_event(ev[4], kMemoryName, EventType::Writeback, true, 0x0);
    expect_event(ev[5], kMemoryName, EventType::Read, true, 0x40);

    EXPECT_FALSE(h.L1().contains(0x0));
    EXPECT_FALSE(h.L2().contains(0x0));
    EXPECT_TRUE(h.L1().contains(0x40));
    EXPECT_TRUE(h.inclusive());

    const auto& s1 = h.L1().stats();
    EXPECT_EQ(s1.evictions, 3u);
    EXPECT_EQ(s1.invalidations, 1u);
    EXPECT_EQ(s1.writebacks, 1u);
    EXPECT_EQ(h.L2().stats().evictions, 1u);
    EXPECT_EQ(h.L2().stats().writebacks, 1u);
    EXPECT_EQ(h.hstats().mem_writes, 1u);
    EXPECT_EQ(h.hstats().mem_reads, 5u);
}

TEST(CacheHierarchy, SingleLevelFallsBackToMemory) {
    CacheHierarchy h({level("L1", 16, 4, 2, ReplacementPolicy::FIFO)});
    EXPECT_FALSE(h.has_l2());
    EXPECT_EQ(h.depth(), 1u);
    EXPECT_THROW(h.L2(), std::logic_error);

    h.access(AccessType::Write, 0x0);
    h.access(AccessType::Read, 0x8);
    auto ev = h.access(AccessType::Read, 0x10);
    ASSERT_EQ(ev.size(), 3u);
    expect_event(ev[0], "L1", EventType::Read, false, 0x10);
    EXPECT_TRUE(ev[0].writeback);
    expect_event(ev[1], kMemoryName, EventType::Writeback, true, 0x0);
    expect_event(ev[2], kMemoryName, EventType::Read, true, 0x10);
    EXPECT_EQ(h.hstats().mem_reads, 3u);
    EXPECT_EQ(h.hstats().mem_writes, 1u);
}

TEST(CacheHierarchy, RejectsBadLevelLists) {
    std::vector<CacheConfig> none;
    EXPECT_THROW(CacheHierarchy{none}, ConfigError);

    auto three = example_levels();
    three.push_back(level("L3", 256, 8, 4, ReplacementPolicy::LRU));
    EXPECT_THROW(CacheHierarchy{three}, ConfigError);

    auto mixed = example_levels();
    mixed[1].block_bytes = 16;
    EXPECT_THROW(CacheHierarchy{mixed}, ConfigError);

    auto dup = example_levels();
    dup[1].name = "L1";
    EXPECT_THROW(CacheHierarchy{dup}, ConfigError);
}

TEST(CacheHierarchy, ResetGoesCold) {
    CacheHierarchy h(example_levels());
    h.access(AccessType::Write, 0x0);
    h.reset();
    EXPECT_FALSE(h.L1().contains(0x0));
    EXPECT_FALSE(h.L2().contains(0x0));
    EXPECT_EQ(h.hstats().mem_reads, 0u);
    EXPECT_EQ(h.access(AccessType::Read, 0x0).size(), 3u);
}

class HierarchyProperties
    : public ::testing::TestWithParam<std::pair<ReplacementPolicy, ReplacementPolicy>> {};

TEST_P(HierarchyProperties, HoldAcrossRandomTrace) {
    auto [p1, p2] = GetParam();
    CacheHierarchy h({level("L1", 64, 8, 2, p1), level("L2", 128, 8, 4, p2)});

    std::mt19937 rng(1234);
    std::uniform_int_distribution<uint64_t> addr_dist(0, 1023);
    std::bernoulli_distribution is_write(0.3);

    uint64_t reads = 0, writes = 0;
    for (int i = 0; i < 3000; ++i) {
        uint64_t addr = addr_dist(rng);
        AccessType op = is_write(rng) ? AccessType::Write : AccessType::Read;
        (op == AccessType::Read ? reads : writes)++;

        // snapshot of L1 before the access
        std::map<uint64_t, bool> l1_dirty;
        for (uint64_t b : h.L1().resident_blocks()) l1_dirty[b] = h.L1().is_dirty(b);
        bool l1_had_block = h.L1().contains(addr);
        std::size_t l1_free = h.L1().free_ways(addr);

        auto ev = h.access(op, addr);
        ASSERT_FALSE(ev.empty());
        ASSERT_TRUE(h.inclusive()) << "step " << i;

        const auto& first = ev[0];
        EXPECT_EQ(first.level, "L1");
        EXPECT_EQ(first.hit, l1_had_block);
        if (first.eviction) {
            EXPECT_EQ(l1_free, 0u) << "step " << i;
            ASSERT_TRUE(l1_dirty.count(first.evicted_addr));
            EXPECT_EQ(first.writeback, l1_dirty[first.evicted_addr]) << "step " << i;
        } else {
            EXPECT_FALSE(first.writeback);
        }
        if (first.hit) EXPECT_EQ(ev.size(), 1u);
        EXPECT_TRUE(h.L1().contains(addr));
    }

    const auto& s1 = h.L1().stats();
    const auto& s2 = h.L2().stats();
    EXPECT_EQ(s1.reads, reads);
    EXPECT_EQ(s1.writes, writes);
    EXPECT_EQ(s1.read_hits + s1.read_misses, reads);
    EXPECT_EQ(s1.write_hits + s1.write_misses, writes);

    // L2 sees exactly one block fetch per L1 miss
    EXPECT_EQ(s2.reads, s1.misses());
    EXPECT_EQ(s2.writes, 0u);
    EXPECT_EQ(h.hstats().mem_reads, s2.misses());
    EXPECT_EQ(h.hstats().mem_writes, s2.writebacks);
}

INSTANTIATE_TEST_SUITE_P(
    AllPolicyPairs, HierarchyProperties,
    ::testing::Values(std::make_pair(ReplacementPolicy::FIFO, ReplacementPolicy::FIFO),
                      std::make_pair(ReplacementPolicy::LRU, ReplacementPolicy::FIFO),
                      std::make_pair(ReplacementPolicy::MRU, ReplacementPolicy::LRU),
                      std::make_pair(ReplacementPolicy::LRU, ReplacementPolicy::MRU),
                      std::make_pair(ReplacementPolicy::FIFO, ReplacementPolicy::MRU),
                      std::make_pair(ReplacementPolicy::MRU, ReplacementPolicy::MRU)));
