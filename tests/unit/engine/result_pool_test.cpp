#include <gtest/gtest.h>
#include <kreuzberg/engine/result_pool.h>

#include <thread>
#include <vector>

using namespace kreuzberg;
using namespace kreuzberg::engine;

namespace {

extraction::ExtractionResult titled(const std::string& content, const std::string& title) {
    extraction::ExtractionResult r;
    r.content = content;
    if (!title.empty())
        r.metadata["title"] = title;
    return r;
}

} // namespace

TEST(ResultPoolTest, StartsEmpty) {
    ResultPool pool(4);
    auto stats = pool.getStats();
    EXPECT_EQ(stats.currentCount, 0u);
    EXPECT_EQ(stats.capacity, 4u);
    EXPECT_EQ(stats.totalAllocations, 0u);
    EXPECT_EQ(stats.growthEvents, 0u);
    EXPECT_EQ(stats.estimatedMemoryBytes, 0u);
}

TEST(ResultPoolTest, AddedResultsKeepTheirAddresses) {
    ResultPool pool(1);
    const auto& first = pool.add(titled("first", "Report"));
    const auto* firstAddress = &first;
    for (int i = 0; i < 50; ++i)
        pool.add(titled("filler " + std::to_string(i), ""));

    EXPECT_EQ(firstAddress->result.content, "first");
    EXPECT_EQ(firstAddress->title, "Report");
}

TEST(ResultPoolTest, GrowsByDoubling) {
    ResultPool pool(2);
    pool.add(titled("a", ""));
    pool.add(titled("b", ""));
    EXPECT_EQ(pool.getStats().growthEvents, 0u);

    pool.add(titled("c", ""));
    auto stats = pool.getStats();
    EXPECT_EQ(stats.capacity, 4u);
    EXPECT_EQ(stats.growthEvents, 1u);

    pool.add(titled("d", ""));
    pool.add(titled("e", ""));
    stats = pool.getStats();
    EXPECT_EQ(stats.capacity, 8u);
    EXPECT_EQ(stats.growthEvents, 2u);
    EXPECT_EQ(stats.currentCount, 5u);
}

TEST(ResultPoolTest, ZeroCapacityGrowsToOne) {
    ResultPool pool(0);
    pool.add(titled("a", ""));
    EXPECT_EQ(pool.getStats().capacity, 1u);
}

TEST(ResultPoolTest, ResetKeepsCapacityAndLifetimeCounters) {
    ResultPool pool(1);
    pool.add(titled("a", ""));
    pool.add(titled("b", ""));
    ASSERT_GT(pool.getStats().estimatedMemoryBytes, 0u);

    pool.reset();
    auto stats = pool.getStats();
    EXPECT_EQ(stats.currentCount, 0u);
    EXPECT_EQ(stats.capacity, 2u);
    EXPECT_EQ(stats.totalAllocations, 2u);
    EXPECT_EQ(stats.growthEvents, 1u);
    EXPECT_EQ(stats.estimatedMemoryBytes, 0u);
}

TEST(ResultPoolTest, ConcurrentAdds) {
    ResultPool pool(8);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&pool, t] {
            for (int i = 0; i < 100; ++i)
                pool.add(titled(std::to_string(t * 100 + i), ""));
        });
    }
    for (auto& th : threads)
        th.join();
    auto stats = pool.getStats();
    EXPECT_EQ(stats.currentCount, 400u);
    EXPECT_EQ(stats.totalAllocations, 400u);
    EXPECT_GE(stats.capacity, 400u);
}
