#include <gtest/gtest.h>
#include <kreuzberg/engine/string_interner.h>

#include <cstring>

using namespace kreuzberg::engine;

class StringInternerTest : public ::testing::Test {
protected:
    void SetUp() override { interner.resetCounters(); }

    StringInterner& interner = StringInterner::instance();
};

TEST_F(StringInternerTest, EqualStringsShareStorage) {
    const char* a = interner.intern("application/x-test-shared");
    const char* b = interner.intern(std::string("application/x-test-") + "shared");
    EXPECT_EQ(a, b);
    EXPECT_STREQ(a, "application/x-test-shared");

    auto stats = interner.getStats();
    EXPECT_EQ(stats.totalRequests, 2u);
    EXPECT_EQ(stats.cacheMisses, 1u);
    EXPECT_EQ(stats.cacheHits, 1u);

    EXPECT_TRUE(interner.release(a));
    EXPECT_TRUE(interner.release(b));
}

TEST_F(StringInternerTest, CommonMimeTypesArePreloaded) {
    const char* pdf = interner.intern("application/pdf");
    EXPECT_EQ(interner.getStats().cacheHits, 1u);
    EXPECT_TRUE(interner.release(pdf));
    EXPECT_TRUE(interner.release(pdf));

    // Permanent entries survive any number of releases
    EXPECT_EQ(interner.intern("application/pdf"), pdf);
    EXPECT_TRUE(interner.release(pdf));
}

TEST_F(StringInternerTest, LastReleaseFreesString) {
    const auto before = interner.getStats();
    const char* s = interner.intern("x-kreuzberg/ephemeral");
    auto during = interner.getStats();
    EXPECT_EQ(during.uniqueCount, before.uniqueCount + 1);
    EXPECT_EQ(during.totalMemoryBytes, before.totalMemoryBytes + std::strlen(s) + 1);

    EXPECT_TRUE(interner.release(s));
    auto after = interner.getStats();
    EXPECT_EQ(after.uniqueCount, before.uniqueCount);
    EXPECT_EQ(after.totalMemoryBytes, before.totalMemoryBytes);
}

TEST_F(StringInternerTest, ReferenceCounting) {
    const char* first = interner.intern("x-kreuzberg/counted");
    const char* second = interner.intern("x-kreuzberg/counted");
    const auto unique = interner.getStats().uniqueCount;

    EXPECT_TRUE(interner.release(first));
    EXPECT_EQ(interner.getStats().uniqueCount, unique);
    EXPECT_TRUE(interner.release(second));
    EXPECT_EQ(interner.getStats().uniqueCount, unique - 1);
}

TEST_F(StringInternerTest, ReleaseOfForeignPointerIsRejected) {
    const char* foreign = "not interned";
    EXPECT_FALSE(interner.release(foreign));
}

TEST_F(StringInternerTest, EmptyStringCanBeInterned) {
    const char* empty = interner.intern("");
    ASSERT_NE(empty, nullptr);
    EXPECT_STREQ(empty, "");
    EXPECT_TRUE(interner.release(empty));
}

TEST_F(StringInternerTest, ResetCountersKeepsStrings) {
    const char* s = interner.intern("x-kreuzberg/kept");
    interner.resetCounters();
    auto stats = interner.getStats();
    EXPECT_EQ(stats.totalRequests, 0u);
    EXPECT_EQ(stats.cacheHits, 0u);
    EXPECT_EQ(interner.intern("x-kreuzberg/kept"), s);
    EXPECT_TRUE(interner.release(s));
    EXPECT_TRUE(interner.release(s));
}
