#include "gtest/gtest.h"
#include "pmsim/model/RandomStream.hpp"
#include <utility>
#include <vector>

using namespace pmsim;

TEST(RandomStreamTest, SameSeedSameSequence) {
    RandomStream a(123);
    RandomStream b(123);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(a.binomial(1000, 0.3), b.binomial(1000, 0.3));
    }
}

TEST(RandomStreamTest, BinomialEdgeCases) {
    RandomStream rng(7);
    EXPECT_EQ(rng.binomial(0, 0.5), 0);
    EXPECT_EQ(rng.binomial(100, 0.0), 0);
    EXPECT_EQ(rng.binomial(100, 1.0), 100);
    for (int i = 0; i < 100; ++i) {
        const long draw = rng.binomial(20, 0.4);
        EXPECT_GE(draw, 0);
        EXPECT_LE(draw, 20);
    }
}

TEST(RandomStreamTest, SubStreamsAreDistinctAndReproducible) {
    EXPECT_EQ(RandomStream::deriveSeed(42, 0), RandomStream::deriveSeed(42, 0));
    EXPECT_NE(RandomStream::deriveSeed(42, 0), RandomStream::deriveSeed(42, 1));
    EXPECT_NE(RandomStream::deriveSeed(42, 0), RandomStream::deriveSeed(43, 0));

    RandomStream s0 = RandomStream::subStream(42, 0);
    RandomStream s1 = RandomStream::subStream(42, 1);
    std::vector<long> d0;
    std::vector<long> d1;
    for (int i = 0; i < 10; ++i) {
        d0.push_back(s0.binomial(1000000, 0.5));
        d1.push_back(s1.binomial(1000000, 0.5));
    }
    EXPECT_NE(d0, d1);
}

TEST(RandomStreamTest, MoveKeepsState) {
    RandomStream a(99);
    RandomStream reference(99);
    a.binomial(1000, 0.5);
    reference.binomial(1000, 0.5);
    RandomStream moved(std::move(a));
    EXPECT_EQ(moved.getSeed(), 99u);
    EXPECT_EQ(moved.binomial(1000, 0.5), reference.binomial(1000, 0.5));
}

TEST(RandomStreamTest, BinomialAboveUnsignedRangeIsNotTruncated) {
    RandomStream rng(1);
    const long n = 5000000000L;
    const long draw = rng.binomial(n, 0.5);
    // Standard deviation is about 35,000.
    EXPECT_NEAR(static_cast<double>(draw), 2.5e9, 1.0e6);
    EXPECT_EQ(rng.binomial(n, 1.0), n);
}
