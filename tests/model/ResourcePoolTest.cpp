#include "gtest/gtest.h"
#include "pmsim/model/ResourcePool.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include "pmsim/exceptions/InvariantViolationException.hpp"

using namespace pmsim;

TEST(ResourcePoolTest, AdmitsUntilSaturated) {
    ResourcePool pool(0, 2, 1);
    EXPECT_TRUE(pool.admit(Severity::Hospital));
    EXPECT_TRUE(pool.admit(Severity::Hospital));
    EXPECT_FALSE(pool.admit(Severity::Hospital));
    EXPECT_TRUE(pool.isSaturated(Severity::Hospital));
    EXPECT_EQ(pool.occupied(Severity::Hospital), 2);
    EXPECT_EQ(pool.available(Severity::ICU), 1);
}

TEST(ResourcePoolTest, AdmitUpToGrantsAvailableBeds) {
    ResourcePool pool(0, 5, 0);
    EXPECT_EQ(pool.admitUpTo(Severity::Hospital, 3), 3);
    EXPECT_EQ(pool.admitUpTo(Severity::Hospital, 4), 2);
    EXPECT_EQ(pool.admitUpTo(Severity::Hospital, 4), 0);
    EXPECT_EQ(pool.admitUpTo(Severity::ICU, 10), 0);
    EXPECT_EQ(pool.occupied(Severity::Hospital), 5);
}

TEST(ResourcePoolTest, ReleaseFreesBeds) {
    ResourcePool pool(0, 3, 3);
    pool.admitUpTo(Severity::ICU, 3);
    pool.release(Severity::ICU, 2);
    EXPECT_EQ(pool.occupied(Severity::ICU), 1);
    EXPECT_TRUE(pool.admit(Severity::ICU));
}

TEST(ResourcePoolTest, ReleaseBelowZeroIsInvariantViolation) {
    ResourcePool pool(4, 3, 3);
    pool.admit(Severity::Hospital);
    try {
        pool.release(Severity::Hospital, 2);
        FAIL() << "Expected InvariantViolationException";
    } catch (const InvariantViolationException& e) {
        EXPECT_EQ(e.getInvariant(), "occupancy_bounds");
        EXPECT_EQ(e.getProvinceId(), 4);
        EXPECT_EQ(e.getDay(), InvariantViolationException::UNKNOWN_DAY);
    }
    EXPECT_EQ(pool.occupied(Severity::Hospital), 1);
}

TEST(ResourcePoolTest, RejectsNegativeCapacity) {
    EXPECT_THROW(ResourcePool(0, -1, 0), InvalidParameterException);
}
