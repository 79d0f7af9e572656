#include "gtest/gtest.h"
#include "pmsim/model/ProvinceState.hpp"
#include "pmsim/exceptions/Exceptions.hpp"

using namespace pmsim;

class ProvinceStateTest : public ::testing::Test {
protected:
    ProvinceState province{2, "PV_3", 10, 4, 2, 5};
};

TEST_F(ProvinceStateTest, StartsEmpty) {
    EXPECT_EQ(province.getId(), 2);
    EXPECT_EQ(province.getLabel(), "PV_3");
    EXPECT_EQ(province.numCells(), NUM_COMPARTMENTS * NUM_CARE_STATUSES * 2 * 6);
    EXPECT_EQ(province.livingPopulation(), 0);
    EXPECT_EQ(province.resources().capacity(Severity::Hospital), 10);
    EXPECT_EQ(province.resources().capacity(Severity::ICU), 4);
}

TEST_F(ProvinceStateTest, CellIndicesAreDistinct) {
    EXPECT_NE(province.cellIndex(Compartment::S, CareStatus::Bedded, 0, 0),
              province.cellIndex(Compartment::S, CareStatus::Bedded, 1, 0));
    EXPECT_NE(province.cellIndex(Compartment::J3, CareStatus::Bedded, 0, 3),
              province.cellIndex(Compartment::J3, CareStatus::Unbedded, 0, 3));
    EXPECT_EQ(province.cellIndex(Compartment::R, CareStatus::Unbedded, 1, 5), province.numCells() - 1);
    EXPECT_THROW(province.cellIndex(Compartment::S, CareStatus::Bedded, 2, 0), OutOfRangeException);
    EXPECT_THROW(province.cellIndex(Compartment::S, CareStatus::Bedded, 0, 6), OutOfRangeException);
}

TEST_F(ProvinceStateTest, TotalsAggregateCells) {
    province.add(Compartment::S, CareStatus::Bedded, 0, 0, 100);
    province.add(Compartment::S, CareStatus::Bedded, 1, 4, 50);
    province.add(Compartment::I, CareStatus::Bedded, 1, 2, 7);
    province.add(Compartment::J3, CareStatus::Bedded, 0, 1, 3);
    province.add(Compartment::J3, CareStatus::Unbedded, 1, 0, 2);
    province.add(Compartment::E, CareStatus::Bedded, 0, 0, 4);

    EXPECT_EQ(province.compartmentTotal(Compartment::S), 150);
    EXPECT_EQ(province.classTotal(Compartment::S, 1), 50);
    EXPECT_EQ(province.compartmentTotal(Compartment::J3), 5);
    EXPECT_EQ(province.compartmentTotal(Compartment::J3, CareStatus::Unbedded), 2);
    EXPECT_EQ(province.activeInfections(), 4 + 7 + 5);
    EXPECT_EQ(province.livingPopulation(), 166);
    EXPECT_FALSE(province.hasNegativeCell());

    const auto totals = province.compartmentTotals();
    EXPECT_EQ(totals[index(Compartment::I)], 7);
    EXPECT_EQ(totals[index(Compartment::R)], 0);
}

TEST_F(ProvinceStateTest, DetectsNegativeCell) {
    province.add(Compartment::R, CareStatus::Bedded, 0, 0, -1);
    EXPECT_TRUE(province.hasNegativeCell());
}

TEST(ProvinceStateCreationTest, RejectsInvalidLayout) {
    EXPECT_THROW(ProvinceState(0, "x", 1, 1, 0, 3), InvalidParameterException);
    EXPECT_THROW(ProvinceState(0, "x", 1, 1, 1, -1), InvalidParameterException);
}
