#include "gtest/gtest.h"
#include "pmsim/model/VaccinationCampaign.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include <vector>

using namespace pmsim;

class VaccinationCampaignTest : public ::testing::Test {
protected:
    std::vector<BehaviorClass> classes{BehaviorClass{"careless", 0.9, 0.0, false},
                                       BehaviorClass{"vaccinated", 0.1, 0.0, true}};
    VaccinationSettings settings{0.1, 0.01};
    ProvinceState province{0, "PV_1", 10, 2, 2, 3};
    RandomStream rng{17};
};

TEST_F(VaccinationCampaignTest, WillingnessRisesWithPrevalence) {
    VaccinationCampaign campaign(classes, settings);
    EXPECT_DOUBLE_EQ(campaign.willingness(0.0), 1.0);
    EXPECT_DOUBLE_EQ(campaign.willingness(0.01), 1.5);
    EXPECT_GT(campaign.willingness(1.0), 1.99);
    EXPECT_LT(campaign.willingness(1.0), 2.0);

    EXPECT_DOUBLE_EQ(campaign.uptakeProbability(0.0), 0.1 * 0.5);
    EXPECT_DOUBLE_EQ(campaign.uptakeProbability(0.01), 0.1 * (1.0 - 1.0 / 3.0));
}

TEST_F(VaccinationCampaignTest, PairsByPrudenceThenFirstVaccinatedClass) {
    const std::vector<BehaviorClass> four{BehaviorClass{"careless", 0.4, 0.0, false},
                                          BehaviorClass{"prudent", 0.3, 0.6, false},
                                          BehaviorClass{"vaccinated_prudent", 0.2, 0.6, true},
                                          BehaviorClass{"vaccinated", 0.1, 0.0, true}};
    VaccinationCampaign campaign(four, settings);
    EXPECT_EQ(campaign.pairedClass(0), 3);
    EXPECT_EQ(campaign.pairedClass(1), 2);
    EXPECT_EQ(campaign.pairedClass(2), -1);
    EXPECT_EQ(campaign.pairedClass(3), -1);

    const std::vector<BehaviorClass> mixed{BehaviorClass{"careless", 0.5, 0.0, false},
                                           BehaviorClass{"prudent", 0.3, 0.5, false},
                                           BehaviorClass{"vaccinated", 0.2, 0.2, true}};
    VaccinationCampaign fallback(mixed, settings);
    EXPECT_EQ(fallback.pairedClass(0), 2);
    EXPECT_EQ(fallback.pairedClass(1), 2);
}

TEST_F(VaccinationCampaignTest, EnabledCampaignNeedsVaccinatedClass) {
    const std::vector<BehaviorClass> none{BehaviorClass{"careless", 1.0, 0.0, false}};
    EXPECT_THROW(VaccinationCampaign campaign(none, settings), InvalidParameterException);
    EXPECT_NO_THROW(VaccinationCampaign campaign(none, VaccinationSettings{0.0, 0.01}));
}

TEST_F(VaccinationCampaignTest, DisabledCampaignDoesNothing) {
    province.add(Compartment::S, CareStatus::Bedded, 0, 0, 1000);
    VaccinationCampaign campaign(classes, VaccinationSettings{0.0, 0.01});
    EXPECT_FALSE(campaign.isEnabled());
    EXPECT_EQ(campaign.apply(province, rng), 0);
    EXPECT_EQ(province.count(Compartment::S, CareStatus::Bedded, 0, 0), 1000);
}

TEST_F(VaccinationCampaignTest, MovesSusceptiblesUpToCoverageKeepingDwell) {
    province.add(Compartment::S, CareStatus::Bedded, 0, 2, 970);
    province.add(Compartment::I, CareStatus::Bedded, 0, 1, 10);
    province.add(Compartment::R, CareStatus::Bedded, 0, 3, 20);
    VaccinationCampaign campaign(classes, settings);

    long total = 0;
    for (int day = 0; day < 40; ++day) {
        total += campaign.apply(province, rng);
    }

    // 10% of 1000 living individuals.
    EXPECT_EQ(total, 100);
    EXPECT_EQ(province.count(Compartment::S, CareStatus::Bedded, 1, 2), 100);
    EXPECT_EQ(province.count(Compartment::S, CareStatus::Bedded, 0, 2), 870);
    EXPECT_EQ(province.classTotal(Compartment::I, 0), 10);
    EXPECT_EQ(province.classTotal(Compartment::R, 0), 20);
    EXPECT_EQ(province.livingPopulation(), 1000);
}

TEST_F(VaccinationCampaignTest, StopsWhenCoverageAlreadyReached) {
    province.add(Compartment::S, CareStatus::Bedded, 0, 0, 850);
    province.add(Compartment::R, CareStatus::Bedded, 1, 0, 150);
    VaccinationCampaign campaign(classes, settings);
    EXPECT_EQ(campaign.apply(province, rng), 0);
    EXPECT_EQ(province.count(Compartment::S, CareStatus::Bedded, 0, 0), 850);
}
