#include "gtest/gtest.h"
#include "pmsim/simulation/Simulation.hpp"
#include "pmsim/model/PiecewiseConstantSchedule.hpp"
#include "pmsim/utils/Logger.hpp"
#include <algorithm>
#include <optional>

using namespace pmsim;

// End-to-end epidemic scenarios with known qualitative outcomes.
class ScenarioTest : public ::testing::Test {
protected:
    ParameterBundle params;

    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::WARNING);
        params.provinces = {ProvinceConfig{"A", 10000, 10000, 10000, 0, 50, 0}};
        params.transitions.beta = 1.2;
        params.transitions.p_E_I = 0.5;
        params.transitions.p_I_R = 0.35;
        params.transitions.p_symptoms = 0.05;
        params.dwell.incubation_min_days = 1;
        params.dwell.infectious_min_days = 1;
        params.seed = 11;
    }
};

TEST_F(ScenarioTest, SingleProvinceOutbreakRisesAndBurnsOut) {
    params.provinces[0].initial_infectious = 10;
    params.max_days = 60;
    Simulation simulation(params);
    const OutputTable& table = simulation.run();
    const auto rows = table.rowsForProvince(0);
    ASSERT_FALSE(rows.empty());
    EXPECT_LE(rows.back().day, 60);

    long peak = 0;
    for (const auto& row : rows) {
        peak = std::max(peak, row.E + row.I);
    }
    EXPECT_GT(peak, 100);

    // By day 60 the epidemic is over and nearly everybody alive has recovered.
    const OutputRow& last = rows.back();
    EXPECT_LE(last.E + last.I, 5);
    EXPECT_GE(static_cast<double>(last.R), 0.85 * static_cast<double>(10000 - last.cumulative_deaths));
    EXPECT_LE(last.R, 10000 - last.cumulative_deaths);
}

TEST_F(ScenarioTest, MobilitySeedsNeighbouringProvince) {
    params.provinces.push_back(ProvinceConfig{"B", 10000, 10000, 10000, 0, 0, 0});
    params.mobility_edges = {MobilityEdge{0, 1, 0.01}, MobilityEdge{1, 0, 0.01}};
    params.max_days = 60;
    Simulation simulation(params);
    const OutputTable& table = simulation.run();
    const auto rows = table.rowsForProvince(1);
    ASSERT_FALSE(rows.empty());
    EXPECT_EQ(rows.front().day, 1);
    EXPECT_EQ(rows.front().E, 0);

    std::optional<int> first_exposed_day;
    for (const auto& row : rows) {
        if (row.E > 0) {
            first_exposed_day = row.day;
            break;
        }
    }
    ASSERT_TRUE(first_exposed_day.has_value());
    EXPECT_GE(*first_exposed_day, 2);
    EXPECT_LE(*first_exposed_day, 60);
}

TEST_F(ScenarioTest, NoIcuWithDegradeLeavesUnbeddedSevereCases) {
    params.provinces = {ProvinceConfig{"A", 10000, 10000, 0, 0, 200, 0}};
    params.transitions.p_symptoms = 0.5;
    params.transitions.severe_fraction = 0.5;
    params.transitions.p_J3_J4 = 0.1;
    params.blocked_admission_policy = BlockedAdmissionPolicy::Degrade;
    params.max_days = 30;
    Simulation simulation(params);
    const OutputTable& table = simulation.run();

    bool any_severe = false;
    for (const auto& row : table.rows()) {
        EXPECT_EQ(row.icu_occupied, 0);
        any_severe = any_severe || row.J4 > 0;
    }
    EXPECT_TRUE(any_severe);

    long excess = 0;
    for (const auto& s : simulation.getRecorder().summaries()) {
        excess += s.excess_icu_demand;
    }
    EXPECT_GT(excess, 0);
}

TEST_F(ScenarioTest, NoIcuWithBlockKeepsSevereCompartmentEmpty) {
    params.provinces = {ProvinceConfig{"A", 10000, 10000, 0, 0, 200, 0}};
    params.transitions.p_symptoms = 0.5;
    params.transitions.severe_fraction = 0.5;
    params.transitions.p_J3_J4 = 0.1;
    params.blocked_admission_policy = BlockedAdmissionPolicy::Block;
    params.max_days = 30;
    Simulation simulation(params);
    const OutputTable& table = simulation.run();

    for (const auto& row : table.rows()) {
        EXPECT_EQ(row.icu_occupied, 0);
        EXPECT_EQ(row.J4, 0);
    }
    long excess = 0;
    for (const auto& s : simulation.getRecorder().summaries()) {
        excess += s.excess_icu_demand;
    }
    EXPECT_GT(excess, 0);
}

TEST_F(ScenarioTest, HospitalSaturationCapsOccupancy) {
    params.provinces = {ProvinceConfig{"A", 10000, 5, 5, 0, 200, 0}};
    params.transitions.p_symptoms = 0.5;
    params.transitions.severe_fraction = 0.0;
    params.max_days = 30;
    Simulation simulation(params);
    const OutputTable& table = simulation.run();

    long peak_occupancy = 0;
    for (const auto& row : table.rows()) {
        EXPECT_LE(row.hospital_occupied, 5);
        peak_occupancy = std::max(peak_occupancy, row.hospital_occupied);
    }
    EXPECT_EQ(peak_occupancy, 5);

    long excess = 0;
    for (const auto& s : simulation.getRecorder().summaries()) {
        excess += s.excess_hospital_demand;
    }
    EXPECT_GT(excess, 0);
}

TEST_F(ScenarioTest, FullQuarantineStopsTransmission) {
    params.contact_schedule = PiecewiseConstantSchedule::windowPoints(0, 1000, 0.0);
    params.max_days = 40;
    Simulation simulation(params);
    simulation.run();
    for (const auto& s : simulation.getRecorder().summaries()) {
        EXPECT_EQ(s.new_exposures, 0) << "day " << s.day;
    }
}

TEST_F(ScenarioTest, MovementRestrictionSuspendsTravel) {
    params.provinces.push_back(ProvinceConfig{"B", 10000, 100, 10, 0, 0, 0});
    params.mobility_edges = {MobilityEdge{0, 1, 0.05}, MobilityEdge{1, 0, 0.05}};
    params.mobility_schedule = PiecewiseConstantSchedule::windowPoints(1, 10, 0.0);
    params.max_days = 15;
    Simulation simulation(params);
    simulation.run();
    for (const auto& s : simulation.getRecorder().summaries()) {
        if (s.day <= 10) {
            EXPECT_EQ(s.moved, 0) << "day " << s.day;
        } else {
            EXPECT_GT(s.moved, 0) << "day " << s.day;
        }
    }
}

TEST_F(ScenarioTest, VaccinationCampaignReducesExposures) {
    params.behavior_classes = {BehaviorClass{"careless", 1.0, 0.0, false},
                               BehaviorClass{"vaccinated", 0.0, 0.0, true}};
    params.max_days = 60;

    Simulation unvaccinated(params);
    unvaccinated.run();

    params.vaccination.coverage = 0.4;
    Simulation vaccinated(params);
    vaccinated.run();

    long exposures_without = 0;
    for (const auto& s : unvaccinated.getRecorder().summaries()) {
        exposures_without += s.new_exposures;
        EXPECT_EQ(s.new_vaccinations, 0);
    }
    long exposures_with = 0;
    long doses = 0;
    for (const auto& s : vaccinated.getRecorder().summaries()) {
        exposures_with += s.new_exposures;
        doses += s.new_vaccinations;
    }

    const long deaths = vaccinated.getContext().totalDeaths();
    EXPECT_GE(doses, 3000);
    EXPECT_LE(doses, 4000 + deaths);
    EXPECT_LT(exposures_with, exposures_without);

    const ProvinceState& province = vaccinated.getContext().province(0);
    long vaccinated_living = 0;
    for (Compartment c : allCompartments()) {
        vaccinated_living += province.classTotal(c, 1);
    }
    EXPECT_LE(vaccinated_living, 4000);
    EXPECT_GT(vaccinated_living, 0);
}
