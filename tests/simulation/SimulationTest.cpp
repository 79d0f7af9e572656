#include "gtest/gtest.h"
#include "pmsim/simulation/Simulation.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include "pmsim/exceptions/InvariantViolationException.hpp"
#include "pmsim/utils/Logger.hpp"
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pmsim;

// Lets a test corrupt the run state between two days.
class TamperableSimulation : public Simulation {
public:
    using Simulation::Simulation;

    void injectSusceptibles(int provinceId, long count) {
        mutableContext().province(provinceId).add(Compartment::S, CareStatus::Bedded, 0, 0, count);
    }
};

class SimulationTest : public ::testing::Test {
protected:
    ParameterBundle params;

    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::WARNING);
        params.provinces = {ProvinceConfig{"A", 20000, 40, 6, 0, 30, 0},
                            ProvinceConfig{"B", 15000, 30, 4, 0, 10, 0},
                            ProvinceConfig{"C", 8000, 10, 2, 0, 0, 0}};
        params.mobility_edges = {MobilityEdge{0, 1, 0.01}, MobilityEdge{1, 2, 0.01},
                                 MobilityEdge{2, 0, 0.02}, MobilityEdge{1, 0, 0.005}};
        params.behavior_classes = {BehaviorClass{"careless", 0.6, 0.0, false},
                                   BehaviorClass{"prudent", 0.3, 0.6, false},
                                   BehaviorClass{"vaccinated", 0.1, 0.2, true}};
        params.transitions.beta = 0.9;
        params.transitions.p_symptoms = 0.1;
        params.waning_immunity = true;
        params.dwell.immunity_min_days = 20;
        params.blocked_admission_policy = BlockedAdmissionPolicy::Degrade;
        params.max_days = 80;
        params.seed = 2024;
    }

    static std::string csvOf(const OutputTable& table) {
        std::ostringstream out;
        table.writeCsv(out);
        return out.str();
    }
};

TEST_F(SimulationTest, InvalidBundleIsRejectedBeforeAnyDay) {
    params.provinces[0].initial_infectious = 30000;
    EXPECT_THROW(Simulation simulation(params), ConfigurationException);
}

TEST_F(SimulationTest, ConservesPopulationEveryDay) {
    Simulation simulation(params);
    const OutputTable& table = simulation.run();
    const long initial = params.totalPopulation();
    ASSERT_FALSE(table.empty());
    for (int day = 1; day <= table.lastDay(); ++day) {
        const auto rows = table.rowsForDay(day);
        ASSERT_EQ(rows.size(), 3u) << "day " << day;
        long accounted = 0;
        for (const auto& row : rows) {
            accounted += row.accountedPopulation();
        }
        EXPECT_EQ(accounted, initial) << "day " << day;
    }
}

TEST_F(SimulationTest, OccupancyStaysWithinCapacity) {
    Simulation simulation(params);
    const OutputTable& table = simulation.run();
    for (const auto& row : table.rows()) {
        const ProvinceConfig& cfg = params.provinces[row.province_id];
        EXPECT_GE(row.hospital_occupied, 0);
        EXPECT_LE(row.hospital_occupied, cfg.hospital_capacity);
        EXPECT_GE(row.icu_occupied, 0);
        EXPECT_LE(row.icu_occupied, cfg.icu_capacity);
        EXPECT_LE(row.hospital_occupied, row.J3);
        EXPECT_LE(row.icu_occupied, row.J4);
    }
}

TEST_F(SimulationTest, CumulativeDeathsNeverDecrease) {
    Simulation simulation(params);
    const OutputTable& table = simulation.run();
    for (int p = 0; p < 3; ++p) {
        long previous = 0;
        for (const auto& row : table.rowsForProvince(p)) {
            EXPECT_GE(row.cumulative_deaths, previous);
            previous = row.cumulative_deaths;
        }
    }
}

TEST_F(SimulationTest, RowsAreOrderedByDayThenProvince) {
    Simulation simulation(params);
    const OutputTable& table = simulation.run();
    const auto& rows = table.rows();
    ASSERT_EQ(rows.size() % 3, 0u);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        EXPECT_EQ(rows[i].day, static_cast<int>(i / 3) + 1);
        EXPECT_EQ(rows[i].province_id, static_cast<int>(i % 3));
    }
}

TEST_F(SimulationTest, SameSeedGivesIdenticalOutput) {
    Simulation first(params);
    Simulation second(params);
    EXPECT_EQ(csvOf(first.run()), csvOf(second.run()));
}

TEST_F(SimulationTest, ParallelProvincesMatchSequential) {
    params.vaccination.coverage = 0.3;
    Simulation sequential(params);
    params.parallel_provinces = true;
    Simulation parallel(params);
    EXPECT_EQ(csvOf(sequential.run()), csvOf(parallel.run()));
}

TEST_F(SimulationTest, DifferentSeedsDiverge) {
    Simulation first(params);
    params.seed = 7;
    Simulation second(params);
    EXPECT_NE(csvOf(first.run()), csvOf(second.run()));
}

TEST_F(SimulationTest, StopsOnFirstDayWithoutInfection) {
    for (auto& p : params.provinces) {
        p.initial_infectious = 0;
        p.initial_exposed = 0;
    }
    Simulation simulation(params);
    const OutputTable& table = simulation.run();
    EXPECT_EQ(simulation.getTerminationReason(), TerminationReason::NoActiveInfections);
    EXPECT_EQ(table.lastDay(), 1);
    EXPECT_EQ(table.size(), 3u);
    long susceptible = 0;
    for (const auto& row : table.rows()) {
        EXPECT_EQ(row.E + row.I + row.J3 + row.J4 + row.R, 0);
        susceptible += row.S;
    }
    EXPECT_EQ(susceptible, params.totalPopulation());
}

TEST_F(SimulationTest, StopsAtMaxDays) {
    params.max_days = 5;
    Simulation simulation(params);
    const OutputTable& table = simulation.run();
    EXPECT_EQ(simulation.getState(), SimulationState::Terminated);
    EXPECT_EQ(simulation.getTerminationReason(), TerminationReason::MaxDaysReached);
    EXPECT_EQ(simulation.getCurrentDay(), 5);
    EXPECT_EQ(table.lastDay(), 5);
    EXPECT_EQ(table.size(), 15u);
}

TEST_F(SimulationTest, SteppingExposesRowsIncrementally) {
    params.max_days = 4;
    Simulation simulation(params);
    EXPECT_EQ(simulation.getState(), SimulationState::Initializing);
    EXPECT_THROW(simulation.getRecorder().table(), SimulationException);

    int days = 0;
    bool running = true;
    while (running) {
        running = simulation.step();
        ++days;
        const auto fresh = simulation.getRecorder().drainNew();
        ASSERT_EQ(fresh.size(), 3u);
        EXPECT_EQ(fresh.front().day, days);
    }
    EXPECT_EQ(days, 4);
    EXPECT_THROW(simulation.step(), SimulationException);
    EXPECT_THROW(simulation.run(), SimulationException);
    EXPECT_EQ(simulation.getRecorder().table().size(), 12u);
}

TEST_F(SimulationTest, ObserverSeesEveryDay) {
    params.max_days = 12;
    Simulation simulation(params);
    std::vector<int> seen;
    simulation.setDayObserver([&seen](const DailySummary& s) { seen.push_back(s.day); });
    simulation.run();
    ASSERT_EQ(static_cast<int>(seen.size()), simulation.getCurrentDay());
    for (std::size_t i = 0; i < seen.size(); ++i) {
        EXPECT_EQ(seen[i], static_cast<int>(i) + 1);
    }
    EXPECT_EQ(simulation.getRecorder().summaries().size(), seen.size());
}

TEST_F(SimulationTest, SummaryPrevalenceMatchesTable) {
    Simulation simulation(params);
    const OutputTable& table = simulation.run();
    for (const auto& s : simulation.getRecorder().summaries()) {
        long prevalence = 0;
        for (const auto& row : table.rowsForDay(s.day)) {
            prevalence += row.E + row.I + row.J3 + row.J4;
        }
        EXPECT_EQ(s.prevalence, prevalence) << "day " << s.day;
        EXPECT_GE(s.moved, 0);
    }
}

TEST_F(SimulationTest, WithoutMobilityProvincesEvolveIndependently) {
    params.mobility_edges.clear();
    params.max_days = 30;
    Simulation simulation(params);
    const OutputTable& table = simulation.run();
    for (const auto& row : table.rowsForProvince(2)) {
        EXPECT_EQ(row.accountedPopulation(), params.provinces[2].population);
        EXPECT_EQ(row.E + row.I + row.J3 + row.J4 + row.R, 0);
    }
    for (const auto& s : simulation.getRecorder().summaries()) {
        EXPECT_EQ(s.moved, 0);
    }
}

TEST_F(SimulationTest, InvariantFailureAbortsRunAndDiscardsOutput) {
    TamperableSimulation simulation(params);
    ASSERT_TRUE(simulation.step());
    ASSERT_TRUE(simulation.step());
    const std::vector<OutputRow> day2 = simulation.getRecorder().lastSnapshot();
    ASSERT_EQ(day2.size(), 3u);
    ASSERT_EQ(day2.front().day, 2);

    simulation.injectSusceptibles(1, 5);
    try {
        simulation.step();
        FAIL() << "Expected InvariantViolationException";
    } catch (const InvariantViolationException& e) {
        EXPECT_EQ(e.getInvariant(), "population_conservation");
        EXPECT_EQ(e.getDay(), 3);
        EXPECT_EQ(e.getProvinceId(), -1);
        EXPECT_EQ(e.getLastValidSnapshot(), day2);
    }

    EXPECT_EQ(simulation.getState(), SimulationState::Terminated);
    EXPECT_EQ(simulation.getTerminationReason(), TerminationReason::InvariantViolation);
    EXPECT_EQ(simulation.getRecorder().rowCount(), 0u);
    EXPECT_TRUE(simulation.getRecorder().summaries().empty());
    EXPECT_FALSE(simulation.getRecorder().isFinalized());
    EXPECT_THROW(simulation.step(), SimulationException);
}

TEST_F(SimulationTest, ObserverErrorTerminatesRunAndDiscardsOutput) {
    Simulation simulation(params);
    simulation.setDayObserver([](const DailySummary& summary) {
        if (summary.day == 2) {
            throw std::runtime_error("observer failed");
        }
    });
    EXPECT_THROW(simulation.run(), std::runtime_error);

    EXPECT_EQ(simulation.getState(), SimulationState::Terminated);
    EXPECT_EQ(simulation.getTerminationReason(), TerminationReason::Error);
    EXPECT_EQ(simulation.getRecorder().rowCount(), 0u);
    EXPECT_TRUE(simulation.getRecorder().summaries().empty());
    EXPECT_THROW(simulation.step(), SimulationException);
}

TEST_F(SimulationTest, VaccinationKeepsPopulationConserved) {
    params.vaccination.coverage = 0.5;
    params.max_days = 40;
    Simulation simulation(params);
    const OutputTable& table = simulation.run();
    long doses = 0;
    for (const auto& s : simulation.getRecorder().summaries()) {
        doses += s.new_vaccinations;
    }
    EXPECT_GT(doses, 0);
    for (int day = 1; day <= table.lastDay(); ++day) {
        long accounted = 0;
        for (const auto& row : table.rowsForDay(day)) {
            accounted += row.accountedPopulation();
        }
        EXPECT_EQ(accounted, params.totalPopulation()) << "day " << day;
    }
}
