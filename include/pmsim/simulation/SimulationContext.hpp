#ifndef PMSIM_SIMULATION_CONTEXT_HPP
#define PMSIM_SIMULATION_CONTEXT_HPP

#include "pmsim/model/ProvinceState.hpp"
#include "pmsim/model/RandomStream.hpp"
#include "pmsim/model/parameters/ParameterBundle.hpp"
#include "pmsim/simulation/OutputRow.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pmsim {

/** @brief First failed invariant found by SimulationContext::findInvariantViolation. */
struct InvariantViolation {
    std::string invariant;
    int province_id = -1;
    std::string detail;
};

/**
 * @class SimulationContext
 * @brief All mutable state of one run.
 *
 * Owns the provinces (cohorts, resource pools, death counts), the random
 * sub-streams and the day counter. Nothing outside the context holds run
 * state.
 */
class SimulationContext {
public:
    /**
     * @brief Builds the initial state from a validated bundle.
     *
     * Each province starts with S = population - E0 - I0 - R0. Every
     * compartment's initial count is split across behavior classes by
     * largest-remainder apportionment of the class fractions, at dwell 0.
     */
    explicit SimulationContext(const ParameterBundle& params);

    int getDay() const { return day_; }
    void advanceDay() { ++day_; }

    int numProvinces() const { return static_cast<int>(provinces_.size()); }

    std::vector<ProvinceState>& provinces() { return provinces_; }
    const std::vector<ProvinceState>& provinces() const { return provinces_; }

    /** @throws OutOfRangeException for an unknown province id. */
    ProvinceState& province(int id);
    const ProvinceState& province(int id) const;

    /** @brief Random sub-stream of a province. */
    RandomStream& provinceStream(int id);

    RandomStream& mobilityStream() { return mobilityStream_; }

    long getInitialPopulation() const { return initialPopulation_; }
    long getInitialPopulation(int provinceId) const;

    long totalLiving() const;
    long totalDeaths() const;

    /** @brief E + I + J3 + J4 over all provinces. */
    long totalActiveInfections() const;

    /** @brief One row per province, stamped with the current day. */
    std::vector<OutputRow> snapshot() const;

    /**
     * @brief Checks the run invariants.
     *
     * - no negative cohort cell
     * - 0 <= occupancy <= capacity
     * - bedded J3 / J4 equal hospital / ICU occupancy
     * - living population plus deaths equals the initial population
     *
     * @return The first violation found, or std::nullopt.
     */
    std::optional<InvariantViolation> findInvariantViolation() const;

private:
    std::vector<ProvinceState> provinces_;
    std::vector<RandomStream> provinceStreams_;
    RandomStream mobilityStream_;
    std::vector<long> initialPopulations_;
    long initialPopulation_ = 0;
    int day_ = 0;
};

} // namespace pmsim

#endif // PMSIM_SIMULATION_CONTEXT_HPP
