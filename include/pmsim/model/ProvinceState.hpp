#ifndef PMSIM_PROVINCE_STATE_HPP
#define PMSIM_PROVINCE_STATE_HPP

#include "pmsim/model/Compartment.hpp"
#include "pmsim/model/ResourcePool.hpp"
#include <Eigen/Dense>
#include <array>
#include <string>

namespace pmsim {

/** @brief Flat storage of cohort cell counts. */
using CohortVector = Eigen::Matrix<long, Eigen::Dynamic, 1>;

/**
 * @class ProvinceState
 * @brief Aggregated population of one province (membrane).
 *
 * Individuals are counted per cohort cell, keyed by (compartment, care
 * status, behavior class, days in compartment). The days counter saturates at
 * `maxDwell`. The province also owns its resource pool, its cumulative death
 * count and its excess-demand counters.
 *
 * Cell layout is identical for every province of a run, so a flat cell
 * index can be used to move individuals between provinces.
 */
class ProvinceState {
public:
    /**
     * @param id Province index.
     * @param label Display label.
     * @param hospitalCapacity Hospital beds.
     * @param icuCapacity ICU beds.
     * @param numBehaviorClasses Number of behavior classes (at least 1).
     * @param maxDwell Cap of the days-in-compartment counter (non-negative).
     * @throws InvalidParameterException for invalid dimensions.
     */
    ProvinceState(int id, std::string label, long hospitalCapacity, long icuCapacity,
                  int numBehaviorClasses, int maxDwell);

    int getId() const { return id_; }
    const std::string& getLabel() const { return label_; }
    int numBehaviorClasses() const { return numClasses_; }
    int maxDwell() const { return maxDwell_; }

    /** @brief Number of cells: compartments x care statuses x classes x (maxDwell + 1). */
    Eigen::Index numCells() const { return cells_.size(); }

    /**
     * @brief Flat index of a cell.
     * @throws OutOfRangeException for a class or dwell outside the layout.
     */
    Eigen::Index cellIndex(Compartment c, CareStatus care, int behaviorClass, int dwell) const;

    long count(Compartment c, CareStatus care, int behaviorClass, int dwell) const;

    /** @brief Adds `delta` (possibly negative) individuals to a cell. */
    void add(Compartment c, CareStatus care, int behaviorClass, int dwell, long delta);

    const CohortVector& cells() const { return cells_; }
    CohortVector& cells() { return cells_; }

    long compartmentTotal(Compartment c) const;
    long compartmentTotal(Compartment c, CareStatus care) const;

    /** @brief Totals of all compartments, indexed by Compartment. */
    std::array<long, NUM_COMPARTMENTS> compartmentTotals() const;

    /** @brief Living individuals in a compartment and behavior class (all care statuses and dwells). */
    long classTotal(Compartment c, int behaviorClass) const;

    long livingPopulation() const { return cells_.sum(); }

    /** @brief E + I + J3 + J4. */
    long activeInfections() const;

    long getCumulativeDeaths() const { return cumulativeDeaths_; }
    void addDeaths(long count) { cumulativeDeaths_ += count; }

    ResourcePool& resources() { return resources_; }
    const ResourcePool& resources() const { return resources_; }

    /** @brief Refused admissions since the start of the run. */
    long getExcessDemand(Severity severity) const { return excessDemand_[index(severity)]; }
    void addExcessDemand(Severity severity, long count) { excessDemand_[index(severity)] += count; }

    /** @brief True if any cell is negative. */
    bool hasNegativeCell() const { return cells_.size() > 0 && cells_.minCoeff() < 0; }

private:
    int id_;
    std::string label_;
    int numClasses_;
    int maxDwell_;
    CohortVector cells_;
    ResourcePool resources_;
    long cumulativeDeaths_ = 0;
    std::array<long, NUM_SEVERITIES> excessDemand_{{0, 0}};

    Eigen::Index blockSize() const { return static_cast<Eigen::Index>(numClasses_) * (maxDwell_ + 1); }
    Eigen::Index blockStart(Compartment c, CareStatus care) const {
        return (static_cast<Eigen::Index>(index(c)) * NUM_CARE_STATUSES + index(care)) * blockSize();
    }
};

} // namespace pmsim

#endif // PMSIM_PROVINCE_STATE_HPP
