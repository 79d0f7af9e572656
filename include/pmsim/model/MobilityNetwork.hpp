#ifndef PMSIM_MOBILITY_NETWORK_HPP
#define PMSIM_MOBILITY_NETWORK_HPP

#include "pmsim/model/Compartment.hpp"
#include "pmsim/model/ProvinceState.hpp"
#include "pmsim/model/RandomStream.hpp"
#include "pmsim/model/interfaces/IInterventionSchedule.hpp"
#include "pmsim/model/parameters/ParameterBundle.hpp"
#include <array>
#include <memory>
#include <utility>
#include <vector>

namespace pmsim {

/**
 * @class MobilityNetwork
 * @brief Weighted directed graph over provinces with a daily redistribution step.
 *
 * Edge weights are daily per-individual movement probabilities. For each
 * movable cell the number of leavers is drawn from
 * Binomial(n, min(1, w_out * mobility_factor(day) * behavior_scale)) and split
 * among destinations by largest-remainder apportionment of the edge
 * weights. Departures are computed for every province before any arrival
 * is applied. Movers keep their behavior class and days in compartment.
 */
class MobilityNetwork {
public:
    /** @brief Outgoing edges of one province as (destination, weight), sorted by destination. */
    using Adjacency = std::vector<std::pair<int, double>>;

    /**
     * @param numProvinces Number of provinces.
     * @param edges Validated edges (no self-edges, weights in [0,1], outgoing sums <= 1).
     * @param movable Movable flag per compartment; J3 and J4 are never moved.
     * @param behaviorClasses Behavior classes, used for the prudence of moving I.
     * @param mobilitySchedule Weight multiplier per day; null means constant 1.
     * @throws InvalidParameterException for edges referencing unknown provinces.
     */
    MobilityNetwork(int numProvinces,
                    const std::vector<MobilityEdge>& edges,
                    const std::array<bool, NUM_COMPARTMENTS>& movable,
                    std::vector<BehaviorClass> behaviorClasses,
                    std::shared_ptr<IInterventionSchedule> mobilitySchedule = nullptr);

    /**
     * @brief Moves individuals between provinces for one day.
     *
     * @param provinces [in,out] All provinces of the run, same cell layout.
     * @param day [in] Simulated day, used for the mobility schedule.
     * @param rng [in,out] The mobility random sub-stream.
     * @return long Number of individuals who changed province.
     */
    long apply(std::vector<ProvinceState>& provinces, int day, RandomStream& rng) const;

    /**
     * @brief Probability that one individual of a cell leaves its province today.
     */
    double departureProbability(int province, Compartment c, int behaviorClass, int day) const;

    const Adjacency& outgoing(int province) const;

    /** @brief Sum of outgoing edge weights of a province. */
    double outgoingWeight(int province) const;

    int numProvinces() const { return static_cast<int>(adjacency_.size()); }

    bool isMovable(Compartment c) const { return movable_[index(c)]; }

private:
    std::vector<Adjacency> adjacency_;
    std::vector<double> outgoingWeight_;
    std::array<bool, NUM_COMPARTMENTS> movable_;
    std::vector<BehaviorClass> classes_;
    std::shared_ptr<IInterventionSchedule> schedule_;
};

} // namespace pmsim

#endif // PMSIM_MOBILITY_NETWORK_HPP
