#ifndef PMSIM_TRANSITION_RULE_SET_HPP
#define PMSIM_TRANSITION_RULE_SET_HPP

#include "pmsim/model/Compartment.hpp"
#include "pmsim/model/ProvinceState.hpp"
#include "pmsim/model/RandomStream.hpp"
#include "pmsim/model/interfaces/IInterventionSchedule.hpp"
#include "pmsim/model/parameters/ParameterBundle.hpp"
#include <array>
#include <memory>
#include <vector>

namespace pmsim {

/**
 * @struct TransitionTally
 * @brief Counts of the transitions applied to one province on one day.
 */
struct TransitionTally {
    long new_exposures = 0;      ///< S -> E
    long new_infectious = 0;     ///< E -> I
    long new_symptomatic = 0;    ///< I -> J3 or J4
    long new_recoveries = 0;     ///< * -> R
    long new_deaths = 0;
    long waned = 0;              ///< R -> S
    long new_vaccinations = 0;   ///< Filled by the vaccination campaign
    std::array<long, NUM_SEVERITIES> admissions{{0, 0}};
    std::array<long, NUM_SEVERITIES> excess_demand{{0, 0}};

    TransitionTally& operator+=(const TransitionTally& other);
};

/**
 * @class TransitionRuleSet
 * @brief Probabilistic SEJIRS progression of one province for one day.
 *
 * Reachable transitions:
 * - S -> E (exposure, driven by local I and, optionally, isolated J3/J4)
 * - E -> I after the incubation dwell
 * - I -> J3 | J4 | R after the infectious dwell
 * - J3 -> R (after the hospital dwell) | J4 | Deceased
 * - J4 -> R (after the hospital dwell) | Deceased
 * - R -> S after the immunity dwell, when waning immunity is enabled
 *
 * All probabilities come from the start-of-day state. Each cell's outgoing
 * transitions are drawn as a multinomial, realized as a chain of conditional
 * binomials in priority order: destinations with a lower province-level
 * count first, ties by compartment order, Deceased last.
 *
 * Bed requests are resolved in a fixed order after drawing: releases of
 * bedded J3/J4 exits, ICU requests from bedded J3, unbedded J3 and I, then
 * hospital requests from I. Refused requests follow the blocked-admission
 * policy.
 */
class TransitionRuleSet {
public:
    /** @brief Outcome slots: one per compartment, then Deceased. */
    static constexpr int NUM_OUTCOMES = NUM_COMPARTMENTS + 1;
    static constexpr int DECEASED = NUM_COMPARTMENTS;

    using OutcomeProbabilities = std::array<double, NUM_OUTCOMES>;
    using OutcomeOrder = std::array<int, NUM_OUTCOMES>;

    /**
     * @param params Validated parameter bundle.
     * @param contactSchedule Contact multiplier kappa(day); null means constant 1.
     */
    TransitionRuleSet(const ParameterBundle& params,
                      std::shared_ptr<IInterventionSchedule> contactSchedule = nullptr);

    /**
     * @brief Advances one province by one day.
     *
     * Only `province` and `rng` are touched, so distinct provinces may be
     * processed concurrently.
     *
     * @param province [in,out] State at the end of day - 1, replaced by the state at the end of `day`.
     * @param day [in] Day being simulated.
     * @param rng [in,out] The province's random sub-stream.
     * @return TransitionTally Transition counts of the day.
     */
    TransitionTally apply(ProvinceState& province, int day, RandomStream& rng) const;

    /**
     * @brief Daily probability that one susceptible of a behavior class becomes exposed.
     *
     * @param infectious Non-isolated infectious individuals (I) in the province.
     * @param isolated Isolated symptomatic individuals (J3 + J4) in the province.
     * @param population Living population of the province.
     * @param behaviorClass Index of the susceptible's behavior class.
     * @param day Simulated day, used for the contact schedule.
     */
    double exposureProbability(long infectious, long isolated, long population,
                               int behaviorClass, int day) const;

    /**
     * @brief Clamped, normalized outgoing probabilities of one cell.
     * @param exposure Exposure probability of the cell's class, used for S only.
     */
    OutcomeProbabilities outcomeProbabilities(Compartment c, CareStatus care, int behaviorClass,
                                              int dwell, double exposure) const;

    /**
     * @brief Draw order of the outcomes for a province.
     *
     * Compartments by increasing start-of-day total, ties by declaration
     * order, Deceased last.
     */
    static OutcomeOrder priorityOrder(const std::array<long, NUM_COMPARTMENTS>& frozenTotals);

    /** @brief Whether the dwell-gated exits of a compartment are open after `dwell` completed days. */
    bool exitOpen(Compartment c, int dwell) const;

private:
    struct CellOutcome {
        Compartment compartment;
        CareStatus care;
        int behaviorClass;
        int dwell;
        long count;
        std::array<long, NUM_OUTCOMES> moves;
        std::array<long, NUM_OUTCOMES> unbedded;
    };

    TransitionProbabilities probabilities_;
    DwellTimes dwell_;
    BehaviorCoefficients behavior_;
    std::vector<BehaviorClass> classes_;
    BlockedAdmissionPolicy policy_;
    double untreatedMortalityMultiplier_;
    bool waningImmunity_;
    std::shared_ptr<IInterventionSchedule> contactSchedule_;

    static void drawMultinomial(long n, const OutcomeProbabilities& probs, const OutcomeOrder& order,
                                RandomStream& rng, std::array<long, NUM_OUTCOMES>& moves);

    void resolveRequests(std::vector<CellOutcome>& outcomes, Compartment source, CareStatus care,
                         Compartment destination, ProvinceState& province, TransitionTally& tally) const;
};

} // namespace pmsim

#endif // PMSIM_TRANSITION_RULE_SET_HPP
