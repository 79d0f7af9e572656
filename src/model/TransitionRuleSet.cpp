#include "pmsim/model/TransitionRuleSet.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include "pmsim/utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace pmsim {

TransitionTally& TransitionTally::operator+=(const TransitionTally& other) {
    new_exposures += other.new_exposures;
    new_infectious += other.new_infectious;
    new_symptomatic += other.new_symptomatic;
    new_recoveries += other.new_recoveries;
    new_deaths += other.new_deaths;
    waned += other.waned;
    new_vaccinations += other.new_vaccinations;
    for (int s = 0; s < NUM_SEVERITIES; ++s) {
        admissions[s] += other.admissions[s];
        excess_demand[s] += other.excess_demand[s];
    }
    return *this;
}

TransitionRuleSet::TransitionRuleSet(const ParameterBundle& params,
                                     std::shared_ptr<IInterventionSchedule> contactSchedule)
    : probabilities_(params.transitions),
      dwell_(params.dwell),
      behavior_(params.behavior),
      classes_(params.behavior_classes),
      policy_(params.blocked_admission_policy),
      untreatedMortalityMultiplier_(params.untreated_mortality_multiplier),
      waningImmunity_(params.waning_immunity),
      contactSchedule_(std::move(contactSchedule)) {
    if (classes_.empty()) {
        PMSIM_THROW_INVALID_PARAM("TransitionRuleSet", "At least one behavior class is required.");
    }
}

double TransitionRuleSet::exposureProbability(long infectious, long isolated, long population,
                                              int behaviorClass, int day) const {
    if (behaviorClass < 0 || behaviorClass >= static_cast<int>(classes_.size())) {
        PMSIM_THROW_OUT_OF_RANGE("TransitionRuleSet::exposureProbability",
                                 "Behavior class " + std::to_string(behaviorClass) + " out of range.");
    }
    if (population <= 0) return 0.0;

    const double effective = static_cast<double>(infectious) +
                             behavior_.isolated_infectiousness * static_cast<double>(isolated);
    if (effective <= 0.0) return 0.0;

    const BehaviorClass& bc = classes_[behaviorClass];
    const double n = static_cast<double>(population);
    const double kappa = contactSchedule_ ? contactSchedule_->getFactor(day) : 1.0;
    const double caution = behavior_.behavior_trigger
        ? 1.0 / (1.0 + behavior_.caution_sensitivity * static_cast<double>(infectious + isolated) / n)
        : 1.0;
    const double vaccine = bc.vaccinated ? 1.0 - behavior_.vaccine_infection_discount : 1.0;

    double q = probabilities_.beta * kappa * caution *
               (1.0 - behavior_.prudence_discount * bc.prudence) * vaccine / n;
    q = std::clamp(q, 0.0, 1.0);
    return std::clamp(1.0 - std::pow(1.0 - q, effective), 0.0, 1.0);
}

bool TransitionRuleSet::exitOpen(Compartment c, int dwell) const {
    // `dwell` counts completed days; today is day dwell + 1 in the compartment.
    const int day_in_compartment = dwell + 1;
    switch (c) {
        case Compartment::E:  return day_in_compartment >= dwell_.incubation_min_days;
        case Compartment::I:  return day_in_compartment >= dwell_.infectious_min_days;
        case Compartment::J3:
        case Compartment::J4: return day_in_compartment >= dwell_.hospital_min_days;
        case Compartment::R:  return waningImmunity_ && day_in_compartment >= dwell_.immunity_min_days;
        case Compartment::S:  return true;
    }
    return false;
}

TransitionRuleSet::OutcomeProbabilities TransitionRuleSet::outcomeProbabilities(
    Compartment c, CareStatus care, int behaviorClass, int dwell, double exposure) const {

    OutcomeProbabilities p{};
    const BehaviorClass& bc = classes_.at(behaviorClass);
    const bool open = exitOpen(c, dwell);
    const double death_multiplier = (care == CareStatus::Unbedded) ? untreatedMortalityMultiplier_ : 1.0;

    switch (c) {
        case Compartment::S:
            p[index(Compartment::E)] = exposure;
            break;
        case Compartment::E:
            if (open) p[index(Compartment::I)] = probabilities_.p_E_I;
            break;
        case Compartment::I:
            if (open) {
                const double severe_share = probabilities_.severe_fraction *
                    (bc.vaccinated ? 1.0 - behavior_.vaccine_severity_discount : 1.0);
                p[index(Compartment::J4)] = probabilities_.p_symptoms * severe_share;
                p[index(Compartment::J3)] = probabilities_.p_symptoms * (1.0 - severe_share);
                p[index(Compartment::R)] = probabilities_.p_I_R;
            }
            break;
        case Compartment::J3:
            if (open) p[index(Compartment::R)] = probabilities_.p_J3_R;
            p[index(Compartment::J4)] = probabilities_.p_J3_J4;
            p[DECEASED] = probabilities_.p_J3_D * death_multiplier;
            break;
        case Compartment::J4:
            if (open) p[index(Compartment::R)] = probabilities_.p_J4_R;
            p[DECEASED] = probabilities_.p_J4_D * death_multiplier;
            break;
        case Compartment::R:
            if (open) p[index(Compartment::S)] = probabilities_.waning_rate;
            break;
    }

    double total = 0.0;
    for (double& value : p) {
        value = std::clamp(value, 0.0, 1.0);
        total += value;
    }
    if (total > 1.0) {
        for (double& value : p) {
            value /= total;
        }
    }
    return p;
}

TransitionRuleSet::OutcomeOrder TransitionRuleSet::priorityOrder(const std::array<long, NUM_COMPARTMENTS>& frozenTotals) {
    OutcomeOrder order{};
    std::iota(order.begin(), order.begin() + NUM_COMPARTMENTS, 0);
    std::stable_sort(order.begin(), order.begin() + NUM_COMPARTMENTS,
                     [&frozenTotals](int a, int b) { return frozenTotals[a] < frozenTotals[b]; });
    order[DECEASED] = DECEASED;
    return order;
}

void TransitionRuleSet::drawMultinomial(long n, const OutcomeProbabilities& probs, const OutcomeOrder& order,
                                        RandomStream& rng, std::array<long, NUM_OUTCOMES>& moves) {
    moves.fill(0);
    long remaining = n;
    double remaining_probability = 1.0;
    for (int k : order) {
        if (remaining == 0) break;
        const double p = probs[k];
        if (p <= 0.0) continue;
        double conditional = 1.0;
        if (remaining_probability - p > constants::NUMERICAL_EPSILON) {
            conditional = std::min(1.0, p / remaining_probability);
        }
        const long drawn = rng.binomial(remaining, conditional);
        moves[k] = drawn;
        remaining -= drawn;
        remaining_probability -= p;
    }
}

void TransitionRuleSet::resolveRequests(std::vector<CellOutcome>& outcomes, Compartment source, CareStatus care,
                                        Compartment destination, ProvinceState& province,
                                        TransitionTally& tally) const {
    const Severity severity = *severityOf(destination);
    const int dest = index(destination);
    // A bedded J3 moving to J4 gives its hospital bed back once it leaves.
    const bool holds_hospital_bed = (source == Compartment::J3 && care == CareStatus::Bedded);
    ResourcePool& pool = province.resources();

    long refused_total = 0;
    for (auto& o : outcomes) {
        if (o.compartment != source || o.care != care) continue;
        const long requested = o.moves[dest];
        if (requested == 0) continue;

        const long granted = pool.admitUpTo(severity, requested);
        const long refused = requested - granted;
        tally.admissions[index(severity)] += granted;

        long leaving_bed = granted;
        if (refused > 0) {
            if (policy_ == BlockedAdmissionPolicy::Block) {
                o.moves[dest] -= refused;
            } else {
                o.unbedded[dest] += refused;
                leaving_bed += refused;
            }
            refused_total += refused;
        }
        if (holds_hospital_bed && leaving_bed > 0) {
            pool.release(Severity::Hospital, leaving_bed);
        }
    }

    if (refused_total > 0) {
        tally.excess_demand[index(severity)] += refused_total;
        province.addExcessDemand(severity, refused_total);
        Logger& logger = Logger::getInstance();
        if (logger.isEnabled(LogLevel::DEBUG)) {
            logger.debug("TransitionRuleSet::apply",
                         "Province " + std::to_string(province.getId()) + " " + toString(severity) +
                         " capacity saturated: " + std::to_string(refused_total) + " " + toString(source) +
                         " -> " + toString(destination) + " admissions refused (" + toString(policy_) + ").");
        }
    }
}

TransitionTally TransitionRuleSet::apply(ProvinceState& province, int day, RandomStream& rng) const {
    TransitionTally tally;
    if (province.numBehaviorClasses() != static_cast<int>(classes_.size())) {
        PMSIM_THROW_INVALID_PARAM("TransitionRuleSet::apply", "Province layout does not match the behavior classes.");
    }

    const CohortVector frozen = province.cells();
    const std::array<long, NUM_COMPARTMENTS> totals = province.compartmentTotals();
    const long population = frozen.sum();
    const OutcomeOrder order = priorityOrder(totals);
    const int num_classes = province.numBehaviorClasses();
    const int cap = province.maxDwell();

    std::vector<double> exposure(num_classes, 0.0);
    for (int b = 0; b < num_classes; ++b) {
        exposure[b] = exposureProbability(totals[index(Compartment::I)],
                                          totals[index(Compartment::J3)] + totals[index(Compartment::J4)],
                                          population, b, day);
    }

    std::vector<CellOutcome> outcomes;
    for (Compartment c : allCompartments()) {
        for (int care = 0; care < NUM_CARE_STATUSES; ++care) {
            const CareStatus status = static_cast<CareStatus>(care);
            for (int b = 0; b < num_classes; ++b) {
                for (int d = 0; d <= cap; ++d) {
                    const long n = frozen(province.cellIndex(c, status, b, d));
                    if (n == 0) continue;
                    CellOutcome o{c, status, b, d, n, {}, {}};
                    drawMultinomial(n, outcomeProbabilities(c, status, b, d, exposure[b]), order, rng, o.moves);
                    outcomes.push_back(o);
                }
            }
        }
    }

    ResourcePool& pool = province.resources();
    for (const auto& o : outcomes) {
        if (o.care != CareStatus::Bedded) continue;
        const long exits = o.moves[index(Compartment::R)] + o.moves[DECEASED];
        if (o.compartment == Compartment::J3 && exits > 0) pool.release(Severity::Hospital, exits);
        if (o.compartment == Compartment::J4 && exits > 0) pool.release(Severity::ICU, exits);
    }
    resolveRequests(outcomes, Compartment::J3, CareStatus::Bedded, Compartment::J4, province, tally);
    resolveRequests(outcomes, Compartment::J3, CareStatus::Unbedded, Compartment::J4, province, tally);
    resolveRequests(outcomes, Compartment::I, CareStatus::Bedded, Compartment::J4, province, tally);
    resolveRequests(outcomes, Compartment::I, CareStatus::Bedded, Compartment::J3, province, tally);

    CohortVector next = CohortVector::Zero(frozen.size());
    for (const auto& o : outcomes) {
        long moved = 0;
        for (int k = 0; k < NUM_COMPARTMENTS; ++k) {
            const long arrivals = o.moves[k];
            if (arrivals == 0) continue;
            const Compartment dest = static_cast<Compartment>(k);
            const long unbedded = o.unbedded[k];
            next(province.cellIndex(dest, CareStatus::Bedded, o.behaviorClass, 0)) += arrivals - unbedded;
            if (unbedded > 0) {
                next(province.cellIndex(dest, CareStatus::Unbedded, o.behaviorClass, 0)) += unbedded;
            }
            moved += arrivals;
        }
        moved += o.moves[DECEASED];
        next(province.cellIndex(o.compartment, o.care, o.behaviorClass, std::min(o.dwell + 1, cap))) += o.count - moved;

        switch (o.compartment) {
            case Compartment::S:
                tally.new_exposures += o.moves[index(Compartment::E)];
                break;
            case Compartment::E:
                tally.new_infectious += o.moves[index(Compartment::I)];
                break;
            case Compartment::I:
                tally.new_symptomatic += o.moves[index(Compartment::J3)] + o.moves[index(Compartment::J4)];
                break;
            case Compartment::R:
                tally.waned += o.moves[index(Compartment::S)];
                break;
            default:
                break;
        }
        tally.new_recoveries += o.moves[index(Compartment::R)];
        tally.new_deaths += o.moves[DECEASED];
    }

    province.cells() = next;
    province.addDeaths(tally.new_deaths);
    return tally;
}

} // namespace pmsim
