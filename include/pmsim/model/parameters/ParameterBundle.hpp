#ifndef PMSIM_PARAMETER_BUNDLE_HPP
#define PMSIM_PARAMETER_BUNDLE_HPP

#include "pmsim/model/Compartment.hpp"
#include "pmsim/model/ModelConstants.hpp"
#include "pmsim/model/interfaces/IInterventionSchedule.hpp"
#include <array>
#include <string>
#include <vector>

namespace pmsim {

/**
 * @struct ProvinceConfig
 * @brief Initial configuration of one province (membrane).
 */
struct ProvinceConfig {
    /** @brief Display label, e.g. "PV_1" */
    std::string label;

    /** @brief Initial total population */
    long population = 0;

    /** @brief Number of hospital beds */
    long hospital_capacity = 0;

    /** @brief Number of ICU beds */
    long icu_capacity = 0;

    /** @brief Initially exposed individuals */
    long initial_exposed = 0;

    /** @brief Initially infectious individuals */
    long initial_infectious = 0;

    /** @brief Initially recovered (immune) individuals */
    long initial_recovered = 0;
};

/** @brief Directed mobility edge: daily per-individual probability of moving `from` -> `to`. */
struct MobilityEdge {
    int from = 0;
    int to = 0;
    double weight = 0.0;
};

/**
 * @struct BehaviorClass
 * @brief Behavioral sub-population shared by every province.
 */
struct BehaviorClass {
    std::string name = "default";

    /** @brief Share of each province's initial population in this class */
    double fraction = 1.0;

    /** @brief Prudence in [0,1]; reduces exposure and movement of infectious individuals */
    double prudence = 0.0;

    bool vaccinated = false;
};

/** @brief What happens to an individual whose bed request is refused. */
enum class BlockedAdmissionPolicy {
    Block,   ///< Stay in the source compartment
    Degrade  ///< Enter the destination compartment without a bed
};

/**
 * @struct TransitionProbabilities
 * @brief Daily transition probabilities of the SEJIRS progression.
 */
struct TransitionProbabilities {
    /** @brief Transmission coefficient of the exposure term (not a probability) */
    double beta = constants::DEFAULT_BETA;

    /** @brief E -> I */
    double p_E_I = constants::DEFAULT_P_E_I;

    /** @brief I -> J3 or J4 (symptom development) */
    double p_symptoms = constants::DEFAULT_P_SYMPTOMS;

    /** @brief Share of symptom developments that go straight to J4 */
    double severe_fraction = constants::DEFAULT_SEVERE_FRACTION;

    /** @brief I -> R */
    double p_I_R = constants::DEFAULT_P_I_R;

    double p_J3_R = constants::DEFAULT_P_J3_R;
    double p_J3_J4 = constants::DEFAULT_P_J3_J4;
    double p_J3_D = constants::DEFAULT_P_J3_D;
    double p_J4_R = constants::DEFAULT_P_J4_R;
    double p_J4_D = constants::DEFAULT_P_J4_D;

    /** @brief R -> S when waning immunity is enabled */
    double waning_rate = constants::DEFAULT_WANING_RATE;
};

/**
 * @struct DwellTimes
 * @brief Minimum number of days spent in a compartment before the gated exits open.
 */
struct DwellTimes {
    int incubation_min_days = constants::DEFAULT_INCUBATION_MIN_DAYS;
    int infectious_min_days = constants::DEFAULT_INFECTIOUS_MIN_DAYS;
    int hospital_min_days = constants::DEFAULT_HOSPITAL_MIN_DAYS;
    int immunity_min_days = constants::DEFAULT_IMMUNITY_MIN_DAYS;
};

/**
 * @struct BehaviorCoefficients
 * @brief Coefficients of the behavioral response.
 */
struct BehaviorCoefficients {
    /** @brief Exposure reduction at prudence 1 */
    double prudence_discount = constants::DEFAULT_PRUDENCE_DISCOUNT;

    double vaccine_infection_discount = constants::DEFAULT_VACCINE_INFECTION_DISCOUNT;
    double vaccine_severity_discount = constants::DEFAULT_VACCINE_SEVERITY_DISCOUNT;

    /** @brief Whether local prevalence makes everybody more cautious */
    bool behavior_trigger = false;

    double caution_sensitivity = constants::DEFAULT_CAUTION_SENSITIVITY;

    /** @brief Relative infectiousness of isolated (J3/J4) individuals */
    double isolated_infectiousness = constants::DEFAULT_ISOLATED_INFECTIOUSNESS;
};

/**
 * @struct VaccinationSettings
 * @brief Daily vaccination campaign run after the transitions.
 *
 * Susceptibles of unvaccinated classes move to a paired vaccinated class
 * until the vaccinated share of the province reaches `coverage`.
 */
struct VaccinationSettings {
    /** @brief Target vaccinated share of each province, also the daily offer rate; 0 disables the campaign */
    double coverage = constants::DEFAULT_VACCINE_COVERAGE;

    /** @brief Reference prevalence (I + J3 + J4 over living) of the willingness curve */
    double threshold = constants::DEFAULT_VACCINATION_THRESHOLD;

    bool enabled() const { return coverage > 0.0; }
};

/**
 * @struct ParameterBundle
 * @brief Complete configuration of one simulation run.
 *
 * Plain data, filled by readParameterBundle() or programmatically. The
 * Simulation constructor calls validate() and keeps its own copy.
 */
struct ParameterBundle {
    std::vector<ProvinceConfig> provinces;

    std::vector<MobilityEdge> mobility_edges;

    std::vector<BehaviorClass> behavior_classes{BehaviorClass{}};

    TransitionProbabilities transitions;

    DwellTimes dwell;

    BehaviorCoefficients behavior;

    VaccinationSettings vaccination;

    /** @brief Last day simulated (days are numbered from 1) */
    int max_days = constants::DEFAULT_MAX_DAYS;

    unsigned long seed = constants::DEFAULT_SEED;

    /** @brief Enables R -> S */
    bool waning_immunity = false;

    BlockedAdmissionPolicy blocked_admission_policy = BlockedAdmissionPolicy::Block;

    /** @brief Death probability multiplier for J3/J4 individuals without a bed */
    double untreated_mortality_multiplier = constants::DEFAULT_UNTREATED_MORTALITY_MULTIPLIER;

    /** @brief Compartments subject to mobility, indexed by Compartment (default S and I) */
    std::array<bool, NUM_COMPARTMENTS> movable_compartments{{true, false, false, false, true, false}};

    /** @brief Contact rate multiplier kappa(day) */
    std::vector<SchedulePoint> contact_schedule;

    /** @brief Mobility weight multiplier */
    std::vector<SchedulePoint> mobility_schedule;

    /** @brief Evaluate provinces concurrently (OpenMP) */
    bool parallel_provinces = false;

    /**
     * @brief Validates every field.
     * @throws ConfigurationException naming the first offending field.
     */
    void validate() const;

    int numProvinces() const { return static_cast<int>(provinces.size()); }

    /** @brief Sum of the initial populations of all provinces. */
    long totalPopulation() const;

    /** @brief Cap of the days-in-compartment counter: the largest active minimum dwell. */
    int maxDwell() const;

    bool isMovable(Compartment c) const { return movable_compartments[index(c)]; }
};

std::string toString(BlockedAdmissionPolicy policy);

/**
 * @brief Parses "block" or "degrade" (case-insensitive).
 * @throws InvalidParameterException for other values.
 */
BlockedAdmissionPolicy blockedAdmissionPolicyFromString(const std::string& name);

} // namespace pmsim

#endif // PMSIM_PARAMETER_BUNDLE_HPP
