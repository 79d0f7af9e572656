#include "pmsim/model/parameters/ParameterBundle.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <cmath>
#include <set>
#include <utility>

namespace pmsim {

namespace {

    const char* const VALIDATE = "ParameterBundle::validate";

    void requireProbability(double value, const std::string& field) {
        if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
            PMSIM_THROW_CONFIG_ERROR(VALIDATE, field, "must be in [0, 1], got " + std::to_string(value) + ".");
        }
    }

    void requireNonNegative(double value, const std::string& field) {
        if (!std::isfinite(value) || value < 0.0) {
            PMSIM_THROW_CONFIG_ERROR(VALIDATE, field, "must be non-negative, got " + std::to_string(value) + ".");
        }
    }

    void validateSchedule(const std::vector<SchedulePoint>& points, const std::string& field) {
        int previous_day = -1;
        for (const auto& point : points) {
            if (point.start_day < 0 || point.start_day <= previous_day) {
                PMSIM_THROW_CONFIG_ERROR(VALIDATE, field, "start days must be non-negative and strictly increasing.");
            }
            requireNonNegative(point.factor, field);
            previous_day = point.start_day;
        }
    }

} // namespace

void ParameterBundle::validate() const {
    if (provinces.empty()) {
        PMSIM_THROW_CONFIG_ERROR(VALIDATE, "provinces", "at least one province is required.");
    }

    for (std::size_t i = 0; i < provinces.size(); ++i) {
        const ProvinceConfig& p = provinces[i];
        const std::string field = "provinces[" + std::to_string(i) + "]";
        if (p.population < 0) {
            PMSIM_THROW_CONFIG_ERROR(VALIDATE, field + ".population", "must be non-negative.");
        }
        // Binomial draws take an unsigned int count.
        if (static_cast<unsigned long>(p.population) > UINT_MAX) {
            PMSIM_THROW_CONFIG_ERROR(VALIDATE, field + ".population", "exceeds " + std::to_string(UINT_MAX) + ".");
        }
        if (p.hospital_capacity < 0) {
            PMSIM_THROW_CONFIG_ERROR(VALIDATE, field + ".hospital_capacity", "must be non-negative.");
        }
        if (p.icu_capacity < 0) {
            PMSIM_THROW_CONFIG_ERROR(VALIDATE, field + ".icu_capacity", "must be non-negative.");
        }
        if (p.initial_exposed < 0 || p.initial_infectious < 0 || p.initial_recovered < 0) {
            PMSIM_THROW_CONFIG_ERROR(VALIDATE, field + ".initial", "initial E, I and R must be non-negative.");
        }
        if (p.initial_exposed + p.initial_infectious + p.initial_recovered > p.population) {
            PMSIM_THROW_CONFIG_ERROR(VALIDATE, field + ".initial",
                                     "initial E + I + R (" +
                                     std::to_string(p.initial_exposed + p.initial_infectious + p.initial_recovered) +
                                     ") exceeds population (" + std::to_string(p.population) + ").");
        }
    }

    const int n = numProvinces();
    std::vector<double> outgoing(provinces.size(), 0.0);
    std::set<std::pair<int, int>> seen;
    for (std::size_t k = 0; k < mobility_edges.size(); ++k) {
        const MobilityEdge& e = mobility_edges[k];
        const std::string field = "mobility_edges[" + std::to_string(k) + "]";
        if (e.from < 0 || e.from >= n || e.to < 0 || e.to >= n) {
            PMSIM_THROW_CONFIG_ERROR(VALIDATE, field, "references unknown province (" +
                                     std::to_string(e.from) + " -> " + std::to_string(e.to) + ").");
        }
        if (e.from == e.to) {
            PMSIM_THROW_CONFIG_ERROR(VALIDATE, field, "self-edges are not allowed.");
        }
        if (!seen.insert({e.from, e.to}).second) {
            PMSIM_THROW_CONFIG_ERROR(VALIDATE, field, "duplicate edge " +
                                     std::to_string(e.from) + " -> " + std::to_string(e.to) + ".");
        }
        requireProbability(e.weight, field + ".weight");
        outgoing[e.from] += e.weight;
    }
    for (std::size_t i = 0; i < outgoing.size(); ++i) {
        if (outgoing[i] > 1.0 + constants::NUMERICAL_EPSILON) {
            PMSIM_THROW_CONFIG_ERROR(VALIDATE, "mobility_edges",
                                     "outgoing weights of province " + std::to_string(i) + " sum above 1.");
        }
    }

    if (behavior_classes.empty()) {
        PMSIM_THROW_CONFIG_ERROR(VALIDATE, "behavior_classes", "at least one behavior class is required.");
    }
    if (static_cast<unsigned long>(totalPopulation()) > UINT_MAX) {
        PMSIM_THROW_CONFIG_ERROR(VALIDATE, "provinces",
                                 "total population " + std::to_string(totalPopulation()) + " exceeds " +
                                 std::to_string(UINT_MAX) + "; mobility could gather it in one cell.");
    }

    double fraction_sum = 0.0;
    for (std::size_t b = 0; b < behavior_classes.size(); ++b) {
        const BehaviorClass& bc = behavior_classes[b];
        const std::string field = "behavior_classes[" + std::to_string(b) + "]";
        requireProbability(bc.fraction, field + ".fraction");
        requireProbability(bc.prudence, field + ".prudence");
        fraction_sum += bc.fraction;
    }
    if (std::abs(fraction_sum - 1.0) > constants::FRACTION_SUM_TOLERANCE) {
        PMSIM_THROW_CONFIG_ERROR(VALIDATE, "behavior_classes",
                                 "fractions must sum to 1, got " + std::to_string(fraction_sum) + ".");
    }

    requireNonNegative(transitions.beta, "beta");
    requireProbability(transitions.p_E_I, "p_E_I");
    requireProbability(transitions.p_symptoms, "p_symptoms");
    requireProbability(transitions.severe_fraction, "severe_fraction");
    requireProbability(transitions.p_I_R, "p_I_R");
    requireProbability(transitions.p_J3_R, "p_J3_R");
    requireProbability(transitions.p_J3_J4, "p_J3_J4");
    requireProbability(transitions.p_J3_D, "p_J3_D");
    requireProbability(transitions.p_J4_R, "p_J4_R");
    requireProbability(transitions.p_J4_D, "p_J4_D");
    requireProbability(transitions.waning_rate, "waning_rate");

    if (dwell.incubation_min_days < 0) {
        PMSIM_THROW_CONFIG_ERROR(VALIDATE, "incubation_min_days", "must be non-negative.");
    }
    if (dwell.infectious_min_days < 0) {
        PMSIM_THROW_CONFIG_ERROR(VALIDATE, "infectious_min_days", "must be non-negative.");
    }
    if (dwell.hospital_min_days < 0) {
        PMSIM_THROW_CONFIG_ERROR(VALIDATE, "hospital_min_days", "must be non-negative.");
    }
    if (dwell.immunity_min_days < 0) {
        PMSIM_THROW_CONFIG_ERROR(VALIDATE, "immunity_min_days", "must be non-negative.");
    }

    requireProbability(behavior.prudence_discount, "prudence_discount");
    requireProbability(behavior.vaccine_infection_discount, "vaccine_infection_discount");
    requireProbability(behavior.vaccine_severity_discount, "vaccine_severity_discount");
    requireNonNegative(behavior.caution_sensitivity, "caution_sensitivity");
    requireProbability(behavior.isolated_infectiousness, "isolated_infectiousness");

    requireProbability(vaccination.coverage, "vaccine_coverage");
    if (!std::isfinite(vaccination.threshold) || vaccination.threshold <= 0.0) {
        PMSIM_THROW_CONFIG_ERROR(VALIDATE, "vaccination_threshold",
                                 "must be positive, got " + std::to_string(vaccination.threshold) + ".");
    }
    if (vaccination.enabled() &&
        std::none_of(behavior_classes.begin(), behavior_classes.end(),
                     [](const BehaviorClass& bc) { return bc.vaccinated; })) {
        PMSIM_THROW_CONFIG_ERROR(VALIDATE, "vaccine_coverage",
                                 "a vaccination campaign needs at least one vaccinated behavior class.");
    }

    if (max_days <= 0) {
        PMSIM_THROW_CONFIG_ERROR(VALIDATE, "max_days", "must be positive, got " + std::to_string(max_days) + ".");
    }
    requireNonNegative(untreated_mortality_multiplier, "untreated_mortality_multiplier");

    if (movable_compartments[index(Compartment::J3)] || movable_compartments[index(Compartment::J4)]) {
        PMSIM_THROW_CONFIG_ERROR(VALIDATE, "movable_compartments", "J3 and J4 cannot move.");
    }

    validateSchedule(contact_schedule, "contact_schedule");
    validateSchedule(mobility_schedule, "mobility_schedule");
}

long ParameterBundle::totalPopulation() const {
    long total = 0;
    for (const auto& p : provinces) {
        total += p.population;
    }
    return total;
}

int ParameterBundle::maxDwell() const {
    int cap = std::max({dwell.incubation_min_days, dwell.infectious_min_days, dwell.hospital_min_days});
    if (waning_immunity) {
        cap = std::max(cap, dwell.immunity_min_days);
    }
    return cap;
}

std::string toString(BlockedAdmissionPolicy policy) {
    return policy == BlockedAdmissionPolicy::Block ? "block" : "degrade";
}

BlockedAdmissionPolicy blockedAdmissionPolicyFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lower == "block") return BlockedAdmissionPolicy::Block;
    if (lower == "degrade") return BlockedAdmissionPolicy::Degrade;
    PMSIM_THROW_INVALID_PARAM("blockedAdmissionPolicyFromString",
                              "Unknown blocked admission policy '" + name + "' (expected block or degrade).");
}

} // namespace pmsim
