#ifndef PMSIM_VACCINATION_CAMPAIGN_HPP
#define PMSIM_VACCINATION_CAMPAIGN_HPP

#include "pmsim/model/ProvinceState.hpp"
#include "pmsim/model/RandomStream.hpp"
#include "pmsim/model/parameters/ParameterBundle.hpp"
#include <vector>

namespace pmsim {

/**
 * @class VaccinationCampaign
 * @brief Daily uptake of vaccination by susceptibles.
 *
 * Every unvaccinated behavior class is paired with a vaccinated class: the
 * first vaccinated class with the same prudence, otherwise the first
 * vaccinated class. Each day, every susceptible of an unvaccinated class
 * accepts a dose with probability
 *
 *     coverage * (1 - 1 / (2 w)),   w = 1 + x^2 / (1 + x^2),   x = f / threshold
 *
 * where f is the province prevalence (I + J3 + J4 over living). w is the
 * willingness, between 1 and 2, and 1 - 1/(2w) the chance that a willingness
 * weighted offer is taken up. Doses stop once the vaccinated share of the
 * province reaches `coverage`. Vaccinated individuals keep their dwell.
 */
class VaccinationCampaign {
public:
    /**
     * @param classes Behavior classes of the run.
     * @param settings Campaign settings; a zero coverage makes apply() a no-op.
     */
    VaccinationCampaign(const std::vector<BehaviorClass>& classes, const VaccinationSettings& settings);

    bool isEnabled() const { return settings_.enabled(); }

    /**
     * @brief Vaccinates the susceptibles of one province for one day.
     *
     * Touches only `province` and `rng`.
     *
     * @return long Number of individuals vaccinated.
     */
    long apply(ProvinceState& province, RandomStream& rng) const;

    /** @brief Willingness w in [1, 2] at prevalence `f`. */
    double willingness(double prevalence) const;

    /** @brief Daily probability that one eligible susceptible is vaccinated. */
    double uptakeProbability(double prevalence) const;

    /** @brief Vaccinated class paired with `behaviorClass`, or -1 for a vaccinated class. */
    int pairedClass(int behaviorClass) const { return pairs_.at(behaviorClass); }

private:
    VaccinationSettings settings_;
    std::vector<bool> vaccinated_;
    std::vector<int> pairs_;
};

} // namespace pmsim

#endif // PMSIM_VACCINATION_CAMPAIGN_HPP
