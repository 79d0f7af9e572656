#include "pmsim/model/VaccinationCampaign.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include <algorithm>
#include <cmath>

namespace pmsim {

VaccinationCampaign::VaccinationCampaign(const std::vector<BehaviorClass>& classes,
                                         const VaccinationSettings& settings)
    : settings_(settings) {
    if (settings_.threshold <= 0.0) {
        PMSIM_THROW_INVALID_PARAM("VaccinationCampaign", "Vaccination threshold must be positive.");
    }

    int first_vaccinated = -1;
    for (std::size_t b = 0; b < classes.size(); ++b) {
        vaccinated_.push_back(classes[b].vaccinated);
        if (classes[b].vaccinated && first_vaccinated < 0) {
            first_vaccinated = static_cast<int>(b);
        }
    }
    if (settings_.enabled() && first_vaccinated < 0) {
        PMSIM_THROW_INVALID_PARAM("VaccinationCampaign", "No vaccinated behavior class to move susceptibles into.");
    }

    pairs_.assign(classes.size(), -1);
    for (std::size_t b = 0; b < classes.size(); ++b) {
        if (classes[b].vaccinated) continue;
        pairs_[b] = first_vaccinated;
        for (std::size_t v = 0; v < classes.size(); ++v) {
            if (classes[v].vaccinated && classes[v].prudence == classes[b].prudence) {
                pairs_[b] = static_cast<int>(v);
                break;
            }
        }
    }
}

double VaccinationCampaign::willingness(double prevalence) const {
    const double x = std::max(prevalence, 0.0) / settings_.threshold;
    return 1.0 + (x * x) / (1.0 + x * x);
}

double VaccinationCampaign::uptakeProbability(double prevalence) const {
    const double acceptance = 1.0 - 1.0 / (2.0 * willingness(prevalence));
    return std::clamp(settings_.coverage * acceptance, 0.0, 1.0);
}

long VaccinationCampaign::apply(ProvinceState& province, RandomStream& rng) const {
    if (!isEnabled()) return 0;

    const long living = province.livingPopulation();
    if (living <= 0) return 0;

    const int num_classes = province.numBehaviorClasses();
    long already_vaccinated = 0;
    for (int b = 0; b < num_classes; ++b) {
        if (!vaccinated_[b]) continue;
        for (Compartment c : allCompartments()) {
            already_vaccinated += province.classTotal(c, b);
        }
    }
    long doses = static_cast<long>(std::floor(settings_.coverage * static_cast<double>(living))) - already_vaccinated;
    if (doses <= 0) return 0;

    const long infected = province.compartmentTotal(Compartment::I) +
                          province.compartmentTotal(Compartment::J3) +
                          province.compartmentTotal(Compartment::J4);
    const double p = uptakeProbability(static_cast<double>(infected) / static_cast<double>(living));

    long vaccinated = 0;
    for (int b = 0; b < num_classes && doses > 0; ++b) {
        const int target = pairs_[b];
        if (target < 0) continue;
        for (int d = 0; d <= province.maxDwell() && doses > 0; ++d) {
            const long n = province.count(Compartment::S, CareStatus::Bedded, b, d);
            const long k = std::min(rng.binomial(n, p), doses);
            if (k == 0) continue;
            province.add(Compartment::S, CareStatus::Bedded, b, d, -k);
            province.add(Compartment::S, CareStatus::Bedded, target, d, k);
            doses -= k;
            vaccinated += k;
        }
    }
    return vaccinated;
}

} // namespace pmsim
