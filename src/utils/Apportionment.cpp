#include "pmsim/utils/Apportionment.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace pmsim {

std::vector<long> apportionLargestRemainder(long total, const std::vector<double>& weights) {
    std::vector<long> shares(weights.size(), 0);
    if (total < 0) {
        PMSIM_THROW_INVALID_PARAM("apportionLargestRemainder", "Total must be non-negative.");
    }
    double weight_sum = 0.0;
    for (double w : weights) {
        if (!(w >= 0.0)) {
            PMSIM_THROW_INVALID_PARAM("apportionLargestRemainder", "Weights must be non-negative.");
        }
        weight_sum += w;
    }
    if (total == 0) return shares;
    if (weight_sum <= 0.0) {
        PMSIM_THROW_INVALID_PARAM("apportionLargestRemainder", "Cannot split a positive total over zero weights.");
    }

    std::vector<double> remainders(weights.size(), 0.0);
    long assigned = 0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        const double quota = static_cast<double>(total) * weights[i] / weight_sum;
        shares[i] = std::min(total - assigned, static_cast<long>(std::floor(quota)));
        remainders[i] = quota - static_cast<double>(shares[i]);
        assigned += shares[i];
    }

    std::vector<std::size_t> order(weights.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&remainders](std::size_t a, std::size_t b) { return remainders[a] > remainders[b]; });

    for (std::size_t k = 0; assigned < total; k = (k + 1) % order.size()) {
        if (weights[order[k]] > 0.0) {
            ++shares[order[k]];
            ++assigned;
        }
    }
    return shares;
}

} // namespace pmsim
