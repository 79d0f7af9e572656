#ifndef PMSIM_APPORTIONMENT_HPP
#define PMSIM_APPORTIONMENT_HPP

#include <vector>

namespace pmsim {

/**
 * @brief Splits an integer total proportionally to non-negative weights.
 *
 * Largest-remainder (Hamilton) method: every share gets the floor of its
 * quota, the leftover units go to the largest fractional parts, ties to the
 * lower index. The result always sums to `total`.
 *
 * @param total [in] Non-negative amount to split.
 * @param weights [in] Non-negative weights, at least one of them positive when total > 0.
 * @return std::vector<long> One share per weight.
 * @throws InvalidParameterException for negative input or all-zero weights with total > 0.
 */
std::vector<long> apportionLargestRemainder(long total, const std::vector<double>& weights);

} // namespace pmsim

#endif // PMSIM_APPORTIONMENT_HPP
