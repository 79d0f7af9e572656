#ifndef PMSIM_RESOURCE_POOL_HPP
#define PMSIM_RESOURCE_POOL_HPP

#include "pmsim/model/Compartment.hpp"
#include <array>

namespace pmsim {

/**
 * @class ResourcePool
 * @brief Finite hospital and ICU capacity of one province.
 *
 * Maintains 0 <= occupied <= capacity for both bed classes. Admission never
 * fails loudly: a refused request is reported through the return value and
 * resolved by the caller's blocked-admission policy.
 */
class ResourcePool {
public:
    /**
     * @param provinceId Index of the owning province (used in diagnostics).
     * @param hospitalCapacity Number of hospital beds, non-negative.
     * @param icuCapacity Number of ICU beds, non-negative.
     * @throws InvalidParameterException for negative capacities.
     */
    ResourcePool(int provinceId, long hospitalCapacity, long icuCapacity);

    /**
     * @brief Reserves one bed of the given class.
     * @return bool True if a bed was free and is now occupied.
     */
    bool admit(Severity severity);

    /**
     * @brief Reserves up to `requested` beds.
     * @return long Number of beds granted, `min(requested, available)`.
     */
    long admitUpTo(Severity severity, long requested);

    /**
     * @brief Frees `count` beds.
     * @throws InvariantViolationException if more beds are released than occupied.
     */
    void release(Severity severity, long count = 1);

    long occupied(Severity severity) const { return occupied_[index(severity)]; }
    long capacity(Severity severity) const { return capacity_[index(severity)]; }
    long available(Severity severity) const { return capacity(severity) - occupied(severity); }
    bool isSaturated(Severity severity) const { return available(severity) == 0; }

    int getProvinceId() const { return provinceId_; }

private:
    int provinceId_;
    std::array<long, NUM_SEVERITIES> capacity_;
    std::array<long, NUM_SEVERITIES> occupied_;
};

} // namespace pmsim

#endif // PMSIM_RESOURCE_POOL_HPP
