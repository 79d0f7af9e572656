#include "pmsim/model/ResourcePool.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include "pmsim/exceptions/InvariantViolationException.hpp"
#include <algorithm>
#include <string>

namespace pmsim {

ResourcePool::ResourcePool(int provinceId, long hospitalCapacity, long icuCapacity)
    : provinceId_(provinceId),
      capacity_{{hospitalCapacity, icuCapacity}},
      occupied_{{0, 0}} {
    if (hospitalCapacity < 0 || icuCapacity < 0) {
        PMSIM_THROW_INVALID_PARAM("ResourcePool", "Capacities must be non-negative.");
    }
}

bool ResourcePool::admit(Severity severity) {
    return admitUpTo(severity, 1) == 1;
}

long ResourcePool::admitUpTo(Severity severity, long requested) {
    if (requested <= 0) return 0;
    const long granted = std::min(requested, available(severity));
    occupied_[index(severity)] += granted;
    return granted;
}

void ResourcePool::release(Severity severity, long count) {
    if (count < 0 || count > occupied(severity)) {
        throw InvariantViolationException(
            "ResourcePool::release", "occupancy_bounds", InvariantViolationException::UNKNOWN_DAY, provinceId_,
            "releasing " + std::to_string(count) + " " + toString(severity) + " beds with " +
            std::to_string(occupied(severity)) + " occupied");
    }
    occupied_[index(severity)] -= count;
}

} // namespace pmsim
