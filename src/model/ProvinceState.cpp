#include "pmsim/model/ProvinceState.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include <utility>

namespace pmsim {

ProvinceState::ProvinceState(int id, std::string label, long hospitalCapacity, long icuCapacity,
                             int numBehaviorClasses, int maxDwell)
    : id_(id),
      label_(std::move(label)),
      numClasses_(numBehaviorClasses),
      maxDwell_(maxDwell),
      resources_(id, hospitalCapacity, icuCapacity) {
    if (numBehaviorClasses < 1) {
        PMSIM_THROW_INVALID_PARAM("ProvinceState", "At least one behavior class is required.");
    }
    if (maxDwell < 0) {
        PMSIM_THROW_INVALID_PARAM("ProvinceState", "Dwell cap must be non-negative.");
    }
    cells_ = CohortVector::Zero(static_cast<Eigen::Index>(NUM_COMPARTMENTS) * NUM_CARE_STATUSES * blockSize());
}

Eigen::Index ProvinceState::cellIndex(Compartment c, CareStatus care, int behaviorClass, int dwell) const {
    if (behaviorClass < 0 || behaviorClass >= numClasses_) {
        PMSIM_THROW_OUT_OF_RANGE("ProvinceState::cellIndex", "Behavior class " + std::to_string(behaviorClass) + " out of range.");
    }
    if (dwell < 0 || dwell > maxDwell_) {
        PMSIM_THROW_OUT_OF_RANGE("ProvinceState::cellIndex", "Dwell " + std::to_string(dwell) + " out of range.");
    }
    return blockStart(c, care) + static_cast<Eigen::Index>(behaviorClass) * (maxDwell_ + 1) + dwell;
}

long ProvinceState::count(Compartment c, CareStatus care, int behaviorClass, int dwell) const {
    return cells_(cellIndex(c, care, behaviorClass, dwell));
}

void ProvinceState::add(Compartment c, CareStatus care, int behaviorClass, int dwell, long delta) {
    cells_(cellIndex(c, care, behaviorClass, dwell)) += delta;
}

long ProvinceState::compartmentTotal(Compartment c, CareStatus care) const {
    return cells_.segment(blockStart(c, care), blockSize()).sum();
}

long ProvinceState::compartmentTotal(Compartment c) const {
    return compartmentTotal(c, CareStatus::Bedded) + compartmentTotal(c, CareStatus::Unbedded);
}

std::array<long, NUM_COMPARTMENTS> ProvinceState::compartmentTotals() const {
    std::array<long, NUM_COMPARTMENTS> totals{};
    for (Compartment c : allCompartments()) {
        totals[index(c)] = compartmentTotal(c);
    }
    return totals;
}

long ProvinceState::classTotal(Compartment c, int behaviorClass) const {
    long total = 0;
    for (int care = 0; care < NUM_CARE_STATUSES; ++care) {
        const Eigen::Index start = cellIndex(c, static_cast<CareStatus>(care), behaviorClass, 0);
        total += cells_.segment(start, maxDwell_ + 1).sum();
    }
    return total;
}

long ProvinceState::activeInfections() const {
    return compartmentTotal(Compartment::E) + compartmentTotal(Compartment::I) +
           compartmentTotal(Compartment::J3) + compartmentTotal(Compartment::J4);
}

} // namespace pmsim
