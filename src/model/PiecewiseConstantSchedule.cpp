#include "pmsim/model/PiecewiseConstantSchedule.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include <algorithm>
#include <iterator>

namespace pmsim {

PiecewiseConstantSchedule::PiecewiseConstantSchedule(
    const std::vector<SchedulePoint>& points,
    double baseline_factor,
    const std::string& name)
    : points_(points),
      baseline_factor_(baseline_factor),
      name_(name) {

    if (baseline_factor_ < 0.0) {
        PMSIM_THROW_INVALID_PARAM("PiecewiseConstantSchedule", name_ + ": baseline factor must be non-negative.");
    }

    int previous_day = -1;
    for (const auto& point : points_) {
        if (point.start_day < 0) {
            PMSIM_THROW_INVALID_PARAM("PiecewiseConstantSchedule", name_ + ": start days must be non-negative.");
        }
        if (point.start_day <= previous_day) {
            PMSIM_THROW_INVALID_PARAM("PiecewiseConstantSchedule", name_ + ": start days must be strictly increasing.");
        }
        if (point.factor < 0.0) {
            PMSIM_THROW_INVALID_PARAM("PiecewiseConstantSchedule", name_ + ": factors must be non-negative.");
        }
        previous_day = point.start_day;
    }
}

std::vector<SchedulePoint> PiecewiseConstantSchedule::windowPoints(int start_day, int duration, double factor,
                                                                   double baseline_factor) {
    if (duration <= 0) {
        PMSIM_THROW_INVALID_PARAM("PiecewiseConstantSchedule::windowPoints", "Window duration must be positive.");
    }
    return {SchedulePoint{start_day, factor}, SchedulePoint{start_day + duration, baseline_factor}};
}

double PiecewiseConstantSchedule::getFactor(int day) const {
    // First breakpoint starting after `day`; the one before it is in force.
    auto it = std::upper_bound(points_.begin(), points_.end(), day,
                               [](int d, const SchedulePoint& p) { return d < p.start_day; });
    if (it == points_.begin()) {
        return baseline_factor_;
    }
    return std::prev(it)->factor;
}

const std::vector<SchedulePoint>& PiecewiseConstantSchedule::getPoints() const {
    return points_;
}

double PiecewiseConstantSchedule::getBaselineFactor() const {
    return baseline_factor_;
}

} // namespace pmsim
