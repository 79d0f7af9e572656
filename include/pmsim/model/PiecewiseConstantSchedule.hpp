#ifndef PMSIM_PIECEWISE_CONSTANT_SCHEDULE_HPP
#define PMSIM_PIECEWISE_CONSTANT_SCHEDULE_HPP

#include "pmsim/model/interfaces/IInterventionSchedule.hpp"
#include "pmsim/model/ModelConstants.hpp"
#include <memory>
#include <string>
#include <vector>

namespace pmsim {

/**
 * @brief Intervention schedule with piecewise constant factors.
 *
 * Before the first breakpoint the baseline factor applies. From each
 * breakpoint's start day (inclusive) its factor applies until the next
 * breakpoint; the last factor holds until the end of the run.
 */
class PiecewiseConstantSchedule : public IInterventionSchedule {
public:
    /**
     * @brief Constructs a schedule.
     * @param points Breakpoints with strictly increasing, non-negative start days
     *               and non-negative factors.
     * @param baseline_factor Factor applied before the first breakpoint. Must be non-negative.
     * @param name Label used in log and error messages (e.g. "contact_schedule").
     * @throws InvalidParameterException if the breakpoints are invalid.
     */
    explicit PiecewiseConstantSchedule(
        const std::vector<SchedulePoint>& points = {},
        double baseline_factor = constants::DEFAULT_SCHEDULE_FACTOR,
        const std::string& name = "schedule");

    /**
     * @brief Builds the schedule of a single intervention window.
     *
     * The factor applies on days `[start_day, start_day + duration)`, the
     * baseline before and after.
     */
    static std::vector<SchedulePoint> windowPoints(int start_day, int duration, double factor,
                                                   double baseline_factor = constants::DEFAULT_SCHEDULE_FACTOR);

    double getFactor(int day) const override;

    const std::vector<SchedulePoint>& getPoints() const override;

    double getBaselineFactor() const override;

    const std::string& getName() const { return name_; }

private:
    std::vector<SchedulePoint> points_;
    double baseline_factor_;
    std::string name_;
};

} // namespace pmsim

#endif // PMSIM_PIECEWISE_CONSTANT_SCHEDULE_HPP
