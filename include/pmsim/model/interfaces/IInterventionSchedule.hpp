#ifndef PMSIM_I_INTERVENTION_SCHEDULE_HPP
#define PMSIM_I_INTERVENTION_SCHEDULE_HPP

#include <memory>
#include <vector>

namespace pmsim {

/**
 * @brief One breakpoint of a piecewise-constant schedule.
 *
 * The factor applies from `start_day` (inclusive) until the next breakpoint.
 */
struct SchedulePoint {
    int start_day = 0;
    double factor = 1.0;
};

/**
 * @brief Interface for intervention schedules.
 *
 * Defines how an intervention (quarantine, movement restriction) scales a
 * daily quantity such as the contact rate or the mobility weights.
 */
class IInterventionSchedule {
public:
    virtual ~IInterventionSchedule() = default;

    /**
     * @brief Get the multiplier in force on a given simulated day.
     *
     * A factor of 1.0 means no intervention; 0.0 suppresses the quantity
     * entirely.
     *
     * @param day The simulated day (days are numbered from 1).
     * @return double The multiplier.
     */
    virtual double getFactor(int day) const = 0;

    /**
     * @brief Get the breakpoints defining the schedule.
     * @return const std::vector<SchedulePoint>& Breakpoints sorted by start day.
     */
    virtual const std::vector<SchedulePoint>& getPoints() const = 0;

    /**
     * @brief Get the factor applied before the first breakpoint.
     */
    virtual double getBaselineFactor() const = 0;
};

} // namespace pmsim

#endif // PMSIM_I_INTERVENTION_SCHEDULE_HPP
