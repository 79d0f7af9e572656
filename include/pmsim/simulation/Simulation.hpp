#ifndef PMSIM_SIMULATION_HPP
#define PMSIM_SIMULATION_HPP

#include "pmsim/model/MobilityNetwork.hpp"
#include "pmsim/model/TransitionRuleSet.hpp"
#include "pmsim/model/VaccinationCampaign.hpp"
#include "pmsim/model/interfaces/IInterventionSchedule.hpp"
#include "pmsim/model/parameters/ParameterBundle.hpp"
#include "pmsim/simulation/OutputRecorder.hpp"
#include "pmsim/simulation/SimulationContext.hpp"
#include <functional>
#include <memory>
#include <string>

namespace pmsim {

enum class SimulationState {
    Initializing,
    Running,
    Terminated
};

enum class TerminationReason {
    None,
    MaxDaysReached,
    NoActiveInfections,
    InvariantViolation,
    Error
};

std::string toString(SimulationState state);
std::string toString(TerminationReason reason);

/**
 * @class Simulation
 * @brief Day-by-day driver of one run.
 *
 * Each day: the transition rules and the vaccination campaign are applied to
 * every province, then the mobility network once, then the day's snapshot and summary are recorded.
 * The invariants are checked before the snapshot is committed. The run
 * terminates after `max_days` or as soon as no province has an active
 * infection (E + I + J3 + J4). Days are numbered from 1.
 *
 * A Simulation is single-use: once Terminated it refuses to step. Any
 * exception thrown during a day, the observer's included, terminates the run
 * and discards the recorded output.
 */
class Simulation {
public:
    /** @brief Called after each completed day. */
    using DayObserver = std::function<void(const DailySummary&)>;

    /**
     * @brief Validates the bundle and builds the initial state.
     * @throws ConfigurationException if the bundle is invalid. No day runs in that case.
     */
    explicit Simulation(ParameterBundle params);

    /**
     * @brief Runs until termination.
     * @return const OutputTable& The finished table.
     * @throws InvariantViolationException if an invariant fails; the simulation is then Terminated.
     * @throws SimulationException if the simulation already terminated.
     */
    const OutputTable& run();

    /**
     * @brief Simulates one day.
     * @return bool True while the run continues after this day.
     * @throws InvariantViolationException if an invariant fails.
     * @throws SimulationException if the simulation already terminated.
     */
    bool step();

    SimulationState getState() const { return state_; }
    TerminationReason getTerminationReason() const { return terminationReason_; }

    /** @brief Last completed day, 0 before the first step. */
    int getCurrentDay() const { return context_.getDay(); }

    void setDayObserver(DayObserver observer) { observer_ = std::move(observer); }

    OutputRecorder& getRecorder() { return recorder_; }
    const OutputRecorder& getRecorder() const { return recorder_; }

    const SimulationContext& getContext() const { return context_; }
    const ParameterBundle& getParameters() const { return params_; }

protected:
    /** @brief Mutable run state, for subclasses that inject state between days. */
    SimulationContext& mutableContext() { return context_; }

private:
    ParameterBundle params_;
    std::shared_ptr<IInterventionSchedule> contactSchedule_;
    std::shared_ptr<IInterventionSchedule> mobilitySchedule_;
    SimulationContext context_;
    TransitionRuleSet rules_;
    MobilityNetwork mobility_;
    VaccinationCampaign campaign_;
    OutputRecorder recorder_;
    DayObserver observer_;
    SimulationState state_ = SimulationState::Initializing;
    TerminationReason terminationReason_ = TerminationReason::None;

    TransitionTally applyTransitions(int day);
    void checkInvariants(int day);
    void terminate(TerminationReason reason);
};

} // namespace pmsim

#endif // PMSIM_SIMULATION_HPP
