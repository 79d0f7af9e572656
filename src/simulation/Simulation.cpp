#include "pmsim/simulation/Simulation.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include "pmsim/exceptions/InvariantViolationException.hpp"
#include "pmsim/model/PiecewiseConstantSchedule.hpp"
#include "pmsim/utils/Logger.hpp"
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <exception>
#include <utility>
#include <vector>

namespace pmsim {

namespace {

    namespace acc = boost::accumulators;
    using PrevalenceStats = acc::accumulator_set<double, acc::stats<acc::tag::max, acc::tag::mean>>;

    ParameterBundle validated(ParameterBundle params) {
        params.validate();
        return params;
    }

} // namespace

std::string toString(SimulationState state) {
    switch (state) {
        case SimulationState::Initializing: return "Initializing";
        case SimulationState::Running:      return "Running";
        case SimulationState::Terminated:   return "Terminated";
    }
    return "Unknown";
}

std::string toString(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::None:               return "none";
        case TerminationReason::MaxDaysReached:     return "max_days reached";
        case TerminationReason::NoActiveInfections: return "no active infections";
        case TerminationReason::InvariantViolation: return "invariant violation";
        case TerminationReason::Error:              return "error";
    }
    return "unknown";
}

Simulation::Simulation(ParameterBundle params)
    : params_(validated(std::move(params))),
      contactSchedule_(std::make_shared<PiecewiseConstantSchedule>(params_.contact_schedule,
                                                                   constants::DEFAULT_SCHEDULE_FACTOR,
                                                                   "contact_schedule")),
      mobilitySchedule_(std::make_shared<PiecewiseConstantSchedule>(params_.mobility_schedule,
                                                                    constants::DEFAULT_SCHEDULE_FACTOR,
                                                                    "mobility_schedule")),
      context_(params_),
      rules_(params_, contactSchedule_),
      mobility_(params_.numProvinces(), params_.mobility_edges, params_.movable_compartments,
                params_.behavior_classes, mobilitySchedule_),
      campaign_(params_.behavior_classes, params_.vaccination) {}

const OutputTable& Simulation::run() {
    const std::string F_NAME = "Simulation::run";
    if (state_ == SimulationState::Terminated) {
        PMSIM_THROW_SIMULATION_ERROR(F_NAME, "Simulation already terminated (" + toString(terminationReason_) + ").");
    }

    Logger& logger = Logger::getInstance();
    logger.info(F_NAME, "Starting simulation: " + std::to_string(params_.numProvinces()) + " provinces, population " +
                std::to_string(context_.getInitialPopulation()) + ", max_days " + std::to_string(params_.max_days) +
                ", seed " + std::to_string(params_.seed) + ", policy " + toString(params_.blocked_admission_policy) +
                (campaign_.isEnabled() ? ", vaccine coverage " + std::to_string(params_.vaccination.coverage) : "") +
                (params_.parallel_provinces ? ", parallel provinces" : ""));

    while (step()) {
    }

    const OutputTable& table = recorder_.table();
    PrevalenceStats prevalence;
    for (const auto& s : recorder_.summaries()) {
        prevalence(static_cast<double>(s.prevalence));
    }
    const long peak_prevalence = recorder_.summaries().empty() ? 0 : static_cast<long>(acc::max(prevalence));
    const double mean_prevalence = recorder_.summaries().empty() ? 0.0 : acc::mean(prevalence);
    logger.info(F_NAME, "Simulation finished after " + std::to_string(getCurrentDay()) + " days (" +
                toString(terminationReason_) + "): " + std::to_string(context_.totalDeaths()) +
                " deaths, peak prevalence " + std::to_string(peak_prevalence) +
                ", mean prevalence " + std::to_string(mean_prevalence) + ".");
    return table;
}

bool Simulation::step() {
    const std::string F_NAME = "Simulation::step";
    if (state_ == SimulationState::Terminated) {
        PMSIM_THROW_SIMULATION_ERROR(F_NAME, "Simulation already terminated (" + toString(terminationReason_) + ").");
    }
    state_ = SimulationState::Running;

    Logger& logger = Logger::getInstance();
    const int day = context_.getDay() + 1;
    DailySummary summary;
    summary.day = day;

    try {
        const TransitionTally tally = applyTransitions(day);
        summary.moved = mobility_.apply(context_.provinces(), day, context_.mobilityStream());
        context_.advanceDay();
        checkInvariants(day);

        summary.new_exposures = tally.new_exposures;
        summary.new_infectious = tally.new_infectious;
        summary.new_deaths = tally.new_deaths;
        summary.new_vaccinations = tally.new_vaccinations;
        summary.prevalence = context_.totalActiveInfections();
        summary.excess_hospital_demand = tally.excess_demand[index(Severity::Hospital)];
        summary.excess_icu_demand = tally.excess_demand[index(Severity::ICU)];
        recorder_.record(context_.snapshot(), summary);

        if (logger.isEnabled(LogLevel::DEBUG)) {
            logger.debug(F_NAME, "Day " + std::to_string(day) + ": prevalence " + std::to_string(summary.prevalence) +
                         ", new exposures " + std::to_string(summary.new_exposures) +
                         ", new deaths " + std::to_string(summary.new_deaths) +
                         ", vaccinated " + std::to_string(summary.new_vaccinations) +
                         ", moved " + std::to_string(summary.moved));
        }

        if (observer_) {
            observer_(summary);
        }
    } catch (const InvariantViolationException& e) {
        const InvariantViolationException failure =
            (e.getDay() == InvariantViolationException::UNKNOWN_DAY) ? e.withRunContext(day, recorder_.lastSnapshot()) : e;
        logger.fatal(F_NAME, failure.what());
        recorder_.discard();
        terminate(TerminationReason::InvariantViolation);
        throw failure;
    } catch (const std::exception& e) {
        logger.error(F_NAME, std::string("Day ") + std::to_string(day) + " failed: " + e.what());
        recorder_.discard();
        terminate(TerminationReason::Error);
        throw;
    }

    if (day >= params_.max_days) {
        terminate(TerminationReason::MaxDaysReached);
    } else if (summary.prevalence == 0) {
        terminate(TerminationReason::NoActiveInfections);
    }
    return state_ == SimulationState::Running;
}

TransitionTally Simulation::applyTransitions(int day) {
    std::vector<ProvinceState>& provinces = context_.provinces();
    const int n = static_cast<int>(provinces.size());
    std::vector<TransitionTally> tallies(n);
    std::vector<std::exception_ptr> errors(n);

    // Each province touches only its own cells, pool and random stream.
    #pragma omp parallel for schedule(static) if(params_.parallel_provinces)
    for (int p = 0; p < n; ++p) {
        try {
            RandomStream& rng = context_.provinceStream(p);
            TransitionTally tally = rules_.apply(provinces[p], day, rng);
            tally.new_vaccinations = campaign_.apply(provinces[p], rng);
            tallies[p] = tally;
        } catch (...) {
            errors[p] = std::current_exception();
        }
    }

    for (const auto& error : errors) {
        if (error) std::rethrow_exception(error);
    }

    TransitionTally total;
    for (const auto& t : tallies) {
        total += t;
    }
    return total;
}

void Simulation::checkInvariants(int day) {
    const auto violation = context_.findInvariantViolation();
    if (violation) {
        throw InvariantViolationException("Simulation::checkInvariants", violation->invariant, day,
                                          violation->province_id, violation->detail, recorder_.lastSnapshot());
    }
}

void Simulation::terminate(TerminationReason reason) {
    state_ = SimulationState::Terminated;
    terminationReason_ = reason;
    if (reason != TerminationReason::InvariantViolation && reason != TerminationReason::Error) {
        recorder_.finalize();
    }
    Logger::getInstance().debug("Simulation::terminate",
                                "Terminated on day " + std::to_string(getCurrentDay()) + ": " + toString(reason) + ".");
}

} // namespace pmsim
