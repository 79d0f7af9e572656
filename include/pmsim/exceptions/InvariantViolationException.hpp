#ifndef PMSIM_INVARIANT_VIOLATION_EXCEPTION_HPP
#define PMSIM_INVARIANT_VIOLATION_EXCEPTION_HPP

#include "pmsim/exceptions/Exceptions.hpp"
#include "pmsim/simulation/OutputRow.hpp"
#include <string>
#include <vector>

namespace pmsim {

/**
 * @brief A simulation invariant no longer holds.
 *
 * Raised for broken population conservation, occupancy outside
 * [0, capacity] and negative cohort counts. Carries the last valid day's
 * snapshot so callers can report the state the run failed from.
 */
class InvariantViolationException : public SimulationException {
public:
    /** @brief Day value used when the failing component does not know the day. */
    static constexpr int UNKNOWN_DAY = -1;

    /**
     * @brief Construct an InvariantViolationException.
     * @param functionName Name of the function that detected the violation.
     * @param invariant Short invariant name, e.g. "population_conservation".
     * @param day Simulated day on which the violation was detected.
     * @param provinceId Province index, or -1 for network-wide invariants.
     * @param detail Human-readable description of the observed values.
     * @param lastValidSnapshot Rows of the last day that passed all checks.
     */
    InvariantViolationException(const std::string& functionName,
                                const std::string& invariant,
                                int day,
                                int provinceId,
                                const std::string& detail,
                                std::vector<OutputRow> lastValidSnapshot = {});

    const std::string& getInvariant() const noexcept { return invariant_; }
    int getDay() const noexcept { return day_; }
    int getProvinceId() const noexcept { return provinceId_; }
    const std::string& getDetail() const noexcept { return detail_; }
    const std::vector<OutputRow>& getLastValidSnapshot() const noexcept { return lastValidSnapshot_; }

    /**
     * @brief Copy of this exception with the day and snapshot filled in.
     *
     * Used by the driver for violations raised by components that do not
     * know the simulated day (e.g. a resource pool underflow).
     */
    InvariantViolationException withRunContext(int day, std::vector<OutputRow> lastValidSnapshot) const;

private:
    std::string invariant_;
    int day_;
    int provinceId_;
    std::string detail_;
    std::vector<OutputRow> lastValidSnapshot_;

    static std::string createMessage(const std::string& invariant, int day, int provinceId, const std::string& detail);
};

} // namespace pmsim

#endif // PMSIM_INVARIANT_VIOLATION_EXCEPTION_HPP
