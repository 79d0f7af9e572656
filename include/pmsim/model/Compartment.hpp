#ifndef PMSIM_COMPARTMENT_HPP
#define PMSIM_COMPARTMENT_HPP

#include <array>
#include <optional>
#include <string>

namespace pmsim {

    /**
     * @brief SEJIRS disease compartments.
     *
     * Declaration order is significant: it is the tie-break order used when
     * competing transitions are drawn.
     */
    enum class Compartment {
        S = 0,  ///< Susceptible
        E,      ///< Exposed, not yet infectious
        J3,     ///< Moderately symptomatic, isolated / hospitalized
        J4,     ///< Severely symptomatic, ICU
        I,      ///< Infectious, not isolated
        R       ///< Recovered, immune
    };

    constexpr int NUM_COMPARTMENTS = 6;

    /** @brief Bed class required by a symptomatic compartment. */
    enum class Severity {
        Hospital = 0,
        ICU = 1
    };

    constexpr int NUM_SEVERITIES = 2;

    /**
     * @brief Whether a J3/J4 individual holds a bed of its severity class.
     *
     * Compartments other than J3 and J4 only use `Bedded`, which there means
     * "not applicable".
     */
    enum class CareStatus {
        Bedded = 0,
        Unbedded = 1
    };

    constexpr int NUM_CARE_STATUSES = 2;

    constexpr int index(Compartment c) { return static_cast<int>(c); }
    constexpr int index(Severity s) { return static_cast<int>(s); }
    constexpr int index(CareStatus care) { return static_cast<int>(care); }

    /** @brief All compartments in enum order. */
    const std::array<Compartment, NUM_COMPARTMENTS>& allCompartments();

    /** @brief Compartments in output-table column order (S, E, I, J3, J4, R). */
    const std::array<Compartment, NUM_COMPARTMENTS>& outputOrder();

    std::string toString(Compartment c);
    std::string toString(Severity s);

    /**
     * @brief Parses a compartment name ("S", "E", "I", "J3", "J4", "R"), case-insensitive.
     * @throws InvalidParameterException for unknown names.
     */
    Compartment compartmentFromString(const std::string& name);

    /** @brief True for E, I, J3 and J4. */
    bool isActiveInfection(Compartment c);

    /** @brief Bed class needed to enter the compartment, if any. */
    std::optional<Severity> severityOf(Compartment c);

} // namespace pmsim

#endif // PMSIM_COMPARTMENT_HPP
