#ifndef PMSIM_MODEL_CONSTANTS_HPP
#define PMSIM_MODEL_CONSTANTS_HPP

namespace pmsim {
namespace constants {

    constexpr double NUMERICAL_EPSILON = 1e-9;
    constexpr double FRACTION_SUM_TOLERANCE = 1e-9;

    constexpr int DEFAULT_MAX_DAYS = 120;
    constexpr unsigned long DEFAULT_SEED = 42;

    // Daily transition probabilities
    constexpr double DEFAULT_BETA = 0.6;
    constexpr double DEFAULT_P_E_I = 0.3;
    constexpr double DEFAULT_P_SYMPTOMS = 0.05;
    constexpr double DEFAULT_SEVERE_FRACTION = 0.2;
    constexpr double DEFAULT_P_I_R = 0.2;
    constexpr double DEFAULT_P_J3_R = 0.15;
    constexpr double DEFAULT_P_J3_J4 = 0.03;
    constexpr double DEFAULT_P_J3_D = 0.005;
    constexpr double DEFAULT_P_J4_R = 0.1;
    constexpr double DEFAULT_P_J4_D = 0.03;
    constexpr double DEFAULT_WANING_RATE = 0.01;

    // Minimum days spent in a compartment before leaving it
    constexpr int DEFAULT_INCUBATION_MIN_DAYS = 2;
    constexpr int DEFAULT_INFECTIOUS_MIN_DAYS = 1;
    constexpr int DEFAULT_HOSPITAL_MIN_DAYS = 5;
    constexpr int DEFAULT_IMMUNITY_MIN_DAYS = 90;

    // Behavioral response
    constexpr double DEFAULT_PRUDENCE_DISCOUNT = 0.9;
    constexpr double DEFAULT_VACCINE_INFECTION_DISCOUNT = 0.8;
    constexpr double DEFAULT_VACCINE_SEVERITY_DISCOUNT = 0.7;
    constexpr double DEFAULT_CAUTION_SENSITIVITY = 0.001;
    constexpr double DEFAULT_ISOLATED_INFECTIOUSNESS = 0.0;

    // Vaccination campaign (coverage 0 disables it)
    constexpr double DEFAULT_VACCINE_COVERAGE = 0.0;
    constexpr double DEFAULT_VACCINATION_THRESHOLD = 0.01;

    constexpr double DEFAULT_UNTREATED_MORTALITY_MULTIPLIER = 2.0;

    constexpr double DEFAULT_SCHEDULE_FACTOR = 1.0;

    constexpr int OUTPUT_SCHEMA_VERSION = 1;

} // namespace constants
} // namespace pmsim

#endif // PMSIM_MODEL_CONSTANTS_HPP
