#ifndef PMSIM_EXCEPTIONS_HPP
#define PMSIM_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <sstream>

namespace pmsim {

    inline std::string buildErrorMessage(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << file << ":" << line << " (" << functionName << ")] " << category << ": " << message;
        return oss.str();
    }

/**
 * @brief Base exception for the province simulation engine.
 */
class ModelException : public std::runtime_error {
public:
    /**
     * @brief Construct a ModelException.
     * @param functionName Name of the function where the error occurred.
     * @param message Descriptive error message.
     */
    ModelException(const std::string& functionName, const std::string& message)
        : std::runtime_error("[" + functionName + "] " + message),
          functionName_(functionName), file_(""), line_(0) {}

    ModelException(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message)
        : std::runtime_error(buildErrorMessage(file, line, functionName, category, message)),
          functionName_(functionName), file_(file), line_(line) {}

    /**
     * @brief Get the originating function's name.
     * @return const std::string& Function name.
     */
    const std::string& getFunctionName() const noexcept {
        return functionName_;
    }
    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

private:
    std::string functionName_;
    const char* file_;
    int line_;
};

/**
 * @brief Exception for invalid method parameters.
 */
class InvalidParameterException : public ModelException {
public:
    InvalidParameterException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Invalid Parameter: " + message) {}
    InvalidParameterException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException(file, line, functionName, "InvalidParameterException", message) {}
};

/**
 * @brief A parameter bundle failed validation.
 *
 * Raised before any simulated day runs. The message names the offending field.
 */
class ConfigurationException : public InvalidParameterException {
public:
    /**
     * @brief Construct a ConfigurationException.
     * @param functionName Name of the validating function.
     * @param field Name of the configuration field that failed validation.
     * @param message Details about the rejected value.
     */
    ConfigurationException(const std::string& functionName, const std::string& field, const std::string& message)
        : InvalidParameterException(functionName, "Configuration Error in '" + field + "': " + message),
          field_(field) {}

    const std::string& getField() const noexcept { return field_; }

private:
    std::string field_;
};

/**
 * @brief Exception for errors raised while stepping the simulation.
 */
class SimulationException : public ModelException {
public:
    /**
     * @brief Construct a SimulationException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the simulation error.
     */
    SimulationException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Simulation Error: " + message) {}
    SimulationException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException(file, line, functionName, "SimulationException", message) {}
};

/**
 * @brief Exception for file input/output errors.
 */
class FileIOException : public ModelException {
public:
    FileIOException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "File IO Error: " + message) {}
};

/**
 * @brief Exception for data parsing or format errors.
 */
class DataFormatException : public ModelException {
public:
    DataFormatException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Data Format Error: " + message) {}
};

/**
 * @brief Exception for out-of-range access to provinces, cohorts or records.
 */
class OutOfRangeException : public ModelException {
public:
    OutOfRangeException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException(file, line, functionName, "OutOfRangeException", message) {}
};

} // namespace pmsim

#define PMSIM_THROW_INVALID_PARAM(func, msg) throw pmsim::InvalidParameterException(__FILE__, __LINE__, func, msg)
#define PMSIM_THROW_CONFIG_ERROR(func, field, msg) throw pmsim::ConfigurationException(func, field, msg)
#define PMSIM_THROW_SIMULATION_ERROR(func, msg) throw pmsim::SimulationException(__FILE__, __LINE__, func, msg)
#define PMSIM_THROW_OUT_OF_RANGE(func, msg) throw pmsim::OutOfRangeException(__FILE__, __LINE__, func, msg)

#endif // PMSIM_EXCEPTIONS_HPP
