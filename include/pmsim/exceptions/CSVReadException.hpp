#ifndef PMSIM_CSV_READ_EXCEPTION_HPP
#define PMSIM_CSV_READ_EXCEPTION_HPP

#include "pmsim/exceptions/Exceptions.hpp"
#include <string>

namespace pmsim {

/**
 * @brief Exception class for CSV reading errors
 *
 * Raised by the mobility matrix reader for file access problems and
 * malformed cells.
 */
class CSVReadException : public DataFormatException {
public:
    /**
     * @brief Types of CSV reading errors that can occur
     */
    enum class ErrorType {
        FileOpenError,      ///< Failed to open the CSV file
        NotEnoughColumns,   ///< Row has fewer columns than expected
        TooManyColumns,     ///< Row has more columns than expected
        NotEnoughRows,      ///< File has fewer rows than expected
        InvalidNumberFormat ///< Could not parse a value as a number
    };

    /**
     * @brief Constructs a new CSV read exception
     *
     * @param type The specific type of error that occurred
     * @param functionName Name of the reading function
     * @param details Additional information about the error
     */
    CSVReadException(ErrorType type, const std::string& functionName, const std::string& details);

    ErrorType getErrorType() const noexcept;

private:
    ErrorType errorType;

    static std::string createMessage(ErrorType type, const std::string& details);
};

} // namespace pmsim

#endif // PMSIM_CSV_READ_EXCEPTION_HPP
