#include "pmsim/exceptions/CSVReadException.hpp"
#include <string>

namespace pmsim {

    CSVReadException::CSVReadException(ErrorType type, const std::string& functionName, const std::string& details)
    : DataFormatException(functionName, createMessage(type, details)),
      errorType(type) {}

    CSVReadException::ErrorType CSVReadException::getErrorType() const noexcept {
        return errorType;
    }

    std::string CSVReadException::createMessage(ErrorType type, const std::string& details) {
        std::string baseMsg;
        switch (type) {
            case ErrorType::FileOpenError:
                baseMsg = "Could not open mobility file";
                break;
            case ErrorType::NotEnoughColumns:
                baseMsg = "Mobility row is missing destination columns";
                break;
            case ErrorType::TooManyColumns:
                baseMsg = "Mobility row has more columns than provinces";
                break;
            case ErrorType::NotEnoughRows:
                baseMsg = "Mobility matrix is missing origin rows";
                break;
            case ErrorType::InvalidNumberFormat:
                baseMsg = "Invalid movement weight";
                break;
        }
        return baseMsg + (details.empty() ? "" : ": " + details);
    }
}
