#include "pmsim/exceptions/InvariantViolationException.hpp"
#include <sstream>
#include <utility>

namespace pmsim {

    InvariantViolationException::InvariantViolationException(const std::string& functionName,
                                                             const std::string& invariant,
                                                             int day,
                                                             int provinceId,
                                                             const std::string& detail,
                                                             std::vector<OutputRow> lastValidSnapshot)
        : SimulationException(functionName, createMessage(invariant, day, provinceId, detail)),
          invariant_(invariant),
          day_(day),
          provinceId_(provinceId),
          detail_(detail),
          lastValidSnapshot_(std::move(lastValidSnapshot)) {}

    InvariantViolationException InvariantViolationException::withRunContext(int day, std::vector<OutputRow> lastValidSnapshot) const {
        return InvariantViolationException(getFunctionName(), invariant_, day, provinceId_, detail_,
                                           std::move(lastValidSnapshot));
    }

    std::string InvariantViolationException::createMessage(const std::string& invariant, int day,
                                                           int provinceId, const std::string& detail) {
        std::ostringstream oss;
        oss << "Invariant '" << invariant << "' violated";
        if (day != UNKNOWN_DAY) {
            oss << " on day " << day;
        }
        if (provinceId >= 0) {
            oss << " in province " << provinceId;
        }
        if (!detail.empty()) {
            oss << ": " << detail;
        }
        return oss.str();
    }

}
