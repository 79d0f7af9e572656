#include "pmsim/model/Compartment.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include <algorithm>
#include <cctype>

namespace pmsim {

    const std::array<Compartment, NUM_COMPARTMENTS>& allCompartments() {
        static const std::array<Compartment, NUM_COMPARTMENTS> compartments = {
            Compartment::S, Compartment::E, Compartment::J3,
            Compartment::J4, Compartment::I, Compartment::R};
        return compartments;
    }

    const std::array<Compartment, NUM_COMPARTMENTS>& outputOrder() {
        static const std::array<Compartment, NUM_COMPARTMENTS> order = {
            Compartment::S, Compartment::E, Compartment::I,
            Compartment::J3, Compartment::J4, Compartment::R};
        return order;
    }

    std::string toString(Compartment c) {
        switch (c) {
            case Compartment::S:  return "S";
            case Compartment::E:  return "E";
            case Compartment::J3: return "J3";
            case Compartment::J4: return "J4";
            case Compartment::I:  return "I";
            case Compartment::R:  return "R";
        }
        return "?";
    }

    std::string toString(Severity s) {
        return s == Severity::Hospital ? "hospital" : "icu";
    }

    Compartment compartmentFromString(const std::string& name) {
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
        for (Compartment c : allCompartments()) {
            if (toString(c) == upper) {
                return c;
            }
        }
        PMSIM_THROW_INVALID_PARAM("compartmentFromString", "Unknown compartment name '" + name + "'.");
    }

    bool isActiveInfection(Compartment c) {
        return c == Compartment::E || c == Compartment::I ||
               c == Compartment::J3 || c == Compartment::J4;
    }

    std::optional<Severity> severityOf(Compartment c) {
        if (c == Compartment::J3) return Severity::Hospital;
        if (c == Compartment::J4) return Severity::ICU;
        return std::nullopt;
    }

} // namespace pmsim
