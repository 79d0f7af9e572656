#include "pmsim/utils/ReadSimulationConfiguration.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include "pmsim/model/PiecewiseConstantSchedule.hpp"
#include "pmsim/utils/FileUtils.hpp"
#include "pmsim/utils/Logger.hpp"
#include "pmsim/utils/ReadMobilityMatrix.hpp"
#include <climits>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <cstddef>
#include <utility>

namespace fs = std::filesystem;

namespace pmsim {

namespace {

    const char* const F_NAME = "pmsim::readParameterBundle";

    /**
     * @brief Tokens of one configuration line with typed, position-aware accessors.
     */
    class ConfigLine {
    public:
        ConfigLine(std::string key, std::vector<std::string> values, int lineNumber, const std::string& source)
            : key_(std::move(key)), values_(std::move(values)), lineNumber_(lineNumber), source_(source) {}

        const std::string& key() const { return key_; }
        std::size_t remaining() const { return values_.size() - next_; }

        std::string word(const std::string& what) {
            if (next_ >= values_.size()) {
                fail("missing " + what);
            }
            return values_[next_++];
        }

        double number(const std::string& what) {
            const std::string token = word(what);
            std::size_t consumed = 0;
            double value = 0.0;
            try {
                value = std::stod(token, &consumed);
            } catch (const std::logic_error&) {
                fail("invalid number '" + token + "' for " + what);
            }
            if (consumed != token.size()) {
                fail("invalid number '" + token + "' for " + what);
            }
            return value;
        }

        long integer(const std::string& what) {
            const std::string token = word(what);
            std::size_t consumed = 0;
            long value = 0;
            try {
                value = std::stol(token, &consumed);
            } catch (const std::logic_error&) {
                fail("invalid integer '" + token + "' for " + what);
            }
            if (consumed != token.size()) {
                fail("invalid integer '" + token + "' for " + what);
            }
            return value;
        }

        int smallInteger(const std::string& what) {
            const long value = integer(what);
            if (value < INT_MIN || value > INT_MAX) {
                fail(what + " " + std::to_string(value) + " is out of range");
            }
            return static_cast<int>(value);
        }

        bool flag(const std::string& what) {
            const std::string token = word(what);
            if (token == "1" || token == "true" || token == "yes" || token == "on") return true;
            if (token == "0" || token == "false" || token == "no" || token == "off") return false;
            fail("invalid boolean '" + token + "' for " + what);
        }

        std::vector<std::string> rest() {
            std::vector<std::string> tail(values_.begin() + static_cast<std::ptrdiff_t>(next_), values_.end());
            next_ = values_.size();
            return tail;
        }

        void expectEnd() {
            if (next_ < values_.size()) {
                fail("too many values (expected " + std::to_string(next_) + ")");
            }
        }

        [[noreturn]] void fail(const std::string& message) const {
            throw DataFormatException(F_NAME, source_ + ":" + std::to_string(lineNumber_) +
                                      ": '" + key_ + "': " + message + ".");
        }

        std::string where() const {
            return source_ + ":" + std::to_string(lineNumber_);
        }

    private:
        std::string key_;
        std::vector<std::string> values_;
        std::size_t next_ = 0;
        int lineNumber_;
        const std::string& source_;
    };

    void readScalar(ConfigLine& line, double& target) {
        target = line.number("value");
        line.expectEnd();
    }

    void readDays(ConfigLine& line, int& target) {
        target = line.smallInteger("days");
        line.expectEnd();
    }

    void readFlag(ConfigLine& line, bool& target) {
        target = line.flag("value");
        line.expectEnd();
    }

} // namespace

std::optional<long> parseBoundedInteger(const std::string& text, long minValue, long maxValue) {
    std::size_t consumed = 0;
    long value = 0;
    try {
        value = std::stol(text, &consumed);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
    if (consumed != text.size() || value < minValue || value > maxValue) {
        return std::nullopt;
    }
    return value;
}

std::vector<SchedulePoint> parseSchedulePoints(const std::vector<std::string>& tokens,
                                               const std::string& context) {
    std::vector<SchedulePoint> points;
    for (const auto& token : tokens) {
        const std::size_t colon = token.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == token.size()) {
            throw DataFormatException(F_NAME, context + ": schedule entry '" + token + "' is not day:factor.");
        }
        SchedulePoint point;
        try {
            std::size_t consumed_day = 0;
            std::size_t consumed_factor = 0;
            const std::string day_text = token.substr(0, colon);
            const std::string factor_text = token.substr(colon + 1);
            point.start_day = std::stoi(day_text, &consumed_day);
            point.factor = std::stod(factor_text, &consumed_factor);
            if (consumed_day != day_text.size() || consumed_factor != factor_text.size()) {
                throw std::invalid_argument(token);
            }
        } catch (const std::logic_error&) {
            throw DataFormatException(F_NAME, context + ": schedule entry '" + token + "' is not day:factor.");
        }
        points.push_back(point);
    }
    if (points.empty()) {
        throw DataFormatException(F_NAME, context + ": schedule needs at least one day:factor entry.");
    }
    return points;
}

ParameterBundle readParameterBundle(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw FileIOException(F_NAME, "Unable to open configuration file: " + filename);
    }
    const std::string base_directory = fs::path(filename).parent_path().string();
    ParameterBundle params = parseParameterBundle(file, filename, base_directory);
    Logger::getInstance().info(F_NAME, "Loaded configuration from " + filename + ": " +
                               std::to_string(params.provinces.size()) + " provinces, " +
                               std::to_string(params.mobility_edges.size()) + " mobility edges, " +
                               std::to_string(params.behavior_classes.size()) + " behavior classes.");
    return params;
}

ParameterBundle parseParameterBundle(std::istream& in, const std::string& sourceName,
                                     const std::string& baseDirectory) {
    ParameterBundle params;
    Logger& logger = Logger::getInstance();

    bool default_classes = true;
    std::optional<std::string> matrix_file;
    std::string matrix_where;
    std::map<std::string, std::string> seen_schedule_keys;

    // Scalar keys, by reference into the bundle.
    std::map<std::string, std::function<void(ConfigLine&)>> scalars = {
        {"beta",                           [&](ConfigLine& l) { readScalar(l, params.transitions.beta); }},
        {"p_E_I",                          [&](ConfigLine& l) { readScalar(l, params.transitions.p_E_I); }},
        {"p_symptoms",                     [&](ConfigLine& l) { readScalar(l, params.transitions.p_symptoms); }},
        {"severe_fraction",                [&](ConfigLine& l) { readScalar(l, params.transitions.severe_fraction); }},
        {"p_I_R",                          [&](ConfigLine& l) { readScalar(l, params.transitions.p_I_R); }},
        {"p_J3_R",                         [&](ConfigLine& l) { readScalar(l, params.transitions.p_J3_R); }},
        {"p_J3_J4",                        [&](ConfigLine& l) { readScalar(l, params.transitions.p_J3_J4); }},
        {"p_J3_D",                         [&](ConfigLine& l) { readScalar(l, params.transitions.p_J3_D); }},
        {"p_J4_R",                         [&](ConfigLine& l) { readScalar(l, params.transitions.p_J4_R); }},
        {"p_J4_D",                         [&](ConfigLine& l) { readScalar(l, params.transitions.p_J4_D); }},
        {"waning_rate",                    [&](ConfigLine& l) { readScalar(l, params.transitions.waning_rate); }},
        {"incubation_min_days",            [&](ConfigLine& l) { readDays(l, params.dwell.incubation_min_days); }},
        {"infectious_min_days",            [&](ConfigLine& l) { readDays(l, params.dwell.infectious_min_days); }},
        {"hospital_min_days",              [&](ConfigLine& l) { readDays(l, params.dwell.hospital_min_days); }},
        {"immunity_min_days",              [&](ConfigLine& l) { readDays(l, params.dwell.immunity_min_days); }},
        {"prudence_discount",              [&](ConfigLine& l) { readScalar(l, params.behavior.prudence_discount); }},
        {"vaccine_infection_discount",     [&](ConfigLine& l) { readScalar(l, params.behavior.vaccine_infection_discount); }},
        {"vaccine_severity_discount",      [&](ConfigLine& l) { readScalar(l, params.behavior.vaccine_severity_discount); }},
        {"behavior_trigger",               [&](ConfigLine& l) { readFlag(l, params.behavior.behavior_trigger); }},
        {"caution_sensitivity",            [&](ConfigLine& l) { readScalar(l, params.behavior.caution_sensitivity); }},
        {"isolated_infectiousness",        [&](ConfigLine& l) { readScalar(l, params.behavior.isolated_infectiousness); }},
        {"vaccine_coverage",               [&](ConfigLine& l) { readScalar(l, params.vaccination.coverage); }},
        {"vaccination_threshold",          [&](ConfigLine& l) { readScalar(l, params.vaccination.threshold); }},
        {"untreated_mortality_multiplier", [&](ConfigLine& l) { readScalar(l, params.untreated_mortality_multiplier); }},
        {"waning_immunity",                [&](ConfigLine& l) { readFlag(l, params.waning_immunity); }},
        {"parallel_provinces",             [&](ConfigLine& l) { readFlag(l, params.parallel_provinces); }},
        {"max_days",                       [&](ConfigLine& l) { readDays(l, params.max_days); }},
    };

    auto claimSchedule = [&](ConfigLine& line, const std::string& schedule) {
        auto it = seen_schedule_keys.find(schedule);
        if (it != seen_schedule_keys.end()) {
            line.fail("conflicts with '" + it->second + "' (both define the " + schedule + ")");
        }
        seen_schedule_keys[schedule] = line.key();
    };

    std::string raw;
    int line_number = 0;
    while (std::getline(in, raw)) {
        ++line_number;
        const std::size_t hash = raw.find('#');
        if (hash != std::string::npos) {
            raw.erase(hash);
        }
        std::istringstream iss(raw);
        std::string key;
        if (!(iss >> key)) continue;
        std::vector<std::string> values;
        std::string token;
        while (iss >> token) values.push_back(token);
        ConfigLine line(key, values, line_number, sourceName);

        auto scalar = scalars.find(key);
        if (scalar != scalars.end()) {
            scalar->second(line);
        } else if (key == "seed") {
            const long seed = line.integer("seed");
            if (seed < 0) line.fail("seed must be non-negative");
            params.seed = static_cast<unsigned long>(seed);
            line.expectEnd();
        } else if (key == "province") {
            ProvinceConfig p;
            p.label = line.word("label");
            p.population = line.integer("population");
            p.hospital_capacity = line.integer("hospital capacity");
            p.icu_capacity = line.integer("ICU capacity");
            p.initial_exposed = line.integer("initial E");
            p.initial_infectious = line.integer("initial I");
            if (line.remaining() > 0) {
                p.initial_recovered = line.integer("initial R");
            }
            line.expectEnd();
            params.provinces.push_back(p);
        } else if (key == "mobility_edge") {
            MobilityEdge e;
            e.from = line.smallInteger("origin");
            e.to = line.smallInteger("destination");
            e.weight = line.number("weight");
            line.expectEnd();
            params.mobility_edges.push_back(e);
        } else if (key == "mobility_matrix_file") {
            matrix_file = line.word("path");
            matrix_where = line.where();
            line.expectEnd();
        } else if (key == "behavior_class") {
            if (default_classes) {
                params.behavior_classes.clear();
                default_classes = false;
            }
            BehaviorClass bc;
            bc.name = line.word("name");
            bc.fraction = line.number("fraction");
            bc.prudence = line.number("prudence");
            bc.vaccinated = line.remaining() > 0 ? line.flag("vaccinated") : false;
            line.expectEnd();
            params.behavior_classes.push_back(bc);
        } else if (key == "blocked_admission_policy") {
            const std::string policy = line.word("policy");
            line.expectEnd();
            try {
                params.blocked_admission_policy = blockedAdmissionPolicyFromString(policy);
            } catch (const InvalidParameterException& e) {
                line.fail(e.what());
            }
        } else if (key == "movable_compartments") {
            params.movable_compartments.fill(false);
            for (const auto& name : line.rest()) {
                try {
                    params.movable_compartments[index(compartmentFromString(name))] = true;
                } catch (const InvalidParameterException&) {
                    line.fail("unknown compartment '" + name + "'");
                }
            }
        } else if (key == "contact_schedule") {
            claimSchedule(line, "contact_schedule");
            params.contact_schedule = parseSchedulePoints(line.rest(), line.where());
        } else if (key == "mobility_schedule") {
            claimSchedule(line, "mobility_schedule");
            params.mobility_schedule = parseSchedulePoints(line.rest(), line.where());
        } else if (key == "quarantine") {
            claimSchedule(line, "contact_schedule");
            const int start = line.smallInteger("start day");
            const int duration = line.smallInteger("duration");
            const double factor = line.number("contact factor");
            line.expectEnd();
            if (start < 0 || duration <= 0) line.fail("start must be non-negative and duration positive");
            params.contact_schedule = PiecewiseConstantSchedule::windowPoints(start, duration, factor);
        } else if (key == "movement_restriction") {
            claimSchedule(line, "mobility_schedule");
            const int start = line.smallInteger("start day");
            const int duration = line.smallInteger("duration");
            line.expectEnd();
            if (start < 0 || duration <= 0) line.fail("start must be non-negative and duration positive");
            params.mobility_schedule = PiecewiseConstantSchedule::windowPoints(start, duration, 0.0);
        } else {
            logger.warning(F_NAME, "Unrecognized parameter '" + key + "' at " + line.where() + ". Ignoring.");
        }
    }

    if (matrix_file) {
        if (!params.mobility_edges.empty()) {
            throw DataFormatException(F_NAME, matrix_where + ": mobility_matrix_file cannot be combined with mobility_edge entries.");
        }
        std::string path = *matrix_file;
        if (fs::path(path).is_relative() && !baseDirectory.empty()) {
            path = FileUtils::joinPaths(baseDirectory, path);
        }
        const Eigen::MatrixXd matrix = readMobilityMatrixFromCSV(path, static_cast<int>(params.provinces.size()));
        params.mobility_edges = mobilityEdgesFromMatrix(matrix);
    }

    return params;
}

} // namespace pmsim
