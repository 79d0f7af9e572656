#include <chrono>
#include <climits>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <string>

#include "pmsim/exceptions/CSVReadException.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include "pmsim/exceptions/InvariantViolationException.hpp"
#include "pmsim/simulation/Simulation.hpp"
#include "pmsim/utils/FileUtils.hpp"
#include "pmsim/utils/Logger.hpp"
#include "pmsim/utils/ReadSimulationConfiguration.hpp"

using namespace std;
using namespace pmsim;

namespace {

constexpr int EXIT_CONFIG_ERROR = 1;
constexpr int EXIT_INVARIANT_FAILURE = 2;

void printUsage(const char* programName) {
    cout << "Usage: " << programName << " [options]" << endl;
    cout << "Options:" << endl;
    cout << "  --config, -c <file>    Parameter file (default: data/config/default_parameters.txt)" << endl;
    cout << "  --output, -o <csv>     Output table (default: data/output/pmsim_output.csv)" << endl;
    cout << "  --summary, -s <csv>    Daily summary (default: data/output/pmsim_summary.csv)" << endl;
    cout << "  --seed <n>             Override the random seed" << endl;
    cout << "  --days <n>             Override max_days" << endl;
    cout << "  --parallel             Evaluate provinces in parallel" << endl;
    cout << "  --verbose, -v          Log per-day progress" << endl;
    cout << "  --help, -h             Show this help message" << endl;
}

} // namespace

int main(int argc, char* argv[]) {
    // === COMMAND LINE PARSING ===
    string config_file;
    string output_file;
    string summary_file;
    long seed_override = -1;
    long days_override = -1;
    bool parallel = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        string arg = argv[i];
        auto requireValue = [&](const string& option) -> bool {
            if (i + 1 >= argc) {
                cerr << "Error: " << option << " option requires a value" << endl;
                printUsage(argv[0]);
                return false;
            }
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" || arg == "-c") {
            if (!requireValue(arg)) return EXIT_CONFIG_ERROR;
            config_file = argv[++i];
        } else if (arg == "--output" || arg == "-o") {
            if (!requireValue(arg)) return EXIT_CONFIG_ERROR;
            output_file = argv[++i];
        } else if (arg == "--summary" || arg == "-s") {
            if (!requireValue(arg)) return EXIT_CONFIG_ERROR;
            summary_file = argv[++i];
        } else if (arg == "--seed" || arg == "--days") {
            if (!requireValue(arg)) return EXIT_CONFIG_ERROR;
            const long max_value = (arg == "--days") ? static_cast<long>(INT_MAX) : numeric_limits<long>::max();
            const optional<long> value = parseBoundedInteger(argv[++i], 0, max_value);
            if (!value) {
                cerr << "Error: " << arg << " expects an integer in [0, " << max_value << "]" << endl;
                return EXIT_CONFIG_ERROR;
            }
            (arg == "--seed" ? seed_override : days_override) = *value;
        } else if (arg == "--parallel") {
            parallel = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else {
            cerr << "Error: Unknown option: " << arg << endl;
            printUsage(argv[0]);
            return EXIT_CONFIG_ERROR;
        }
    }

    // === LOGGER SETUP ===
    Logger& logger = Logger::getInstance();
    logger.setLogLevel(verbose ? LogLevel::DEBUG : LogLevel::INFO);
    logger.info("main", "Starting province-membrane SEJIRS simulation...");

    try {
        // === FILE PATHS SETUP ===
        const string project_root = FileUtils::getProjectRoot();
        logger.debug("main", "Project root: " + project_root);
        if (config_file.empty()) {
            config_file = FileUtils::joinPaths(project_root, "data/config/default_parameters.txt");
        }
        if (output_file.empty()) {
            output_file = FileUtils::getOutputPath("pmsim_output.csv");
        }
        if (summary_file.empty()) {
            summary_file = FileUtils::getOutputPath("pmsim_summary.csv");
        }

        // === CONFIGURATION ===
        ParameterBundle params = readParameterBundle(config_file);
        if (seed_override >= 0) params.seed = static_cast<unsigned long>(seed_override);
        if (days_override >= 0) params.max_days = static_cast<int>(days_override);
        if (parallel) params.parallel_provinces = true;

        // === SIMULATION ===
        const auto start_time = chrono::steady_clock::now();
        Simulation simulation(params);
        const OutputTable& table = simulation.run();
        const auto end_time = chrono::steady_clock::now();
        const auto elapsed_ms = chrono::duration_cast<chrono::milliseconds>(end_time - start_time).count();
        logger.info("main", "Simulation completed in " + to_string(elapsed_ms) + " ms.");

        // === OUTPUT ===
        ofstream table_out = FileUtils::openOutputFile(output_file);
        table.writeCsv(table_out);
        logger.info("main", "Output table (" + to_string(table.size()) + " rows) written to " + output_file);

        ofstream summary_out = FileUtils::openOutputFile(summary_file);
        simulation.getRecorder().writeSummaryCsv(summary_out);
        logger.info("main", "Daily summary written to " + summary_file);

        return 0;
    }
    catch (const InvariantViolationException& e) {
        logger.fatal("main", "Invariant Violation: " + string(e.what()));
        cerr << "Critical Error: Simulation invariant violated on day " << e.getDay() << ". " << e.what() << endl;
        if (!e.getLastValidSnapshot().empty()) {
            cerr << "Last valid snapshot (day " << e.getLastValidSnapshot().front().day << "):" << endl;
            OutputTable(e.getLastValidSnapshot()).writeCsv(cerr);
        }
        return EXIT_INVARIANT_FAILURE;
    }
    catch (const ConfigurationException& e) {
        logger.fatal("main", "Configuration Error: " + string(e.what()));
        cerr << "Critical Error: Invalid configuration (" << e.getField() << "). " << e.what() << endl;
        return EXIT_CONFIG_ERROR;
    }
    catch (const FileIOException& e) {
        logger.fatal("main", "File I/O Error: " + string(e.what()));
        cerr << "Critical Error: Could not read or write a file. " << e.what() << endl;
        return EXIT_CONFIG_ERROR;
    }
    catch (const DataFormatException& e) {
        logger.fatal("main", "Data Format Error: " + string(e.what()));
        cerr << "Critical Error: Invalid data format encountered. " << e.what() << endl;
        return EXIT_CONFIG_ERROR;
    }
    catch (const ModelException& e) {
        logger.fatal("main", "General Model Error: " + string(e.what()));
        cerr << "Critical Error: An unspecified model error occurred. " << e.what() << endl;
        return EXIT_CONFIG_ERROR;
    }
    catch (const std::exception& e) {
        logger.fatal("main", "Standard Exception: " + string(e.what()));
        cerr << "Error: An unexpected error occurred: " << e.what() << endl;
        return EXIT_CONFIG_ERROR;
    }
}
