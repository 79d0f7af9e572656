#ifndef PMSIM_READ_SIMULATION_CONFIGURATION_HPP
#define PMSIM_READ_SIMULATION_CONFIGURATION_HPP

#include "pmsim/model/parameters/ParameterBundle.hpp"
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace pmsim {

/**
 * @brief Reads a parameter bundle from a key/value configuration file.
 *
 * One key per line followed by its whitespace-separated values; everything
 * after '#' is a comment. List entries (`province`, `mobility_edge`,
 * `behavior_class`) repeat their key. Keys not present keep their defaults.
 * Unknown keys are logged as warnings and ignored.
 *
 * A relative `mobility_matrix_file` is resolved against the directory of the
 * configuration file.
 *
 * The returned bundle is not validated; the Simulation constructor does it.
 *
 * @param filename Path to the configuration file.
 * @return ParameterBundle The parsed bundle.
 *
 * @throws FileIOException if the file cannot be opened.
 * @throws DataFormatException if a value is malformed (the message carries the line number).
 * @throws CSVReadException if the referenced mobility matrix cannot be read.
 */
ParameterBundle readParameterBundle(const std::string& filename);

/**
 * @brief Parses configuration text from a stream.
 *
 * @param in Stream positioned at the start of the configuration.
 * @param sourceName Name used in error messages.
 * @param baseDirectory Directory used to resolve a relative mobility matrix path.
 */
ParameterBundle parseParameterBundle(std::istream& in, const std::string& sourceName,
                                     const std::string& baseDirectory = "");

/**
 * @brief Parses a whole token as an integer in [minValue, maxValue].
 * @return The value, or std::nullopt for malformed or out-of-range text.
 */
std::optional<long> parseBoundedInteger(const std::string& text, long minValue, long maxValue);

/**
 * @brief Parses `day:factor` tokens, e.g. "0:1.0 30:0.5".
 * @throws DataFormatException for malformed tokens.
 */
std::vector<SchedulePoint> parseSchedulePoints(const std::vector<std::string>& tokens,
                                               const std::string& context);

} // namespace pmsim

#endif // PMSIM_READ_SIMULATION_CONFIGURATION_HPP
