#ifndef PMSIM_READ_MOBILITY_MATRIX_HPP
#define PMSIM_READ_MOBILITY_MATRIX_HPP

#include "pmsim/exceptions/CSVReadException.hpp"
#include "pmsim/model/parameters/ParameterBundle.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace pmsim {

/**
 * @brief Reads a dense origin x destination mobility matrix from a CSV file.
 *
 * Entry (i, j) is the daily probability that an individual of province i
 * moves to province j. Lines starting with "//" before the first data row
 * and blank lines are skipped.
 *
 * @param filename [std::string] The path to the CSV file to read
 * @param num_provinces [int] Expected number of rows and columns
 *
 * @return Eigen::MatrixXd The num_provinces x num_provinces matrix
 *
 * @throws CSVReadException::FileOpenError If the file cannot be opened
 * @throws CSVReadException::NotEnoughRows If the file has fewer rows than expected
 * @throws CSVReadException::NotEnoughColumns If any row has fewer columns than expected
 * @throws CSVReadException::TooManyColumns If any row has more columns than expected
 * @throws CSVReadException::InvalidNumberFormat If any cell contains invalid numeric data
 */
Eigen::MatrixXd readMobilityMatrixFromCSV(const std::string& filename, int num_provinces);

/**
 * @brief Converts a mobility matrix to edges, one per positive off-diagonal entry.
 *
 * The diagonal (share staying home) is ignored. Edges are ordered by origin,
 * then destination.
 */
std::vector<MobilityEdge> mobilityEdgesFromMatrix(const Eigen::MatrixXd& matrix);

} // namespace pmsim

#endif // PMSIM_READ_MOBILITY_MATRIX_HPP
