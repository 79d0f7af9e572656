#include "pmsim/utils/ReadMobilityMatrix.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace pmsim {

namespace {

    bool isSkippable(const std::string& line) {
        return line.find_first_not_of(" \t\r") == std::string::npos || line.compare(0, 2, "//") == 0;
    }

    double parseWeight(const std::string& cell, int row, int col, const std::string& filename, const std::string& funcName) {
        std::size_t consumed = 0;
        double value = 0.0;
        try {
            value = std::stod(cell, &consumed);
        } catch (const std::invalid_argument&) {
            throw CSVReadException(CSVReadException::ErrorType::InvalidNumberFormat, funcName,
                "row " + std::to_string(row) + ", column " + std::to_string(col) + ": '" + cell + "' in " + filename);
        } catch (const std::out_of_range&) {
            throw CSVReadException(CSVReadException::ErrorType::InvalidNumberFormat, funcName,
                "Number out of range at row " + std::to_string(row) + ", column " + std::to_string(col) +
                ": '" + cell + "' in " + filename);
        }
        if (cell.find_first_not_of(" \t\r", consumed) != std::string::npos) {
            throw CSVReadException(CSVReadException::ErrorType::InvalidNumberFormat, funcName,
                "row " + std::to_string(row) + ", column " + std::to_string(col) + ": '" + cell + "' in " + filename);
        }
        return value;
    }

} // namespace

Eigen::MatrixXd readMobilityMatrixFromCSV(const std::string& filename, int num_provinces) {
    const std::string funcName = "pmsim::readMobilityMatrixFromCSV";
    Eigen::MatrixXd mat = Eigen::MatrixXd::Zero(num_provinces, num_provinces);

    std::ifstream file(filename);
    if (!file.is_open()) {
        throw CSVReadException(CSVReadException::ErrorType::FileOpenError, funcName, filename);
    }

    std::string line;
    std::string cell;
    int row = 0;
    while (row < num_provinces && std::getline(file, line)) {
        if (isSkippable(line)) {
            continue;
        }
        std::stringstream ss(line);
        int col = 0;
        while (std::getline(ss, cell, ',')) {
            if (col >= num_provinces) {
                throw CSVReadException(CSVReadException::ErrorType::TooManyColumns, funcName,
                    "row " + std::to_string(row + 1) + " in " + filename);
            }
            mat(row, col) = parseWeight(cell, row + 1, col + 1, filename, funcName);
            ++col;
        }
        if (col < num_provinces) {
            throw CSVReadException(CSVReadException::ErrorType::NotEnoughColumns, funcName,
                "row " + std::to_string(row + 1) + " has " + std::to_string(col) + " of " +
                std::to_string(num_provinces) + " columns in " + filename);
        }
        ++row;
    }

    if (row < num_provinces) {
        throw CSVReadException(CSVReadException::ErrorType::NotEnoughRows, funcName,
            "expected " + std::to_string(num_provinces) + " rows, found " + std::to_string(row) + " in " + filename);
    }

    return mat;
}

std::vector<MobilityEdge> mobilityEdgesFromMatrix(const Eigen::MatrixXd& matrix) {
    std::vector<MobilityEdge> edges;
    for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
        for (Eigen::Index j = 0; j < matrix.cols(); ++j) {
            if (i != j && matrix(i, j) != 0.0) {
                edges.push_back(MobilityEdge{static_cast<int>(i), static_cast<int>(j), matrix(i, j)});
            }
        }
    }
    return edges;
}

} // namespace pmsim
