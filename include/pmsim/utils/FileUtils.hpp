#ifndef PMSIM_FILE_UTILS_HPP
#define PMSIM_FILE_UTILS_HPP

#include <fstream>
#include <string>

namespace pmsim {

/**
 * @namespace FileUtils
 * @brief Filesystem helpers for locating configuration and writing results.
 */
namespace FileUtils {
    /**
     * @brief Ensures the specified directory exists, creating it if necessary.
     * @param path [in] Directory path to check/create
     * @return true if the directory exists or was successfully created, false otherwise
     */
    bool ensureDirectoryExists(const std::string& path);

    /**
     * @brief Locates the project root directory.
     * @details Walks up from the working directory looking for a directory
     *          containing data, include and src. Falls back to the working directory.
     * @return Absolute path to the project root
     */
    std::string getProjectRoot();

    /**
     * @brief Path inside `<root>/data/output`, creating the directory if needed.
     * @param filename [in] Optional filename to append (empty by default)
     */
    std::string getOutputPath(const std::string& filename = "");

    /**
     * @brief Joins two path segments; a leading '/' on the second segment is ignored.
     */
    std::string joinPaths(const std::string& path1, const std::string& path2);

    /**
     * @brief Opens a file for writing, creating its parent directory.
     * @param path [in] Destination file
     * @return std::ofstream The opened stream
     * @throws FileIOException if the file cannot be opened
     */
    std::ofstream openOutputFile(const std::string& path);
}

} // namespace pmsim

#endif // PMSIM_FILE_UTILS_HPP
