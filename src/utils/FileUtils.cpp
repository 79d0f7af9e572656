#include "pmsim/utils/FileUtils.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include "pmsim/utils/Logger.hpp"
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace pmsim {
namespace FileUtils {

bool ensureDirectoryExists(const std::string& path) {
    if (path.empty()) return true;
    std::error_code ec;
    if (fs::exists(path, ec)) {
        return fs::is_directory(path, ec);
    }
    fs::create_directories(path, ec);
    if (ec) {
        Logger::getInstance().error("FileUtils::ensureDirectoryExists",
                                    "Error creating directory " + path + ": " + ec.message());
        return false;
    }
    return true;
}

std::string getProjectRoot() {
    fs::path current = fs::current_path();
    for (int i = 0; i < 6 && !current.empty(); ++i) {
        if (fs::exists(current / "data") &&
            fs::exists(current / "include") &&
            fs::exists(current / "src")) {
            return fs::absolute(current).lexically_normal().string();
        }
        if (current == current.parent_path()) break;
        current = current.parent_path();
    }
    return fs::absolute(fs::current_path()).lexically_normal().string();
}

std::string getOutputPath(const std::string& filename) {
    fs::path outputDir = fs::path(getProjectRoot()) / "data" / "output";

    if (!ensureDirectoryExists(outputDir.string())) {
        Logger::getInstance().warning("FileUtils::getOutputPath",
                                      "Could not create output directory: " + outputDir.string());
    }

    if (filename.empty()) {
        return outputDir.lexically_normal().string();
    }
    return (outputDir / filename).lexically_normal().string();
}

std::string joinPaths(const std::string& path1, const std::string& path2) {
    if (path2.empty()) {
        return path1;
    }
    std::string rel = path2;
    if (rel[0] == '/') {
        rel = rel.substr(1);
    }
    return (fs::path(path1) / fs::path(rel)).lexically_normal().string();
}

std::ofstream openOutputFile(const std::string& path) {
    const fs::path parent = fs::path(path).parent_path();
    if (!parent.empty() && !ensureDirectoryExists(parent.string())) {
        throw FileIOException("FileUtils::openOutputFile", "Cannot create directory for output file: " + path);
    }
    std::ofstream out(path);
    if (!out.is_open()) {
        throw FileIOException("FileUtils::openOutputFile", "Unable to open output file: " + path);
    }
    return out;
}

} // namespace FileUtils
} // namespace pmsim
