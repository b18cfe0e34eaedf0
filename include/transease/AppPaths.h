/**
 * @file AppPaths.h
 * @brief Canonical storage paths for TransEase.
 *
 * Path contract:
 * - Config: <working directory>/config.json
 * - Log:    transease.log beside the config file
 *
 * TRANSEASE_CONFIG overrides the config path (dev/tests). No environment
 * variable is required.
 */

#pragma once

#include <filesystem>

namespace TransEase {

class AppPaths {
public:
    /**
     * @brief Returns the absolute working directory, or "." if it cannot be determined.
     */
    static std::filesystem::path workingDirectory();

    /**
     * @brief Returns the settings file path.
     * @return $TRANSEASE_CONFIG if set and non-empty, else <cwd>/config.json (absolute)
     */
    static std::filesystem::path configJsonPath();

    /**
     * @brief Returns the durable log file for a settings file.
     * @return <directory of configPath>/transease.log
     */
    static std::filesystem::path logFilePath(const std::filesystem::path& configPath);

    /**
     * @brief Make a user-supplied path absolute and lexically normal.
     *
     * Relative paths are resolved against the working directory. The path
     * does not need to exist.
     */
    static std::filesystem::path normalize(const std::filesystem::path& path);
};

}  // namespace TransEase
