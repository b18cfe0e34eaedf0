/**
 * @file AppPaths.cpp
 * @brief Canonical storage paths for TransEase.
 */

#include "transease/AppPaths.h"
#include "transease/config.h"
#include <cstdlib>
#include <system_error>

namespace TransEase {

std::filesystem::path AppPaths::workingDirectory() {
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        return std::filesystem::path(".");
    }
    return cwd;
}

std::filesystem::path AppPaths::configJsonPath() {
    const char* overridePath = std::getenv(CONFIG_PATH_ENV);
    if (overridePath && *overridePath) {
        return normalize(std::filesystem::u8path(overridePath));
    }
    return workingDirectory() / CONFIG_FILE_NAME;
}

std::filesystem::path AppPaths::logFilePath(const std::filesystem::path& configPath) {
    return normalize(configPath).parent_path() / LOG_FILE_NAME;
}

std::filesystem::path AppPaths::normalize(const std::filesystem::path& path) {
    if (path.empty()) {
        return workingDirectory();
    }

    std::filesystem::path out = path.is_absolute() ? path : workingDirectory() / path;
    out = out.lexically_normal();

    // "/srv/share/" and "/srv/share" must compare equal once stored.
    if (!out.has_filename() && out.has_parent_path() && out != out.root_path()) {
        out = out.parent_path();
    }
    return out;
}

}  // namespace TransEase
