#include <gtest/gtest.h>

#include "transease/AppPaths.h"

#include <cstdlib>
#include <filesystem>
#include <string>

namespace {

class EnvVarGuard {
public:
    EnvVarGuard(const char* name, const char* value) : m_name(name) {
        const char* prev = std::getenv(name);
        m_had = prev != nullptr;
        if (m_had) {
            m_prev = prev;
        }
        if (value) {
            ::setenv(name, value, 1);
        } else {
            ::unsetenv(name);
        }
    }

    ~EnvVarGuard() {
        if (m_had) {
            ::setenv(m_name.c_str(), m_prev.c_str(), 1);
        } else {
            ::unsetenv(m_name.c_str());
        }
    }

private:
    std::string m_name;
    bool m_had{false};
    std::string m_prev;
};

}  // namespace

TEST(AppPathsTest, ConfigPathDefaultsToWorkingDirectory)
{
    EnvVarGuard env("TRANSEASE_CONFIG", nullptr);

    const auto p = TransEase::AppPaths::configJsonPath();
    EXPECT_EQ(p.filename(), std::filesystem::path("config.json"));
    EXPECT_EQ(p.parent_path(), TransEase::AppPaths::workingDirectory());
}

TEST(AppPathsTest, EnvironmentOverridesConfigPath)
{
    EnvVarGuard env("TRANSEASE_CONFIG", "/tmp/transease-test/custom.json");

    EXPECT_EQ(TransEase::AppPaths::configJsonPath(),
              std::filesystem::path("/tmp/transease-test/custom.json"));
}

TEST(AppPathsTest, EmptyOverrideIsIgnored)
{
    EnvVarGuard env("TRANSEASE_CONFIG", "");

    EXPECT_EQ(TransEase::AppPaths::configJsonPath().filename(), std::filesystem::path("config.json"));
}

TEST(AppPathsTest, LogFileSitsBesideConfig)
{
    const auto log = TransEase::AppPaths::logFilePath("/srv/transease/config.json");
    EXPECT_EQ(log, std::filesystem::path("/srv/transease/transease.log"));
}

TEST(AppPathsTest, NormalizeStripsTrailingSeparatorAndDots)
{
    EXPECT_EQ(TransEase::AppPaths::normalize("/srv/share/"), std::filesystem::path("/srv/share"));
    EXPECT_EQ(TransEase::AppPaths::normalize("/srv/./share/../data"), std::filesystem::path("/srv/data"));
    EXPECT_EQ(TransEase::AppPaths::normalize("/"), std::filesystem::path("/"));
}

TEST(AppPathsTest, NormalizeResolvesRelativeAgainstWorkingDirectory)
{
    const auto p = TransEase::AppPaths::normalize("shared");
    EXPECT_TRUE(p.is_absolute());
    EXPECT_EQ(p, TransEase::AppPaths::workingDirectory() / "shared");
}
