// Shared helpers for Catch2 tests

#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>

namespace graphrag::test {

/**
 * @brief Owns a unique directory under the system temp path and removes it on destruction.
 */
class TempDir {
public:
    explicit TempDir(std::string_view prefix = "graphrag_test_") {
        namespace fs = std::filesystem;
        std::uniform_int_distribution<int> dist(0, 9999);
        thread_local std::mt19937_64 rng{std::random_device{}()};
        for (int attempt = 0; attempt < 64 && path_.empty(); ++attempt) {
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            auto candidate = fs::temp_directory_path() / (std::string(prefix) +
                                                          std::to_string(stamp) + "_" +
                                                          std::to_string(dist(rng)));
            std::error_code ec;
            if (fs::create_directories(candidate, ec)) {
                path_ = std::move(candidate);
            }
        }
        if (path_.empty()) {
            throw std::runtime_error("could not create a temporary test directory");
        }
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

    // Writes a file relative to the directory, creating parents as needed
    std::filesystem::path write(const std::filesystem::path& relative,
                                std::string_view data) const {
        auto target = path_ / relative;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream stream(target, std::ios::binary);
        stream.write(data.data(), static_cast<std::streamsize>(data.size()));
        return target;
    }

private:
    std::filesystem::path path_;
};

/**
 * @brief Sets (or unsets, for nullopt) an environment variable until the end of the scope.
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(std::string key, std::optional<std::string> value) : key_(std::move(key)) {
        if (const char* current = std::getenv(key_.c_str())) {
            previous_ = current;
        }
        apply(value);
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

    ~ScopedEnvVar() { apply(previous_); }

private:
    void apply(const std::optional<std::string>& value) const {
        if (value) {
            ::setenv(key_.c_str(), value->c_str(), 1);
        } else {
            ::unsetenv(key_.c_str());
        }
    }

    std::string key_;
    std::optional<std::string> previous_;
};

} // namespace graphrag::test
