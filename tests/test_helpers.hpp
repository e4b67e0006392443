/**
 * @file test_helpers.hpp
 * @brief RAII helpers for files and environment variables in tests
 */

#ifndef RECON_TEST_HELPERS_HPP
#define RECON_TEST_HELPERS_HPP

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace recon_test {

namespace fs = std::filesystem;

/**
 * @brief Temporary file removed on destruction
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension)
        : path_(fs::temp_directory_path() / ("recon_test_" + unique() + extension)) {
        std::ofstream out(path_, std::ios::binary);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    std::string path() const { return path_.string(); }

private:
    fs::path path_;

    static std::string unique() {
        static std::atomic<int> counter{0};
        return std::to_string(std::rand()) + "_" + std::to_string(counter++);
    }
};

/**
 * @brief Sets an environment variable and restores it on destruction
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(const std::string& name, const std::string& value)
        : name_(name) {
        if (const char* original = std::getenv(name.c_str())) {
            had_original_ = true;
            original_value_ = original;
        }
        set(name_, value);
    }

    ~ScopedEnvVar() {
        if (had_original_) {
            set(name_, original_value_);
        } else {
#ifdef _WIN32
            _putenv_s(name_.c_str(), "");
#else
            unsetenv(name_.c_str());
#endif
        }
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

private:
    std::string name_;
    std::string original_value_;
    bool had_original_ = false;

    static void set(const std::string& name, const std::string& value) {
#ifdef _WIN32
        _putenv_s(name.c_str(), value.c_str());
#else
        setenv(name.c_str(), value.c_str(), 1);
#endif
    }
};

} // namespace recon_test

#endif // RECON_TEST_HELPERS_HPP
