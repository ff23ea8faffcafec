#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <thread>

namespace clubhouse::testing {

class TempDir {
public:
    explicit TempDir(const std::string& prefix = "clubhouse_test") {
        std::random_device device;
        root_ = std::filesystem::temp_directory_path()
            / (prefix + "_" + std::to_string(device()) + std::to_string(device()));
        std::filesystem::create_directories(root_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return root_; }

private:
    std::filesystem::path root_;
};

// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
public:
    ScopedEnv(const std::string& name, const std::optional<std::string>& value)
        : name_(name) {
        if (const char* current = std::getenv(name.c_str())) {
            previous_ = std::string(current);
        }
        if (value) {
            ::setenv(name.c_str(), value->c_str(), 1);
        } else {
            ::unsetenv(name.c_str());
        }
    }

    ~ScopedEnv() {
        if (previous_) {
            ::setenv(name_.c_str(), previous_->c_str(), 1);
        } else {
            ::unsetenv(name_.c_str());
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::optional<std::string> previous_;
};

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

inline std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Writes an executable /bin/sh script named `name` into dir.
inline std::filesystem::path WriteStubBinary(const std::filesystem::path& dir,
                                             const std::string& name,
                                             const std::string& body = "exit 0\n") {
    const auto path = dir / name;
    WriteFile(path, "#!/bin/sh\n" + body);
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_all | std::filesystem::perms::group_read
                                     | std::filesystem::perms::group_exec,
                                 std::filesystem::perm_options::replace);
    return path;
}

// An isolated HOME and PATH so binary discovery only sees stubs placed in bin().
class StubToolchain {
public:
    StubToolchain()
        : home_("clubhouse_home")
        , bin_("clubhouse_bin")
        , home_env_("HOME", home_.path().string())
        , path_env_("PATH", bin_.path().string() + ":/bin:/usr/bin") {}

    const std::filesystem::path& home() const { return home_.path(); }
    const std::filesystem::path& bin() const { return bin_.path(); }

    std::filesystem::path Add(const std::string& name, const std::string& body = "exit 0\n") {
        return WriteStubBinary(bin_.path(), name, body);
    }

private:
    TempDir home_;
    TempDir bin_;
    ScopedEnv home_env_;
    ScopedEnv path_env_;
};

inline bool WaitFor(const std::function<bool()>& condition,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

}  // namespace clubhouse::testing
