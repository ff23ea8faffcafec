#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace clubhouse::process {

struct LaunchSpec {
    std::string binary;
    std::vector<std::string> args;
    // Overlaid on the parent environment.
    std::unordered_map<std::string, std::string> env;
    std::string working_dir;
    // Empty means stdout/stderr are inherited.
    std::string output_path;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // Returns the child's pid. Throws std::runtime_error on launch failure.
    virtual int Launch(const LaunchSpec& spec) = 0;
    // Exit code once the child has exited (128 + signal when killed).
    virtual std::optional<int> PollExit(int pid) = 0;
    virtual void Signal(int pid, int signal) = 0;
};

class BoostProcessLauncher : public ProcessLauncher {
public:
    BoostProcessLauncher();
    ~BoostProcessLauncher() override;

    int Launch(const LaunchSpec& spec) override;
    std::optional<int> PollExit(int pid) override;
    void Signal(int pid, int signal) override;

private:
    struct Children;

    std::mutex mutex_;
    std::unique_ptr<Children> children_;
};

}  // namespace clubhouse::process
