#include "process/process_launcher.hpp"

#include <boost/process.hpp>
#include <filesystem>
#include <stdexcept>
#include <signal.h>
#include <sys/wait.h>

#include "utils/logging.hpp"

namespace clubhouse::process {
namespace bp = boost::process;

struct BoostProcessLauncher::Children {
    std::unordered_map<int, bp::child> by_pid;
};

BoostProcessLauncher::BoostProcessLauncher()
    : children_(std::make_unique<Children>()) {}

BoostProcessLauncher::~BoostProcessLauncher() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [_, child] : children_->by_pid) {
        child.detach();
    }
}

int BoostProcessLauncher::Launch(const LaunchSpec& spec) {
    bp::environment env = boost::this_process::environment();
    for (const auto& [key, value] : spec.env) {
        env[key] = value;
    }
    const auto start_dir = spec.working_dir.empty()
        ? std::filesystem::current_path().string()
        : spec.working_dir;

    try {
        bp::child child_process;
        if (spec.output_path.empty()) {
            child_process = bp::child(
                bp::exe = spec.binary,
                bp::args = spec.args,
                bp::start_dir = start_dir,
                env);
        } else {
            child_process = bp::child(
                bp::exe = spec.binary,
                bp::args = spec.args,
                bp::start_dir = start_dir,
                env,
                bp::std_in < bp::null,
                (bp::std_out & bp::std_err) > spec.output_path);
        }
        const int pid = child_process.id();
        std::lock_guard<std::mutex> lock(mutex_);
        children_->by_pid.emplace(pid, std::move(child_process));
        return pid;
    } catch (const bp::process_error& ex) {
        throw std::runtime_error("Failed to launch " + spec.binary + ": " + ex.what());
    }
}

std::optional<int> BoostProcessLauncher::PollExit(int pid) {
    int status = 0;
    const auto waited = ::waitpid(pid, &status, WNOHANG);
    if (waited == 0) {
        return std::nullopt;
    }

    int exit_code = -1;
    if (waited == pid) {
        if (WIFEXITED(status)) {
            exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code = 128 + WTERMSIG(status);
        }
    } else {
        utils::LogWarn("supervisor", "lost track of child", {{"pid", std::to_string(pid)}});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = children_->by_pid.find(pid);
    if (it != children_->by_pid.end()) {
        it->second.detach();
        children_->by_pid.erase(it);
    }
    return exit_code;
}

void BoostProcessLauncher::Signal(int pid, int signal) {
    if (pid > 0) {
        ::kill(pid, signal);
    }
}

}  // namespace clubhouse::process
