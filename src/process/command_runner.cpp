#include "process/command_runner.hpp"

#include <boost/process.hpp>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/logging.hpp"

namespace clubhouse::process {
namespace bp = boost::process;

namespace {

std::atomic<unsigned> g_capture_counter{0};

bool WaitWithDeadline(pid_t pid, int& status, std::chrono::steady_clock::time_point deadline,
                      std::chrono::milliseconds poll) {
    while (std::chrono::steady_clock::now() < deadline) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return true;
        }
        if (waited < 0) {
            return false;
        }
        std::this_thread::sleep_for(poll);
    }
    return false;
}

}  // namespace

ExecResult CommandRunner::Run(const std::string& binary,
                              const std::vector<std::string>& args,
                              const std::string& working_dir,
                              std::chrono::milliseconds timeout) {
    ExecResult result{};
    const auto stamp = std::to_string(::getpid()) + "_" + std::to_string(g_capture_counter++);
    const auto stdout_path = std::filesystem::temp_directory_path() / ("clubhouse_stdout_" + stamp + ".log");
    const auto stderr_path = std::filesystem::temp_directory_path() / ("clubhouse_stderr_" + stamp + ".log");

    try {
        const auto start_dir = working_dir.empty()
            ? std::filesystem::current_path().string()
            : working_dir;
        bp::child child_process(
            bp::exe = binary,
            bp::args = args,
            bp::start_dir = start_dir,
            bp::std_in < bp::null,
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string());
        result.launched = true;

        int status = 0;
        const pid_t pid = child_process.id();
        bool finished = WaitWithDeadline(pid, status, std::chrono::steady_clock::now() + timeout,
                                         std::chrono::milliseconds(50));
        if (!finished) {
            result.timed_out = true;
            ::kill(pid, SIGTERM);
            finished = WaitWithDeadline(pid, status,
                                        std::chrono::steady_clock::now() + std::chrono::seconds(2),
                                        std::chrono::milliseconds(100));
            if (!finished) {
                ::kill(pid, SIGKILL);
                ::waitpid(pid, &status, 0);
            }
        }
        child_process.detach();

        if (finished) {
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = 128 + WTERMSIG(status);
            }
        } else {
            result.exit_code = 124;
        }
    } catch (const bp::process_error& ex) {
        result.exit_code = -1;
        result.error = std::string("exec failed: ") + ex.what();
        clubhouse::utils::LogDebug("process", "command launch failed",
                                   {{"binary", binary}, {"error", ex.what()}});
    }

    auto read_file = [](const std::filesystem::path& path, std::string& target) {
        std::ifstream input(path);
        if (!input.is_open()) {
            return;
        }
        std::ostringstream stream;
        stream << input.rdbuf();
        target += stream.str();
    };
    read_file(stdout_path, result.output);
    read_file(stderr_path, result.error);

    std::error_code ec;
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    return result;
}

}  // namespace clubhouse::process
