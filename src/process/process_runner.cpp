#include "process/process_runner.hpp"

#include <boost/process.hpp>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <optional>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace runbox::process {
namespace bp = boost::process;
namespace {

std::atomic<unsigned long> g_capture_counter{0};

struct CapturePaths {
    std::filesystem::path stdout_path;
    std::filesystem::path stderr_path;
};

std::optional<CapturePaths> MakeCapturePaths(std::string& error) {
    std::error_code ec;
    const auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        error = "no temp directory for output capture: " + ec.message();
        return std::nullopt;
    }
    const auto stamp = std::to_string(::getpid()) + "_" +
        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
        std::to_string(g_capture_counter.fetch_add(1));
    return CapturePaths{dir / ("runbox_stdout_" + stamp + ".log"),
                        dir / ("runbox_stderr_" + stamp + ".log")};
}

std::string ReadAndRemove(const std::filesystem::path& path) {
    std::ostringstream buffer;
    {
        std::ifstream input(path, std::ios::in | std::ios::binary);
        if (input.is_open()) {
            buffer << input.rdbuf();
        }
    }
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return buffer.str();
}

// Polls until the child exits or the deadline passes. Returns true when reaped.
bool PollUntil(pid_t pid, int& status, std::chrono::steady_clock::time_point deadline,
               std::chrono::milliseconds interval) {
    while (std::chrono::steady_clock::now() < deadline) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return true;
        }
        if (waited < 0 && errno != EINTR) {
            return false;
        }
        std::this_thread::sleep_for(interval);
    }
    return false;
}

bool BlockingWait(pid_t pid, int& status) {
    while (true) {
        const auto waited = ::waitpid(pid, &status, 0);
        if (waited == pid) {
            return true;
        }
        if (waited < 0 && errno != EINTR) {
            return false;
        }
    }
}

}  // namespace

ProcessResult ProcessRunner::Run(const std::vector<std::string>& argv,
                                 const std::filesystem::path& working_dir,
                                 std::chrono::seconds timeout) {
    ProcessResult result{};
    if (argv.empty()) {
        result.spawn_failed = true;
        result.error = "empty command";
        return result;
    }

    boost::filesystem::path executable;
    if (argv.front().find('/') != std::string::npos) {
        executable = argv.front();
    } else {
        executable = bp::search_path(argv.front());
    }
    if (executable.empty()) {
        result.spawn_failed = true;
        result.error = "interpreter not found: " + argv.front();
        return result;
    }

    const auto capture_paths = MakeCapturePaths(result.error);
    if (!capture_paths) {
        result.spawn_failed = true;
        return result;
    }
    const auto& capture = *capture_paths;
    const std::vector<std::string> args(argv.begin() + 1, argv.end());

    try {
        bp::child child_process(
            bp::exe = executable,
            bp::args = args,
            bp::start_dir = working_dir.string(),
            bp::std_in.close(),
            bp::std_out > capture.stdout_path.string(),
            bp::std_err > capture.stderr_path.string());

        const pid_t pid = child_process.id();
        int status = 0;
        bool finished = false;
        if (timeout.count() <= 0) {
            finished = BlockingWait(pid, status);
        } else {
            finished = PollUntil(pid, status, std::chrono::steady_clock::now() + timeout,
                                 std::chrono::milliseconds(50));
            if (!finished) {
                result.timed_out = true;
                ::kill(pid, SIGTERM);
                finished = PollUntil(pid, status,
                                     std::chrono::steady_clock::now() + std::chrono::seconds(2),
                                     std::chrono::milliseconds(100));
                if (!finished) {
                    ::kill(pid, SIGKILL);
                    finished = BlockingWait(pid, status);
                }
            }
        }
        // The pid is reaped by now and may be recycled; ~child must not touch it.
        child_process.detach();

        if (finished) {
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = 128 + WTERMSIG(status);
            }
        } else {
            result.error = std::string("waitpid failed: ") + std::strerror(errno);
        }
    } catch (const bp::process_error& ex) {
        result.spawn_failed = true;
        result.error = std::string("exec failed: ") + ex.what();
    }

    result.std_out = ReadAndRemove(capture.stdout_path);
    result.std_err = ReadAndRemove(capture.stderr_path);
    return result;
}

}  // namespace runbox::process
