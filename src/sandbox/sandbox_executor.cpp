#include "sandbox/sandbox_executor.hpp"

#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <thread>
#include <grp.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include "exercise/exercise_codec.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace gradebox::sandbox {
namespace bp = boost::process::v1;
namespace {

constexpr uid_t kNobodyId = 65534;
constexpr auto kPollInterval = std::chrono::milliseconds(10);

// Runs in the child between fork and exec.
struct ChildConfinement : bp::extend::handler {
    rlim_t cpu_seconds = 3;
    rlim_t address_space_bytes = 0;
    rlim_t file_size_bytes = 0;
    rlim_t max_processes = 0;
    bool drop_privileges = false;
    // Unprivileged runners isolate through a fresh user namespace instead.
    bool user_namespace = false;

    template <typename Executor>
    void on_exec_setup(Executor& exec) const {
        if (::setpgid(0, 0) != 0) {
            exec.set_error(std::error_code(errno, std::system_category()), "setpgid failed");
            return;
        }
        const struct {
            int resource;
            rlim_t value;
        } limits[] = {
            {RLIMIT_CPU, cpu_seconds},
            {RLIMIT_AS, address_space_bytes},
            {RLIMIT_FSIZE, file_size_bytes},
            {RLIMIT_NPROC, max_processes},
            {RLIMIT_CORE, 0},
        };
        for (const auto& limit : limits) {
            const struct rlimit value{limit.value, limit.value};
            if (::setrlimit(limit.resource, &value) != 0) {
                exec.set_error(std::error_code(errno, std::system_category()), "setrlimit failed");
                return;
            }
        }
        if (user_namespace) {
            if (::unshare(CLONE_NEWUSER | CLONE_NEWNET) != 0) {
                exec.set_error(std::error_code(errno, std::system_category()),
                               "unshare(CLONE_NEWUSER | CLONE_NEWNET) failed");
            }
            return;
        }
        if (!drop_privileges) {
            return;
        }
        if (::unshare(CLONE_NEWNET) != 0) {
            exec.set_error(std::error_code(errno, std::system_category()), "unshare(CLONE_NEWNET) failed");
            return;
        }
        if (::setgroups(0, nullptr) != 0 || ::setgid(kNobodyId) != 0 || ::setuid(kNobodyId) != 0) {
            exec.set_error(std::error_code(errno, std::system_category()), "privilege drop failed");
        }
    }
};

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

bool WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        return false;
    }
    output << content;
    return static_cast<bool>(output);
}

long long FileSize(const std::filesystem::path& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<long long>(size);
}

ExecResult Rejected(const std::string& message) {
    ExecResult result{};
    result.rejected = true;
    result.stderr_text = message;
    return result;
}

std::optional<std::string> CheckDataset(const exercise::Dataset& dataset) {
    if (dataset.files.size() > exercise::kMaxDatasetFiles) {
        return "Dataset has too many files";
    }
    for (const auto& file : dataset.files) {
        if (!exercise::IsSafeDatasetName(file.name)) {
            return "Invalid dataset file name: " + file.name;
        }
        if (file.content.size() > exercise::kMaxDatasetFileBytes) {
            return "Dataset file too large: " + file.name;
        }
    }
    return std::nullopt;
}

// Removes the scratch directory when the run leaves scope.
class ScratchDir {
public:
    explicit ScratchDir(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            utils::LogWarn("sandbox", "cannot remove " + path_.string() + ": " + ec.message());
        }
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace

bool NetworkIsolationAvailable() {
    static const bool kAvailable = []() {
        const int flags = ::geteuid() == 0 ? CLONE_NEWNET : CLONE_NEWUSER | CLONE_NEWNET;
        const pid_t pid = ::fork();
        if (pid < 0) {
            utils::LogError("sandbox", std::string("isolation check fork failed: ") + std::strerror(errno));
            return false;
        }
        if (pid == 0) {
            ::_exit(::unshare(flags) == 0 ? 0 : 1);
        }
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                return false;
            }
        }
        return WIFEXITED(status) && WEXITSTATUS(status) == 0;
    }();
    return kAvailable;
}

std::string TimeoutMessage(int timeout_ms) {
    const int seconds = (timeout_ms + 999) / 1000;
    return "Error: Execution timeout (" + std::to_string(seconds) + " seconds exceeded)";
}

ExecResult SandboxExecutor::Run(const ExecRequest& request) {
    const auto& limits = request.limits;
    if (static_cast<long long>(request.source.size()) > limits.max_code_bytes) {
        return Rejected("Code exceeds maximum size (" + std::to_string(limits.max_code_bytes) + " bytes)");
    }
    if (const auto error = CheckDataset(request.dataset)) {
        return Rejected(*error);
    }

    std::string interpreter = request.interpreter;
    if (interpreter.find('/') == std::string::npos) {
        interpreter = bp::search_path(request.interpreter).string();
    }
    if (interpreter.empty()) {
        return Rejected("Error: interpreter not found: " + request.interpreter);
    }

    std::error_code ec;
    const std::filesystem::path root = request.scratch_root.empty()
        ? std::filesystem::temp_directory_path(ec)
        : std::filesystem::path(request.scratch_root);
    ScratchDir scratch(root / ("gradebox-run-" + utils::GenerateRequestId()));
    std::filesystem::create_directories(scratch.Path(), ec);
    if (ec) {
        utils::LogError("sandbox", "cannot create scratch dir: " + ec.message());
        return Rejected("Error: sandbox unavailable");
    }

    const bool as_root = ::geteuid() == 0;
    const auto source_path = scratch.Path() / "main.py";
    bool written = WriteFile(source_path, request.source);
    for (const auto& file : request.dataset.files) {
        written = written && WriteFile(scratch.Path() / file.name, file.content);
    }
    if (!written) {
        return Rejected("Error: cannot stage program files");
    }
    if (as_root) {
        std::filesystem::permissions(scratch.Path(), std::filesystem::perms::all, ec);
    }

    // Output streams live outside the scratch dir so the program cannot touch them.
    const auto stamp = utils::GenerateRequestId();
    const auto stdout_path = root / ("gradebox-stdout-" + stamp + ".log");
    const auto stderr_path = root / ("gradebox-stderr-" + stamp + ".log");

    bp::environment env;
    env["PYTHONUNBUFFERED"] = "1";
    env["PYTHONDONTWRITEBYTECODE"] = "1";
    env["PATH"] = "/usr/local/bin:/usr/bin:/bin";
    env["HOME"] = scratch.Path().string();

    ChildConfinement confinement;
    confinement.cpu_seconds = static_cast<rlim_t>((limits.timeout_ms + 999) / 1000 + 1);
    confinement.address_space_bytes = static_cast<rlim_t>(limits.memory_limit_mb) * 1024 * 1024;
    confinement.file_size_bytes = static_cast<rlim_t>(limits.max_output_bytes + 1);
    confinement.max_processes = static_cast<rlim_t>(limits.max_processes);
    confinement.drop_privileges = as_root;
    confinement.user_namespace = !as_root && NetworkIsolationAvailable();

    ExecResult result{};
    const auto started = std::chrono::steady_clock::now();
    try {
        bp::child child_process(
            interpreter,
            source_path.string(),
            env,
            bp::start_dir = scratch.Path().string(),
            bp::std_in < bp::null,
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string(),
            confinement);

        const auto deadline = started + std::chrono::milliseconds(limits.timeout_ms);
        const pid_t pid = child_process.id();
        bool finished = false;
        bool wait_failed = false;
        int status = 0;
        while (std::chrono::steady_clock::now() < deadline) {
            const auto waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                finished = true;
                break;
            }
            if (waited < 0) {
                if (errno == EINTR) {
                    continue;
                }
                utils::LogError("sandbox", std::string("waitpid failed: ") + std::strerror(errno));
                wait_failed = true;
                break;
            }
            std::this_thread::sleep_for(kPollInterval);
        }
        if (wait_failed) {
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            result.exit_code = -1;
        } else if (!finished) {
            result.timed_out = true;
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
        } else {
            // Reap stragglers the program left in its group.
            ::kill(-pid, SIGKILL);
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = 128 + WTERMSIG(status);
            }
        }
        child_process.detach();
    } catch (const bp::process_error& ex) {
        utils::LogError("sandbox", std::string("spawn failed: ") + ex.what());
        result.exit_code = -1;
        result.stderr_text = std::string("Error: exec failed: ") + ex.what();
    }
    result.wall_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    const auto stdout_size = FileSize(stdout_path);
    const auto stderr_size = FileSize(stderr_path);
    if (result.timed_out) {
        result.exit_code = 124;
        result.stdout_text.clear();
        result.stderr_text = TimeoutMessage(limits.timeout_ms);
    } else if (stdout_size > limits.max_output_bytes || stderr_size > limits.max_output_bytes) {
        result.output_exceeded = true;
        result.stdout_text.clear();
        result.stderr_text = "Error: Output exceeded " + std::to_string(limits.max_output_bytes) + " bytes";
    } else if (result.stderr_text.empty()) {
        result.stdout_text = utils::Trim(ReadFile(stdout_path));
        result.stderr_text = utils::Trim(ReadFile(stderr_path));
    }

    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    return result;
}

}  // namespace gradebox::sandbox
