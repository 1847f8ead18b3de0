// EN: Implementation of the ProcessRunner class. fork/exec with process groups, log redirection and timeouts.
// FR: Implémentation de la classe ProcessRunner. fork/exec avec groupes de processus, redirection et timeouts.

#include "infrastructure/system/process_runner.hpp"
#include "infrastructure/logging/logger.hpp"
#include <cerrno>
#include <cstring>
#include <thread>
#include <unordered_map>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace CIP {

namespace {

int openLogFile(const std::filesystem::path& log_path) {
    std::error_code ec;
    if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path(), ec);
        if (ec) {
            throw ProcessError("cannot create log directory " + log_path.parent_path().string() +
                               ": " + ec.message());
        }
    }

    int fd = ::open(log_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw ProcessError("cannot open log file " + log_path.string() + ": " + std::strerror(errno));
    }
    return fd;
}

int exitCodeFromStatus(int status, int& term_signal) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        term_signal = WTERMSIG(status);
        return 128 + term_signal;
    }
    return 1;
}

} // namespace

ProcessRunner::ProcessRunner(std::chrono::milliseconds poll_interval)
    : poll_interval_(poll_interval) {
}

std::vector<std::string> ProcessRunner::buildEnvironment(
    const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::unordered_map<std::string, size_t> index;
    std::vector<std::string> entries;

    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        auto eq = entry.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        index[entry.substr(0, eq)] = entries.size();
        entries.push_back(std::move(entry));
    }

    for (const auto& [key, value] : overrides) {
        auto it = index.find(key);
        if (it != index.end()) {
            entries[it->second] = key + "=" + value;
        } else {
            index[key] = entries.size();
            entries.push_back(key + "=" + value);
        }
    }
    return entries;
}

// EN: Everything the child needs is prepared before fork; the child only calls async-signal-safe functions.
// FR: Tout ce dont l'enfant a besoin est préparé avant fork ; l'enfant n'appelle que des fonctions async-signal-safe.
ProcessResult ProcessRunner::run(const ProcessSpec& spec, const CancelPredicate& should_cancel) const {
    std::vector<std::string> env_entries = buildEnvironment(spec.environment);
    std::vector<char*> envp;
    envp.reserve(env_entries.size() + 1);
    for (auto& entry : env_entries) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::string shell = "/bin/sh";
    std::string flag = "-c";
    std::string command = spec.command;
    std::vector<char*> argv{shell.data(), flag.data(), command.data(), nullptr};

    std::string workdir = spec.working_directory.string();
    int log_fd = openLogFile(spec.log_path);
    int null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (null_fd < 0) {
        ::close(log_fd);
        throw ProcessError(std::string("cannot open /dev/null: ") + std::strerror(errno));
    }

    auto start = std::chrono::steady_clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(log_fd);
        ::close(null_fd);
        throw ProcessError(std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        if (::dup2(null_fd, STDIN_FILENO) < 0 ||
            ::dup2(log_fd, STDOUT_FILENO) < 0 ||
            ::dup2(log_fd, STDERR_FILENO) < 0) {
            _exit(127);
        }
        if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
            static const char msg[] = "cipctl: cannot change to working directory\n";
            ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)ignored;
            _exit(127);
        }
        ::execve(argv[0], argv.data(), envp.data());
        _exit(127);
    }

    // EN: Also set the group from the parent so kill(-pid) works even if the child has not run yet.
    // FR: Définit aussi le groupe depuis le parent pour que kill(-pid) fonctionne même si l'enfant n'a pas démarré.
    ::setpgid(pid, pid);
    ::close(log_fd);
    ::close(null_fd);

    ProcessResult result;
    std::optional<std::chrono::steady_clock::time_point> kill_deadline;
    bool killed = false;

    while (true) {
        int status = 0;
        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            killAndReap(pid);
            throw ProcessError(std::string("waitpid failed: ") + std::strerror(err));
        }

        if (waited == pid) {
            result.exit_code = exitCodeFromStatus(status, result.term_signal);
            if (result.outcome == ProcessOutcome::EXITED && result.term_signal != 0) {
                result.outcome = ProcessOutcome::SIGNALED;
            }
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (!kill_deadline) {
            if (should_cancel && should_cancel()) {
                result.outcome = ProcessOutcome::CANCELLED;
            } else if (spec.timeout && now - start >= *spec.timeout) {
                result.outcome = ProcessOutcome::TIMED_OUT;
            }

            if (result.outcome != ProcessOutcome::EXITED) {
                LOG_DEBUG("process", "Sending SIGTERM to process group " + std::to_string(pid));
                ::kill(-pid, SIGTERM);
                kill_deadline = now + spec.kill_grace;
            }
        } else if (!killed && now >= *kill_deadline) {
            LOG_WARN("process", "Process group " + std::to_string(pid) + " ignored SIGTERM, sending SIGKILL");
            ::kill(-pid, SIGKILL);
            killed = true;
        }

        std::this_thread::sleep_for(poll_interval_);
    }

    // EN: Reap stragglers left in the group by the shell.
    // FR: Nettoie les processus restants du groupe laissés par le shell.
    if (result.outcome == ProcessOutcome::CANCELLED || result.outcome == ProcessOutcome::TIMED_OUT) {
        ::kill(-pid, SIGKILL);
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

void ProcessRunner::killAndReap(pid_t pid) {
    ::kill(-pid, SIGKILL);
    // EN: Blocking reap so no zombie is left behind
    // FR: Attente bloquante pour ne laisser aucun zombie
    while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
    }
}

std::string ProcessRunner::outcomeToString(ProcessOutcome outcome) {
    switch (outcome) {
        case ProcessOutcome::EXITED: return "exited";
        case ProcessOutcome::SIGNALED: return "signaled";
        case ProcessOutcome::TIMED_OUT: return "timed_out";
        case ProcessOutcome::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

} // namespace CIP
