#include "child_process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>
#include <vector>

#include "logging/logger.hpp"

extern char **environ;

namespace daemon_runner {
namespace process {

namespace {

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

bool make_pipe(Pipe &out) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) {
        return false;
    }
    out.read_end.reset(fds[0]);
    out.write_end.reset(fds[1]);
    return true;
}

// Child side of a failed exec: report errno through the status pipe and exit.
// Only async-signal-safe calls are allowed here.
[[noreturn]] void child_fail(int status_fd) {
    int err = errno;
    ssize_t ignored = ::write(status_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

}  // namespace

std::string ExitStatus::to_string() const {
    if (reason == Reason::EXITED) {
        return "exit code " + std::to_string(code);
    }
    return "signal " + std::to_string(code);
}

ExitStatus ExitStatus::from_wait_status(int wait_status) {
    ExitStatus status;
    if (WIFSIGNALED(wait_status)) {
        status.reason = Reason::SIGNALED;
        status.code = WTERMSIG(wait_status);
    } else {
        status.reason = Reason::EXITED;
        status.code = WEXITSTATUS(wait_status);
    }
    return status;
}

ChildProcess::ChildProcess(Command command) : command_(std::move(command)) {}

ChildProcess::~ChildProcess() {
    if (pid_ <= 0 || exit_status_) {
        return;
    }

    // The process has usually been stopped already; a failing kill is expected then.
    ::kill(pid_, SIGKILL);

    int wait_status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &wait_status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == pid_) {
        LOG_DEBUG("[process] Killed and reaped PID " << pid_ << " ("
                                                      << ExitStatus::from_wait_status(wait_status).to_string() << ")");
    }
}

bool ChildProcess::spawn() {
    error_.clear();

    if (pid_ > 0) {
        error_ = "Process already spawned (PID=" + std::to_string(pid_) + ")";
        return false;
    }
    if (command_.program.empty()) {
        error_ = "Failed to spawn `" + command_.to_string() + "`: empty program path";
        return false;
    }

    Pipe stdout_pipe;
    Pipe stderr_pipe;
    Pipe status_pipe;
    if (!make_pipe(stdout_pipe) || !make_pipe(stderr_pipe) || !make_pipe(status_pipe)) {
        error_ = "Failed to spawn `" + command_.to_string() + "`: pipe creation failed: " + std::strerror(errno);
        return false;
    }

    UniqueFd dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!dev_null.valid()) {
        error_ = "Failed to spawn `" + command_.to_string() + "`: cannot open /dev/null: " + std::strerror(errno);
        return false;
    }

    // Everything the child needs is allocated before fork
    std::vector<char *> argv;
    argv.reserve(command_.args.size() + 2);
    argv.push_back(const_cast<char *>(command_.program.c_str()));
    for (const auto &a : command_.args) {
        argv.push_back(const_cast<char *>(a.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    std::vector<char *> envp;
    if (!command_.env.empty()) {
        for (char **e = environ; e != nullptr && *e != nullptr; ++e) {
            std::string entry(*e);
            auto eq = entry.find('=');
            std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
            if (command_.env.count(key) == 0) {
                env_storage.push_back(entry);
            }
        }
        for (const auto &[key, value] : command_.env) {
            env_storage.push_back(key + "=" + value);
        }
        for (auto &entry : env_storage) {
            envp.push_back(const_cast<char *>(entry.c_str()));
        }
        envp.push_back(nullptr);
    }
    const char *working_dir = command_.working_dir.empty() ? nullptr : command_.working_dir.c_str();

    pid_t pid = fork();
    if (pid < 0) {
        error_ = "Failed to spawn `" + command_.to_string() + "`: fork failed: " + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        // Child process
        int status_fd = status_pipe.write_end.get();

        sigset_t empty_set;
        sigemptyset(&empty_set);
        sigprocmask(SIG_SETMASK, &empty_set, nullptr);

        if (dup2(dev_null.get(), STDIN_FILENO) < 0 || dup2(stdout_pipe.write_end.get(), STDOUT_FILENO) < 0 ||
            dup2(stderr_pipe.write_end.get(), STDERR_FILENO) < 0) {
            child_fail(status_fd);
        }
        if (working_dir != nullptr && chdir(working_dir) < 0) {
            child_fail(status_fd);
        }
        if (!envp.empty()) {
            environ = envp.data();
        }
        execvp(argv[0], argv.data());
        child_fail(status_fd);
    }

    // Parent process
    stdout_pipe.write_end.reset();
    stderr_pipe.write_end.reset();
    status_pipe.write_end.reset();
    dev_null.reset();

    // EOF on the status pipe means exec succeeded (close-on-exec closed it)
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe.read_end.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        int wait_status = 0;
        while (waitpid(pid, &wait_status, 0) < 0 && errno == EINTR) {
        }
        error_ = "Failed to spawn `" + command_.to_string() + "`: " + std::strerror(child_errno);
        LOG_ERROR("[process] " << error_);
        return false;
    }

    pid_ = pid;
    stdout_read_ = std::move(stdout_pipe.read_end);
    stderr_read_ = std::move(stderr_pipe.read_end);

    LOG_DEBUG("[process] Spawned `" << command_.to_string() << "` (PID=" << pid_ << ")");
    return true;
}

bool ChildProcess::try_wait(std::optional<ExitStatus> &status) {
    if (exit_status_) {
        status = exit_status_;
        return true;
    }
    if (pid_ <= 0) {
        error_ = "Process not spawned";
        return false;
    }

    int wait_status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &wait_status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == 0) {
        status.reset();
        return true;
    }
    if (result < 0) {
        error_ = "waitpid failed for PID " + std::to_string(pid_) + ": " + std::strerror(errno);
        return false;
    }

    exit_status_ = ExitStatus::from_wait_status(wait_status);
    status = exit_status_;
    return true;
}

bool ChildProcess::terminate() { return send_signal(SIGTERM, "SIGTERM"); }

bool ChildProcess::kill() { return send_signal(SIGKILL, "SIGKILL"); }

bool ChildProcess::send_signal(int signal, const char *signal_name) {
    if (pid_ <= 0) {
        error_ = "Process not spawned";
        return false;
    }
    // Once reaped the pid may have been recycled; never signal it
    if (exit_status_) {
        return true;
    }

    if (::kill(pid_, signal) < 0) {
        if (errno == ESRCH) {
            return true;
        }
        error_ = std::string("Failed to send ") + signal_name + " to PID " + std::to_string(pid_) + ": " +
                 std::strerror(errno);
        return false;
    }

    LOG_DEBUG("[process] Sent " << signal_name << " to PID " << pid_);
    return true;
}

}  // namespace process
}  // namespace daemon_runner
