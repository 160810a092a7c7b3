#include "system/command_runner.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char **environ;

namespace wdi {

namespace {

using Clock = std::chrono::steady_clock;

// Exit status the shell convention uses for "command not found".
constexpr int kExitCommandNotFound = 127;

class SpawnFileActions final {
  public:
    SpawnFileActions() { ok_ = ::posix_spawn_file_actions_init(&fa_) == 0; }
    SpawnFileActions(const SpawnFileActions&) = delete;
    SpawnFileActions& operator=(const SpawnFileActions&) = delete;
    ~SpawnFileActions() {
        if (ok_) ::posix_spawn_file_actions_destroy(&fa_);
    }

    bool ok() const { return ok_; }
    posix_spawn_file_actions_t* get() { return &fa_; }

  private:
    posix_spawn_file_actions_t fa_{};
    bool ok_ = false;
};

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void KillAndReap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

int RemainingMs(Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

Result SetCloseOnExec(int fd) {
    const int flags = ::fcntl(fd, F_GETFD);
    if (flags < 0 || ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) < 0) {
        const int err = errno;
        return Result::Fail(err, "fcntl(FD_CLOEXEC) failed: " + std::string(std::strerror(err)));
    }
    return Result::Ok();
}

} // namespace

Result PosixCommandRunner::Run(const std::vector<std::string>& argv,
                               std::chrono::milliseconds timeout,
                               CommandOutput& out) const {
    out = CommandOutput{};
    if (argv.empty() || argv.front().empty()) {
        return Result::Fail(ErrorKind::InvalidArgument, "empty command line");
    }

    int pipe_fds[2];
    if (::pipe(pipe_fds) != 0) {
        const int err = errno;
        return Result::Fail(err, "pipe failed: " + std::string(std::strerror(err)));
    }
    Fd read_end(pipe_fds[0]);
    Fd write_end(pipe_fds[1]);
    // Children spawned concurrently by other workflows must not inherit either end.
    if (auto r = SetCloseOnExec(read_end.Get()); !r.is_ok()) return r;
    if (auto r = SetCloseOnExec(write_end.Get()); !r.is_ok()) return r;

    SpawnFileActions actions;
    if (!actions.ok()) return Result::Fail(ErrorKind::Io, "posix_spawn_file_actions_init failed");
    ::posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    ::posix_spawn_file_actions_adddup2(actions.get(), write_end.Get(), STDOUT_FILENO);
    ::posix_spawn_file_actions_addopen(actions.get(), STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    std::vector<std::string> argv_strings(argv);
    std::vector<char*> argv_pointers;
    argv_pointers.reserve(argv_strings.size() + 1);
    for (auto& s : argv_strings) argv_pointers.push_back(s.data());
    argv_pointers.push_back(nullptr);

    pid_t pid = 0;
    const int spawn_rc = ::posix_spawnp(&pid, argv_strings.front().c_str(), actions.get(), nullptr,
                                        argv_pointers.data(), environ);
    write_end.Close();

    if (spawn_rc != 0) {
        LogDebug("spawn %s: %s", argv.front().c_str(), std::strerror(spawn_rc));
        return Result::Ok();
    }

    const auto deadline = Clock::now() + timeout;
    std::array<char, 4096> buf{};

    while (true) {
        pollfd pfd{.fd = read_end.Get(), .events = POLLIN, .revents = 0};
        const int remaining = RemainingMs(deadline);
        if (remaining == 0) {
            KillAndReap(pid);
            return Result::Fail(ErrorKind::Timeout,
                                "command timed out after " + std::to_string(timeout.count()) +
                                    " ms: " + argv.front());
        }

        const int pr = ::poll(&pfd, 1, remaining);
        if (pr < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            KillAndReap(pid);
            return Result::Fail(err, "poll failed: " + std::string(std::strerror(err)));
        }
        if (pr == 0) continue;

        const ssize_t n = ::read(read_end.Get(), buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            const int err = errno;
            KillAndReap(pid);
            return Result::Fail(err, "read failed: " + std::string(std::strerror(err)));
        }
        if (n == 0) break;
        if (out.stdout_text.size() < kMaxOutputBytes) {
            out.stdout_text.append(buf.data(), static_cast<size_t>(n));
        }
    }

    // stdout is closed; give the child the rest of the budget to exit.
    while (true) {
        int status = 0;
        const pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            out.exit_code = DecodeWaitStatus(status);
            break;
        }
        if (w < 0 && errno != EINTR) {
            const int err = errno;
            return Result::Fail(err, "waitpid failed: " + std::string(std::strerror(err)));
        }
        if (RemainingMs(deadline) == 0) {
            KillAndReap(pid);
            return Result::Fail(ErrorKind::Timeout,
                                "command did not exit within " + std::to_string(timeout.count()) +
                                    " ms: " + argv.front());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    out.launched = out.exit_code != kExitCommandNotFound;
    LogDebug("command %s exited %d (%zu bytes)", argv.front().c_str(), out.exit_code,
             out.stdout_text.size());
    return Result::Ok();
}

std::shared_ptr<const ICommandRunner> DefaultCommandRunner() {
    static const std::shared_ptr<const ICommandRunner> kDefault =
        std::make_shared<PosixCommandRunner>();
    return kDefault;
}

} // namespace wdi
