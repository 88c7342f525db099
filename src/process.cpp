#include "process.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace {

// Read-end buffer size per poll wakeup
constexpr size_t READ_CHUNK_SIZE = 64 * 1024;

// Grace period between SIGTERM and SIGKILL
constexpr auto TERMINATE_GRACE = std::chrono::milliseconds(100);

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

}  // namespace

Subprocess::Subprocess(const std::vector<std::string>& argv, const fs::path& workingDir) {
    if (argv.empty()) {
        launchFailed_ = true;
        launchError_ = "empty command";
        return;
    }

    // Everything the child touches is prepared before fork()
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);
    const std::string dir = workingDir.string();

    // O_CLOEXEC keeps concurrently spawned children from inheriting each other's pipes
    int stdoutPipe[2];
    int stderrPipe[2];
    int errorPipe[2];
    if (::pipe2(stdoutPipe, O_CLOEXEC) < 0) {
        launchFailed_ = true;
        launchError_ = std::string("pipe: ") + std::strerror(errno);
        return;
    }
    if (::pipe2(stderrPipe, O_CLOEXEC) < 0) {
        launchFailed_ = true;
        launchError_ = std::string("pipe: ") + std::strerror(errno);
        ::close(stdoutPipe[0]);
        ::close(stdoutPipe[1]);
        return;
    }
    if (::pipe2(errorPipe, O_CLOEXEC) < 0) {
        launchFailed_ = true;
        launchError_ = std::string("pipe: ") + std::strerror(errno);
        for (int fd : {stdoutPipe[0], stdoutPipe[1], stderrPipe[0], stderrPipe[1]}) {
            ::close(fd);
        }
        return;
    }

    pid_ = ::fork();
    if (pid_ < 0) {
        launchFailed_ = true;
        launchError_ = std::string("fork: ") + std::strerror(errno);
        for (int fd : {stdoutPipe[0], stdoutPipe[1], stderrPipe[0], stderrPipe[1],
                       errorPipe[0], errorPipe[1]}) {
            ::close(fd);
        }
        return;
    }

    if (pid_ == 0) {
        // Child process: only async-signal-safe calls from here on
        ::dup2(stdoutPipe[1], STDOUT_FILENO);
        ::dup2(stderrPipe[1], STDERR_FILENO);

        int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }

        if (!dir.empty() && ::chdir(dir.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = ::write(errorPipe[1], &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }

        ::execvp(args[0], args.data());

        int err = errno;
        ssize_t ignored = ::write(errorPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent process
    ::close(stdoutPipe[1]);
    ::close(stderrPipe[1]);
    ::close(errorPipe[1]);
    stdoutFd_ = stdoutPipe[0];
    stderrFd_ = stderrPipe[0];

    // The error pipe closes on a successful exec; otherwise it carries errno
    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    ::close(errorPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        launchFailed_ = true;
        launchError_ = argv[0] + ": " + std::strerror(childErrno);
        closeFds();
        reap(0);
    }
}

Subprocess::~Subprocess() {
    if (pid_ > 0 && !exited_) {
        terminate();
    }
    closeFds();
}

bool Subprocess::readInto(int& fd, std::string& buffer) {
    char chunk[READ_CHUNK_SIZE];
    ssize_t n = ::read(fd, chunk, sizeof(chunk));
    if (n > 0) {
        buffer.append(chunk, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    closeFd(fd);
    return false;
}

bool Subprocess::pump(int timeoutMs) {
    pollfd fds[2];
    nfds_t count = 0;
    if (stdoutFd_ >= 0) {
        fds[count++] = {stdoutFd_, POLLIN, 0};
    }
    if (stderrFd_ >= 0) {
        fds[count++] = {stderrFd_, POLLIN, 0};
    }
    if (count == 0) {
        return false;
    }

    int ready = ::poll(fds, count, timeoutMs);
    if (ready < 0) {
        if (errno == EINTR) {
            return true;
        }
        closeFds();
        return false;
    }
    if (ready == 0) {
        // Timed out with nothing to read
        return false;
    }

    for (nfds_t i = 0; i < count; ++i) {
        if (fds[i].revents == 0) {
            continue;
        }
        if (fds[i].fd == stdoutFd_) {
            readInto(stdoutFd_, stdoutBuffer_);
        } else if (fds[i].fd == stderrFd_) {
            readInto(stderrFd_, stderrBuffer_);
        }
    }
    return stdoutFd_ >= 0 || stderrFd_ >= 0;
}

bool Subprocess::readLine(std::string& line) {
    bool timedOut = false;
    return readLine(line, std::chrono::steady_clock::time_point::max(), timedOut);
}

bool Subprocess::readLine(std::string& line, std::chrono::steady_clock::time_point deadline, bool& timedOut) {
    timedOut = false;
    while (true) {
        size_t newline = stdoutBuffer_.find('\n', stdoutPos_);
        if (newline != std::string::npos) {
            line.assign(stdoutBuffer_, stdoutPos_, newline - stdoutPos_);
            stdoutPos_ = newline + 1;

            // Compact once the consumed prefix dominates the buffer
            if (stdoutPos_ > READ_CHUNK_SIZE && stdoutPos_ * 2 > stdoutBuffer_.size()) {
                stdoutBuffer_.erase(0, stdoutPos_);
                stdoutPos_ = 0;
            }
            return true;
        }

        if (stdoutFd_ < 0) {
            // EOF: hand out a trailing line without newline, once
            if (stdoutPos_ < stdoutBuffer_.size()) {
                line.assign(stdoutBuffer_, stdoutPos_, std::string::npos);
                stdoutPos_ = stdoutBuffer_.size();
                return true;
            }
            return false;
        }

        int waitMs = -1;
        if (deadline != std::chrono::steady_clock::time_point::max()) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                timedOut = true;
                return false;
            }
            waitMs = static_cast<int>(std::min<long long>(remaining, 1000));
        }
        pump(waitMs);
    }
}

std::string Subprocess::takeStdout() {
    std::string out = stdoutBuffer_.substr(stdoutPos_);
    stdoutBuffer_.clear();
    stdoutPos_ = 0;
    return out;
}

int Subprocess::wait() {
    if (pid_ <= 0) {
        return exitCode_;
    }
    while (pump(-1)) {
    }
    if (!exited_) {
        reap(0);
    }
    return exitCode_;
}

bool Subprocess::waitUntil(std::chrono::steady_clock::time_point deadline) {
    if (pid_ <= 0) {
        return true;
    }
    while (stdoutFd_ >= 0 || stderrFd_ >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            return false;
        }
        pump(static_cast<int>(std::min<long long>(remaining, 1000)));
    }
    // Both pipes closed; the child is exiting or has exited
    while (!exited_) {
        reap(WNOHANG);
        if (exited_) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

void Subprocess::terminate() {
    if (pid_ <= 0 || exited_) {
        closeFds();
        return;
    }

    ::kill(pid_, SIGTERM);
    auto giveUp = std::chrono::steady_clock::now() + TERMINATE_GRACE;
    while (!exited_ && std::chrono::steady_clock::now() < giveUp) {
        reap(WNOHANG);
        if (!exited_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
    if (!exited_) {
        ::kill(pid_, SIGKILL);
        reap(0);
    }
    closeFds();
}

void Subprocess::closeFds() {
    closeFd(stdoutFd_);
    closeFd(stderrFd_);
}

void Subprocess::reap(int options) {
    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, options);
    } while (result < 0 && errno == EINTR);

    if (result == pid_) {
        exited_ = true;
        if (WIFEXITED(status)) {
            exitCode_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exitCode_ = -WTERMSIG(status);
        }
    } else if (result < 0) {
        // Already reaped elsewhere; nothing left to wait for
        exited_ = true;
    }
}

ProcessResult runProcess(const std::vector<std::string>& argv,
                         const fs::path& workingDir,
                         std::chrono::milliseconds timeout) {
    ProcessResult result;
    const auto startTime = std::chrono::steady_clock::now();
    const auto deadline = startTime + timeout;

    Subprocess process(argv, workingDir);
    if (process.launchFailed()) {
        result.launchFailed = true;
        result.launchError = process.launchError();
        result.exitCode = 127;
        return result;
    }

    if (!process.waitUntil(deadline)) {
        process.terminate();
        result.timedOut = true;
        result.exitCode = -2;
    } else {
        result.exitCode = process.exitCode();
    }

    result.stdoutText = process.takeStdout();
    result.stderrText = process.stderrText();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    return result;
}
