#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <sys/types.h>
#include <vector>

namespace fs = std::filesystem;

// Outcome of a child process run to completion
struct ProcessResult {
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;
    bool timedOut = false;
    bool launchFailed = false;       // exec failed (missing binary, permissions)
    std::string launchError;         // strerror text when launchFailed
    std::chrono::milliseconds duration{0};

    bool succeeded() const { return !launchFailed && !timedOut && exitCode == 0; }
};

/**
 * @brief Child process with piped stdout/stderr.
 *
 * The argument vector is executed directly, without a shell. stdout can be
 * consumed line by line with readLine() while stderr is drained into a
 * buffer in the background of the same poll loop, so a chatty stderr never
 * blocks the child. Destroying a running Subprocess kills and reaps it.
 */
class Subprocess {
public:
    Subprocess(const std::vector<std::string>& argv, const fs::path& workingDir);
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    // True when the exec itself failed; see launchError()
    bool launchFailed() const { return launchFailed_; }
    const std::string& launchError() const { return launchError_; }

    // Read the next stdout line without its newline. Returns false at EOF.
    bool readLine(std::string& line);

    // Read a stdout line, giving up once the deadline passes (sets timedOut)
    bool readLine(std::string& line, std::chrono::steady_clock::time_point deadline, bool& timedOut);

    // Drain remaining output and reap the child. Returns the exit code
    // (negative signal number when killed by a signal).
    int wait();

    // Like wait() but gives up at the deadline. Returns false on timeout.
    bool waitUntil(std::chrono::steady_clock::time_point deadline);

    int exitCode() const { return exitCode_; }

    // SIGTERM, short grace period, SIGKILL, then reap
    void terminate();

    const std::string& stderrText() const { return stderrBuffer_; }

    std::string takeStdout();

private:
    pid_t pid_ = -1;
    int stdoutFd_ = -1;
    int stderrFd_ = -1;
    bool launchFailed_ = false;
    std::string launchError_;
    std::string stdoutBuffer_;
    std::string stderrBuffer_;
    size_t stdoutPos_ = 0;
    bool exited_ = false;
    int exitCode_ = -1;

    // Poll both pipes once. Returns false when both are closed or the deadline passed.
    bool pump(int timeoutMs);
    bool readInto(int& fd, std::string& buffer);
    void closeFds();
    void reap(int options);
};

// Run argv to completion with a timeout
ProcessResult runProcess(const std::vector<std::string>& argv,
                         const fs::path& workingDir,
                         std::chrono::milliseconds timeout);
