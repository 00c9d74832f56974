#include "util/Process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gitpulse {

namespace {

void drain(int fd, std::string& out) {
    char buffer[4096];
    ssize_t n;
    while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
        out.append(buffer, static_cast<size_t>(n));
    }
}

}

Expected<ProcessResult> runProcess(const std::vector<std::string>& argv,
                                   const std::filesystem::path& workingDir,
                                   std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return Error{ErrorCode::InvalidArgs, "No program to run"};
    }

    int stdoutPipe[2];
    int stderrPipe[2];
    if (pipe(stdoutPipe) < 0) {
        return Error{ErrorCode::IoError, std::string("pipe failed: ") + std::strerror(errno)};
    }
    if (pipe(stderrPipe) < 0) {
        close(stdoutPipe[0]);
        close(stdoutPipe[1]);
        return Error{ErrorCode::IoError, std::string("pipe failed: ") + std::strerror(errno)};
    }

    std::vector<char*> cargs;
    cargs.reserve(argv.size() + 1);
    for (const auto& a : argv) cargs.push_back(const_cast<char*>(a.c_str()));
    cargs.push_back(nullptr);
    const std::string dir = workingDir.string();

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close(stdoutPipe[0]);
        close(stdoutPipe[1]);
        close(stderrPipe[0]);
        close(stderrPipe[1]);
        return Error{ErrorCode::IoError, std::string("fork failed: ") + std::strerror(errno)};
    }

    if (pid == 0) {
        // Child
        close(stdoutPipe[0]);
        close(stderrPipe[0]);
        dup2(stdoutPipe[1], STDOUT_FILENO);
        dup2(stderrPipe[1], STDERR_FILENO);
        close(stdoutPipe[1]);
        close(stderrPipe[1]);
        if (!dir.empty() && chdir(dir.c_str()) != 0) {
            _exit(127);
        }
        execvp(cargs[0], cargs.data());
        _exit(127);
    }

    close(stdoutPipe[1]);
    close(stderrPipe[1]);
    fcntl(stdoutPipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderrPipe[0], F_SETFL, O_NONBLOCK);

    ProcessResult result;
    const auto deadline = started + timeout;
    int status = 0;
    bool timedOut = false;

    while (true) {
        drain(stdoutPipe[0], result.stdoutText);
        drain(stderrPipe[0], result.stderrText);

        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) break;
        if (done < 0 && errno != EINTR) {
            close(stdoutPipe[0]);
            close(stderrPipe[0]);
            return Error{ErrorCode::IoError, std::string("waitpid failed: ") + std::strerror(errno)};
        }

        if (std::chrono::steady_clock::now() > deadline) {
            kill(pid, SIGTERM);
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            timedOut = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    drain(stdoutPipe[0], result.stdoutText);
    drain(stderrPipe[0], result.stderrText);
    close(stdoutPipe[0]);
    close(stderrPipe[0]);

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (timedOut) {
        return Error{ErrorCode::Timeout, argv.front() + " timed out after " +
                                             std::to_string(timeout.count() / 1000) + "s"};
    }
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = -WTERMSIG(status);
    }
    return result;
}

}
