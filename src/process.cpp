/*
 * reelforge - Batch Short-Video Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "reelforge/process.hpp"
#include "reelforge/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace reelforge {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);
constexpr auto kTermGrace = std::chrono::seconds(2);

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Returns false once the pipe reached EOF.
bool drain(int& fd, std::string& sink, std::size_t maxCapture) {
    if (fd < 0) {
        return false;
    }
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            std::size_t room = sink.size() < maxCapture ? maxCapture - sink.size() : 0;
            sink.append(buf, std::min<std::size_t>(room, static_cast<std::size_t>(n)));
            continue;
        }
        if (n == 0) {
            closeFd(fd);
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        closeFd(fd);
        return false;
    }
}

void terminateGroup(pid_t pid) {
    ::kill(-pid, SIGTERM);
    auto giveUp = std::chrono::steady_clock::now() + kTermGrace;
    while (std::chrono::steady_clock::now() < giveUp) {
        if (::waitpid(pid, nullptr, WNOHANG) != 0) {
            return;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    ::kill(-pid, SIGKILL);
    ::waitpid(pid, nullptr, 0);
}

}

std::string describeCommand(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        if (arg.find_first_of(" \t\"'") != std::string::npos) {
            out += '"' + arg + '"';
        } else {
            out += arg;
        }
    }
    return out;
}

CommandResult runCommand(const std::vector<std::string>& argv, const ActionContext& ctx, std::size_t maxCapture) {
    CommandResult result;
    if (argv.empty() || argv[0].empty()) {
        result.err = "empty command";
        return result;
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe(outPipe) != 0 || ::pipe(errPipe) != 0) {
        result.err = std::string("pipe failed: ") + std::strerror(errno);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        return result;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    LOG_DEBUG("Running: " + describeCommand(argv));

    pid_t pid = ::fork();
    if (pid < 0) {
        result.err = std::string("fork failed: ") + std::strerror(errno);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        return result;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::close(outPipe[0]); ::close(outPipe[1]);
        ::close(errPipe[0]); ::close(errPipe[1]);
        ::execvp(cargv[0], cargv.data());
        _exit(127);
    }

    result.started = true;
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    int outFd = outPipe[0];
    int errFd = errPipe[0];
    ::fcntl(outFd, F_SETFL, ::fcntl(outFd, F_GETFL) | O_NONBLOCK);
    ::fcntl(errFd, F_SETFL, ::fcntl(errFd, F_GETFL) | O_NONBLOCK);

    int status = 0;
    bool exited = false;
    while (!exited) {
        struct pollfd fds[2];
        nfds_t count = 0;
        if (outFd >= 0) fds[count++] = {outFd, POLLIN, 0};
        if (errFd >= 0) fds[count++] = {errFd, POLLIN, 0};
        if (count > 0) {
            ::poll(fds, count, static_cast<int>(kPollInterval.count()));
        } else {
            std::this_thread::sleep_for(kPollInterval);
        }
        drain(outFd, result.out, maxCapture);
        drain(errFd, result.err, maxCapture);

        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            exited = true;
            break;
        }
        if (done < 0 && errno != EINTR) {
            LOG_ERROR("waitpid failed for " + argv[0] + ": " + std::strerror(errno));
            break;
        }

        if (ctx.isCancelled() || ctx.expired()) {
            result.cancelled = ctx.isCancelled();
            result.timedOut = !result.cancelled;
            LOG_WARN(std::string(result.cancelled ? "Cancelling " : "Timed out, killing ") + argv[0] +
                     " (pid " + std::to_string(pid) + ")");
            terminateGroup(pid);
            closeFd(outFd);
            closeFd(errFd);
            return result;
        }
    }

    // Bounded: a grandchild may still hold the pipes open.
    for (int i = 0; i < 200; ++i) {
        bool outOpen = drain(outFd, result.out, maxCapture);
        bool errOpen = drain(errFd, result.err, maxCapture);
        if (!outOpen && !errOpen) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    closeFd(outFd);
    closeFd(errFd);

    if (exited) {
        if (WIFEXITED(status)) {
            result.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exitCode = 128 + WTERMSIG(status);
        }
    }
    if (result.exitCode == 127 && result.out.empty()) {
        LOG_DEBUG("Command not found or not executable: " + argv[0]);
    }
    return result;
}

}
