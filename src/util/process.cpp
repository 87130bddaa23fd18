#include "util/process.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

extern char** environ;

namespace pkgrepo {

namespace {

std::once_flag g_sigpipe_once;

struct Pipe {
    Fd read;
    Fd write;
};

Result MakePipe(Pipe& p) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0)
        return Result::Fail(ErrorCode::StorageError, std::string("pipe2 failed: ") + std::strerror(errno));
    p.read.Reset(fds[0]);
    p.write.Reset(fds[1]);
    return Result::Ok();
}

std::int64_t MonotonicMillis() {
    timespec ts{};
    ::clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<std::int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

std::vector<std::string> BuildEnvironment(const ProcessSpec& spec) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        const std::string entry(*e);
        const auto eq = entry.find('=');
        const std::string name = entry.substr(0, eq);
        bool overridden = false;
        for (const auto& [k, v] : spec.env) {
            if (k == name) {
                overridden = true;
                break;
            }
        }
        if (!overridden) env.push_back(entry);
    }
    for (const auto& [k, v] : spec.env) {
        env.push_back(k + "=" + v);
    }
    return env;
}

std::vector<char*> ToCArray(std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (auto& s : items) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

void SetNonBlocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

} // namespace

std::string DescribeCommand(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out.push_back(' ');
        out += a;
    }
    return out;
}

Result RunProcess(const ProcessSpec& spec, ProcessOutput& out) {
    out = ProcessOutput{};
    if (spec.argv.empty())
        return Result::Fail(ErrorCode::InvalidConfig, "empty command");

    std::call_once(g_sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });

    Pipe in_pipe, out_pipe, err_pipe;
    for (Pipe* p : {&in_pipe, &out_pipe, &err_pipe}) {
        auto r = MakePipe(*p);
        if (!r.is_ok()) return r;
    }

    // Everything the child touches is prepared before fork.
    std::vector<std::string> args = spec.argv;
    std::vector<std::string> env = BuildEnvironment(spec);
    std::vector<char*> c_args = ToCArray(args);
    std::vector<char*> c_env = ToCArray(env);

    LogDebug("exec: %s", DescribeCommand(spec.argv).c_str());

    const pid_t pid = ::fork();
    if (pid < 0)
        return Result::Fail(ErrorCode::StorageError, std::string("fork failed: ") + std::strerror(errno));

    if (pid == 0) {
        ::dup2(in_pipe.read.Get(), STDIN_FILENO);
        ::dup2(out_pipe.write.Get(), STDOUT_FILENO);
        ::dup2(err_pipe.write.Get(), STDERR_FILENO);
        if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) {
            ::_exit(126);
        }
        ::execvpe(c_args[0], c_args.data(), c_env.data());
        ::_exit(127);
    }

    in_pipe.read.Close();
    out_pipe.write.Close();
    err_pipe.write.Close();

    SetNonBlocking(in_pipe.write.Get());
    SetNonBlocking(out_pipe.read.Get());
    SetNonBlocking(err_pipe.read.Get());

    size_t in_off = 0;
    if (spec.stdin_data.empty()) in_pipe.write.Close();

    const std::int64_t deadline =
        spec.timeout.count() > 0 ? MonotonicMillis() + spec.timeout.count() : 0;
    char buf[16 * 1024];

    while (out_pipe.read.Valid() || err_pipe.read.Valid()) {
        pollfd fds[3];
        nfds_t nfds = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (out_pipe.read.Valid()) { out_idx = static_cast<int>(nfds); fds[nfds++] = {out_pipe.read.Get(), POLLIN, 0}; }
        if (err_pipe.read.Valid()) { err_idx = static_cast<int>(nfds); fds[nfds++] = {err_pipe.read.Get(), POLLIN, 0}; }
        if (in_pipe.write.Valid()) { in_idx = static_cast<int>(nfds); fds[nfds++] = {in_pipe.write.Get(), POLLOUT, 0}; }

        int wait_ms = -1;
        if (deadline > 0) {
            const std::int64_t left = deadline - MonotonicMillis();
            if (left <= 0) {
                out.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(left);
        }

        const int rc = ::poll(fds, nfds, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        auto drain = [&](int idx, Fd& fd, std::string& sink) {
            if (idx < 0 || !(fds[idx].revents & (POLLIN | POLLHUP | POLLERR))) return;
            const ssize_t n = ::read(fd.Get(), buf, sizeof(buf));
            if (n > 0) {
                sink.append(buf, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                fd.Close();
            }
        };
        drain(out_idx, out_pipe.read, out.out);
        drain(err_idx, err_pipe.read, out.err);

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            const ssize_t n = ::write(in_pipe.write.Get(),
                                      spec.stdin_data.data() + in_off,
                                      spec.stdin_data.size() - in_off);
            if (n > 0) in_off += static_cast<size_t>(n);
            if (n < 0 && errno != EAGAIN && errno != EINTR) in_pipe.write.Close();
            if (in_off >= spec.stdin_data.size()) in_pipe.write.Close();
        }
    }

    int status = 0;
    bool reaped = false;
    // The child may close its stdio and keep running; the deadline still holds.
    while (!out.timed_out && deadline > 0) {
        const pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            reaped = true;
            break;
        }
        if (w < 0 && errno != EINTR)
            return Result::Fail(ErrorCode::StorageError, std::string("waitpid failed: ") + std::strerror(errno));
        if (MonotonicMillis() >= deadline) {
            out.timed_out = true;
            break;
        }
        (void)::poll(nullptr, 0, 10);
    }

    if (out.timed_out) {
        (void)::kill(pid, SIGKILL);
    }

    while (!reaped && ::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            return Result::Fail(ErrorCode::StorageError, std::string("waitpid failed: ") + std::strerror(errno));
    }

    if (out.timed_out) {
        return Result::Fail(ErrorCode::Timeout,
                            "command timed out after " + std::to_string(spec.timeout.count()) +
                                "ms: " + DescribeCommand(spec.argv));
    }

    if (WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.exit_code = 128 + WTERMSIG(status);
    }
    if (out.exit_code == 127) {
        return Result::Fail(ErrorCode::InvalidConfig,
                            "command not found or not executable: " + spec.argv.front());
    }
    return Result::Ok();
}

Result RunProcessChecked(const ProcessSpec& spec, ProcessOutput& out, ErrorCode failure_code) {
    auto r = RunProcess(spec, out);
    if (!r.is_ok()) {
        return r.err == ErrorCode::Timeout ? r : Result::Fail(failure_code, r.msg);
    }
    if (out.exit_code != 0) {
        std::string tail = out.err.size() > 512 ? out.err.substr(out.err.size() - 512) : out.err;
        while (!tail.empty() && (tail.back() == '\n' || tail.back() == '\r')) tail.pop_back();
        return Result::Fail(failure_code,
                            spec.argv.front() + " exited with " + std::to_string(out.exit_code) +
                                (tail.empty() ? "" : ": " + tail));
    }
    return Result::Ok();
}

} // namespace pkgrepo
