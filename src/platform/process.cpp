#include "sweep/command.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#include <atomic>
#include <thread>
#else
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#endif

namespace sweep {

std::string describe_command(const CommandSpec& spec) {
    std::string out = spec.program;
    for (const auto& arg : spec.args) {
        out += ' ';
        bool needs_quotes = arg.empty() || arg.find_first_of(" \t\"") != std::string::npos;
        if (needs_quotes) out += '"';
        out += arg;
        if (needs_quotes) out += '"';
    }
    return out;
}

// ============================================================================
// UNIX EXECUTION
// ============================================================================

#ifndef _WIN32

namespace {

using Clock = std::chrono::steady_clock;

void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    if (flags >= 0) {
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (left.count() <= 0) return 0;
    return static_cast<int>(left.count());
}

// Read whatever is available on fd; returns false once the pipe is closed
bool drain_fd(int fd, std::string& sink) {
    char buf[4096];
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
        sink.append(buf, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

// Pipe creation and fork are serialized so that no child forked by another
// worker inherits a write end before it is marked close-on-exec
std::mutex& spawn_mutex() {
    static std::mutex m;
    return m;
}

} // namespace

CommandResult ProcessCommandRunner::run(const CommandSpec& spec) {
    CommandResult result;

    std::vector<std::string> argv_strings;
    argv_strings.push_back(spec.program);
    argv_strings.insert(argv_strings.end(), spec.args.begin(), spec.args.end());

    std::vector<char*> argv;
    for (auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    int out_pipe[2];
    int err_pipe[2];
    pid_t pid = -1;
    {
        std::lock_guard<std::mutex> lock(spawn_mutex());

        if (pipe(out_pipe) != 0) {
            result.error = "pipe failed: " + std::string(strerror(errno));
            return result;
        }
        if (pipe(err_pipe) != 0) {
            close(out_pipe[0]);
            close(out_pipe[1]);
            result.error = "pipe failed: " + std::string(strerror(errno));
            return result;
        }
        // dup2 clears the flag on the child's own stdout/stderr
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
            set_cloexec(fd);
        }

        pid = fork();
        if (pid == -1) {
            close(out_pipe[0]);
            close(out_pipe[1]);
            close(err_pipe[0]);
            close(err_pipe[1]);
            result.error = "fork failed: " + std::string(strerror(errno));
            return result;
        }
    }

    if (pid == 0) {
        // Child process
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);

        execvp(spec.program.c_str(), argv.data());

        // If execvp returns, it failed
        _exit(127);
    }

    // Parent process
    close(out_pipe[1]);
    close(err_pipe[1]);

    auto deadline = Clock::now() + spec.timeout;
    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        int wait_ms = remaining_ms(deadline);
        if (wait_ms == 0) {
            result.timed_out = true;
            break;
        }

        std::vector<pollfd> fds;
        if (out_open) fds.push_back({out_pipe[0], POLLIN, 0});
        if (err_open) fds.push_back({err_pipe[0], POLLIN, 0});

        int rc = poll(fds.data(), static_cast<nfds_t>(fds.size()), wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            result.error = "poll failed: " + std::string(strerror(errno));
            break;
        }
        if (rc == 0) continue;

        for (const auto& p : fds) {
            if (p.revents == 0) continue;
            if (p.fd == out_pipe[0]) {
                out_open = drain_fd(p.fd, result.stdout_text);
            } else {
                err_open = drain_fd(p.fd, result.stderr_text);
            }
        }
    }

    close(out_pipe[0]);
    close(err_pipe[0]);

    // Output is closed; the child may still be running
    int status = 0;
    bool reaped = false;
    while (!result.timed_out && result.error.empty()) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            reaped = true;
            break;
        }
        if (w < 0 && errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            break;
        }
        if (remaining_ms(deadline) == 0) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (!reaped) {
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }

    if (result.timed_out) {
        spdlog::warn("Command timed out after {}s: {}", spec.timeout.count(), describe_command(spec));
        return result;
    }
    if (!result.error.empty()) {
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
        if (result.exit_code == 127) {
            result.error = "command not found or not executable: " + spec.program;
        }
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

#endif // !_WIN32

// ============================================================================
// WINDOWS EXECUTION
// ============================================================================

#ifdef _WIN32

namespace {

// Quote one argument following the CommandLineToArgvW conventions
std::string quote_argument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
        return arg;
    }

    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
        } else if (c == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
            quoted += c;
            backslashes = 0;
        } else {
            quoted.append(backslashes, '\\');
            quoted += c;
            backslashes = 0;
        }
    }
    quoted.append(backslashes * 2, '\\');
    quoted += '"';
    return quoted;
}

std::string build_command_line(const CommandSpec& spec) {
    std::string cmd = quote_argument(spec.program);
    for (const auto& arg : spec.args) {
        cmd += ' ';
        cmd += quote_argument(arg);
    }
    return cmd;
}

void read_pipe(HANDLE handle, std::string* sink, std::atomic<int>* finished) {
    char buf[4096];
    DWORD read = 0;
    while (ReadFile(handle, buf, sizeof(buf), &read, nullptr) && read > 0) {
        sink->append(buf, read);
    }
    ++*finished;
}

} // namespace

CommandResult ProcessCommandRunner::run(const CommandSpec& spec) {
    CommandResult result;

    SECURITY_ATTRIBUTES sa;
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;
    sa.lpSecurityDescriptor = nullptr;

    HANDLE out_read = nullptr, out_write = nullptr;
    HANDLE err_read = nullptr, err_write = nullptr;
    if (!CreatePipe(&out_read, &out_write, &sa, 0)) {
        result.error = "CreatePipe failed: " + std::to_string(GetLastError());
        return result;
    }
    if (!CreatePipe(&err_read, &err_write, &sa, 0)) {
        CloseHandle(out_read);
        CloseHandle(out_write);
        result.error = "CreatePipe failed: " + std::to_string(GetLastError());
        return result;
    }
    SetHandleInformation(out_read, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(err_read, HANDLE_FLAG_INHERIT, 0);

    HANDLE null_input = CreateFileA("NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE, &sa,
                                    OPEN_EXISTING, 0, nullptr);

    auto close_pipes = [&]() {
        CloseHandle(out_read);
        CloseHandle(out_write);
        CloseHandle(err_read);
        CloseHandle(err_write);
        if (null_input != INVALID_HANDLE_VALUE) CloseHandle(null_input);
    };

    // Only this child's own pipe ends are inherited, never those of a
    // command started concurrently by another worker
    std::vector<HANDLE> inherited = {out_write, err_write};
    if (null_input != INVALID_HANDLE_VALUE) inherited.push_back(null_input);

    SIZE_T attr_size = 0;
    InitializeProcThreadAttributeList(nullptr, 1, 0, &attr_size);
    std::vector<char> attr_buffer(attr_size);
    auto attrs = reinterpret_cast<LPPROC_THREAD_ATTRIBUTE_LIST>(attr_buffer.data());
    if (!InitializeProcThreadAttributeList(attrs, 1, 0, &attr_size) ||
        !UpdateProcThreadAttribute(attrs, 0, PROC_THREAD_ATTRIBUTE_HANDLE_LIST, inherited.data(),
                                   inherited.size() * sizeof(HANDLE), nullptr, nullptr)) {
        result.error = "process attribute setup failed: " + std::to_string(GetLastError());
        close_pipes();
        return result;
    }

    STARTUPINFOEXA si = {};
    si.StartupInfo.cb = sizeof(si);
    si.StartupInfo.dwFlags = STARTF_USESTDHANDLES;
    si.StartupInfo.hStdInput = null_input != INVALID_HANDLE_VALUE ? null_input : nullptr;
    si.StartupInfo.hStdOutput = out_write;
    si.StartupInfo.hStdError = err_write;
    si.lpAttributeList = attrs;

    PROCESS_INFORMATION pi = {0};

    std::string cmd_line = build_command_line(spec);

    // Started suspended so it joins the job before it can spawn anything
    BOOL success = CreateProcessA(
        nullptr,
        const_cast<char*>(cmd_line.c_str()),
        nullptr,  // Process security attributes
        nullptr,  // Thread security attributes
        TRUE,     // Inherit the listed handles
        CREATE_NO_WINDOW | CREATE_SUSPENDED | EXTENDED_STARTUPINFO_PRESENT,
        nullptr,  // Inherit environment
        nullptr,  // Inherit cwd
        &si.StartupInfo,
        &pi
    );
    DWORD create_error = GetLastError();
    DeleteProcThreadAttributeList(attrs);

    CloseHandle(out_write);
    CloseHandle(err_write);
    out_write = nullptr;
    err_write = nullptr;
    if (null_input != INVALID_HANDLE_VALUE) {
        CloseHandle(null_input);
        null_input = INVALID_HANDLE_VALUE;
    }

    if (!success) {
        CloseHandle(out_read);
        CloseHandle(err_read);
        result.error = "CreateProcess failed: " + std::to_string(create_error);
        return result;
    }

    // The job holds the whole process tree so a timeout can end all of it
    HANDLE job = CreateJobObjectA(nullptr, nullptr);
    if (job && !AssignProcessToJobObject(job, pi.hProcess)) {
        spdlog::debug("AssignProcessToJobObject failed: {}", GetLastError());
        CloseHandle(job);
        job = nullptr;
    }
    ResumeThread(pi.hThread);

    std::atomic<int> finished{0};
    std::thread out_reader(read_pipe, out_read, &result.stdout_text, &finished);
    std::thread err_reader(read_pipe, err_read, &result.stderr_text, &finished);

    auto deadline = std::chrono::steady_clock::now() + spec.timeout;
    auto timeout_ms = std::chrono::duration_cast<std::chrono::milliseconds>(spec.timeout).count();
    DWORD wait = WaitForSingleObject(pi.hProcess, static_cast<DWORD>(timeout_ms));

    // A descendant may keep the pipes open after the process exits
    while (wait != WAIT_TIMEOUT && finished.load() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (wait == WAIT_TIMEOUT || finished.load() < 2) {
        if (job) {
            TerminateJobObject(job, 1);
        } else {
            TerminateProcess(pi.hProcess, 1);
        }
        WaitForSingleObject(pi.hProcess, INFINITE);
        result.timed_out = true;
    }

    out_reader.join();
    err_reader.join();
    CloseHandle(out_read);
    CloseHandle(err_read);
    if (job) CloseHandle(job);

    if (result.timed_out) {
        spdlog::warn("Command timed out after {}s: {}", spec.timeout.count(), describe_command(spec));
    } else {
        DWORD exit_code;
        if (GetExitCodeProcess(pi.hProcess, &exit_code)) {
            result.exit_code = static_cast<int>(exit_code);
            result.ok = true;
        } else {
            result.error = "GetExitCodeProcess failed";
        }
    }

    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);

    return result;
}

#endif // _WIN32

} // namespace sweep
