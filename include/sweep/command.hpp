#pragma once

/**
 * @file command.hpp
 * @brief Blocking subprocess execution with a timeout
 *
 * Package managers, servicing tools and inventory queries are all invoked
 * through CommandRunner so that tests can substitute a scripted runner.
 */

#include <chrono>
#include <string>
#include <vector>

namespace sweep {

struct CommandSpec {
    std::string program;
    std::vector<std::string> args;
    std::chrono::seconds timeout{300};
};

struct CommandResult {
    bool ok = false;         // process was spawned and exited on its own
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    std::string error;       // spawn/wait failure description

    bool succeeded() const { return ok && !timed_out && exit_code == 0; }
};

// Render a command for logs: program followed by its arguments
std::string describe_command(const CommandSpec& spec);

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Run to completion or until spec.timeout elapses. A process still
    // running at the deadline is killed and reported with timed_out = true.
    virtual CommandResult run(const CommandSpec& spec) = 0;
};

/**
 * Runs commands as child processes.
 *
 * POSIX: fork/execvp with stdout/stderr pipes drained by poll().
 * Windows: CreateProcess with inherited pipe handles.
 */
class ProcessCommandRunner : public CommandRunner {
public:
    CommandResult run(const CommandSpec& spec) override;
};

} // namespace sweep
