#pragma once

#include <string>
#include <utility>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // Wait for the process to exit. Returns exit code, or -1 if it was
    // killed by a signal.
    int wait();

private:
    int pid_ = -1;

    friend Result<std::string> run_capture(
        const std::string& program,
        const std::vector<std::string>& args,
        const std::vector<std::pair<std::string, std::string>>& env);
};

// Run program (looked up in PATH) with stdin closed, collect its stdout
// through a pipe and wait for it. Non-zero exit is an error carrying the
// child's stderr. env entries are added to the child's environment only.
Result<std::string> run_capture(
    const std::string& program,
    const std::vector<std::string>& args,
    const std::vector<std::pair<std::string, std::string>>& env = {});

} // namespace platform
