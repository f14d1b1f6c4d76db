#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace procpeek {

// Generic parse/error info surfaced from data providers and the collector
struct ParseError {
    std::chrono::steady_clock::time_point timestamp;
    std::string message;
};

// Invalid command-line argument. Reported before any output is produced.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The process table as a whole could not be read.
class SamplingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A single process could not be read (exited, access denied, malformed data).
// The sampler omits the process and keeps going.
class ProcessAccessError : public SamplingError {
public:
    ProcessAccessError(int pid, const std::string& message)
        : SamplingError(message), pid_(pid) {}

    [[nodiscard]] int pid() const { return pid_; }

private:
    int pid_ = 0;
};

// The terminal could not be set up or drawn to.
class RenderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace procpeek
