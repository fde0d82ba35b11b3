#pragma once

#include "bgd/error_handling.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace bgd {

struct ProcessResult {
    int exit_code{-1};
    bool timed_out{false};
    std::string output;   // stdout and stderr interleaved
    std::chrono::milliseconds duration{0};

    bool succeeded() const { return !timed_out && exit_code == 0; }
};

// Runs external programs without a shell. A timeout kills the whole process
// group and is reported in ProcessResult, not as an error: only a failure to
// start the program at all is an error.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual Result<ProcessResult> run(const std::vector<std::string>& argv,
                                      std::chrono::milliseconds timeout);
};

// Captured output beyond this is dropped (the tail is kept).
constexpr size_t MAX_CAPTURED_OUTPUT = 256 * 1024;

// Look up an executable on PATH; names containing '/' are checked as is.
bool find_executable(const std::string& name, std::string* resolved = nullptr);

bool is_executable_file(const std::string& path);

// A platform command line with {placeholders}. The template is split into
// arguments before substitution so substituted values never split or merge
// arguments. Single quotes group words. An argument in which any placeholder
// expands to nothing is dropped, so "--values={values}" disappears when no
// values file is configured.
class CommandTemplate {
public:
    explicit CommandTemplate(std::string text);

    Result<std::vector<std::string>> expand(const std::map<std::string, std::string>& vars) const;

    const std::string& text() const { return text_; }

private:
    std::string text_;
};

// Render argv for logs and reports.
std::string join_command(const std::vector<std::string>& argv);

} // namespace bgd
