// =================================================================
// include/Testgate/ProcessRunner.hpp
// =================================================================
// Defines the interface for running the version-control binary with
// a controlled argument list.

#pragma once

#include <string>
#include <vector>

namespace Testgate {

/**
 * @brief Outcome of a single subprocess invocation
 *
 * On success `stdout_text`/`stderr_text` hold the captured streams. On
 * failure `output` holds a single diagnostic string folded from stderr,
 * stdout and the failure message.
 */
struct ProcessResult {
    bool ok;
    std::string stdout_text;
    std::string stderr_text;
    std::string output;
    int exit_code;

    ProcessResult() : ok(false), exit_code(-1) {}

    static ProcessResult success(const std::string& out, const std::string& err) {
        ProcessResult result;
        result.ok = true;
        result.stdout_text = out;
        result.stderr_text = err;
        result.exit_code = 0;
        return result;
    }

    static ProcessResult failure(const std::string& diagnostic, int code = -1) {
        ProcessResult result;
        result.ok = false;
        result.output = diagnostic;
        result.exit_code = code;
        return result;
    }
};

/**
 * @brief Runs version-control commands. Implementations never throw.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Run the version-control binary
     * @param cwd Working directory for the child process
     * @param args Arguments after the binary name (e.g. {"apply", "--check", "x.patch"})
     * @return Structured success/failure result
     */
    virtual ProcessResult run(const std::string& cwd, const std::vector<std::string>& args) const = 0;
};

/**
 * @brief ProcessRunner backed by a real `git` executable
 *
 * Every invocation is prefixed with `-c core.quotepath=false` so that
 * non-ASCII paths come back as literal UTF-8. Arguments are passed as an
 * argument vector; no shell is involved.
 */
class GitProcessRunner : public ProcessRunner {
public:
    /**
     * @param binary Executable to run, looked up on PATH
     * @param max_buffer_bytes Combined stdout+stderr cap; exceeding it fails the call
     */
    explicit GitProcessRunner(const std::string& binary = "git",
                              size_t max_buffer_bytes = 20 * 1024 * 1024);

    ProcessResult run(const std::string& cwd, const std::vector<std::string>& args) const override;

    /**
     * @brief Full argument vector handed to the child, binary first
     */
    std::vector<std::string> buildArgv(const std::vector<std::string>& args) const;

    /**
     * @brief Fold the parts of a failed call into one diagnostic
     *
     * Parts are trimmed and joined with newlines in the order stderr,
     * stdout, message; empty parts are skipped. Returns "(no details)"
     * when nothing remains.
     */
    static std::string foldDiagnostics(const std::string& stderr_text,
                                       const std::string& stdout_text,
                                       const std::string& message);

private:
    std::string m_binary;
    size_t m_max_buffer_bytes;
};

} // namespace Testgate
