// =================================================================
// src/Testgate/ProcessRunner.cpp
// =================================================================
// fork/exec based implementation of GitProcessRunner.

#include "Testgate/ProcessRunner.hpp"
#include "Testgate/StringUtils.hpp"
#include <cerrno>
#include <cstring>
#include <sstream>

#if !defined(_WIN32)
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace Testgate {

namespace {

std::string describeCommand(const std::vector<std::string>& argv) {
    std::ostringstream oss;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) oss << ' ';
        oss << argv[i];
    }
    return oss.str();
}

#if !defined(_WIN32)
void closeIfOpen(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Only async-signal-safe calls are allowed between fork and exec.
void writeChildError(const char* prefix, const char* detail) {
    ssize_t ignored = ::write(STDERR_FILENO, prefix, std::strlen(prefix));
    ignored = ::write(STDERR_FILENO, detail, std::strlen(detail));
    ignored = ::write(STDERR_FILENO, "\n", 1);
    (void)ignored;
}
#endif

} // namespace

GitProcessRunner::GitProcessRunner(const std::string& binary, size_t max_buffer_bytes)
    : m_binary(binary.empty() ? "git" : binary), m_max_buffer_bytes(max_buffer_bytes) {
}

std::vector<std::string> GitProcessRunner::buildArgv(const std::vector<std::string>& args) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 3);
    argv.push_back(m_binary);
    argv.push_back("-c");
    argv.push_back("core.quotepath=false");
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

std::string GitProcessRunner::foldDiagnostics(const std::string& stderr_text,
                                              const std::string& stdout_text,
                                              const std::string& message) {
    std::vector<std::string> parts;
    for (const auto& part : {stderr_text, stdout_text, message}) {
        std::string trimmed = trim(part);
        if (!trimmed.empty()) {
            parts.push_back(trimmed);
        }
    }
    if (parts.empty()) {
        return "(no details)";
    }
    return join(parts, "\n");
}

ProcessResult GitProcessRunner::run(const std::string& cwd, const std::vector<std::string>& args) const {
    const std::vector<std::string> argv = buildArgv(args);
    const std::string command_line = describeCommand(argv);

#if defined(_WIN32)
    (void)cwd;
    return ProcessResult::failure(foldDiagnostics("", "", "Process execution is not supported on this platform: " + command_line));
#else
    try {
        std::vector<char*> cargs;
        cargs.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            cargs.push_back(const_cast<char*>(arg.c_str()));
        }
        cargs.push_back(nullptr);

        int out_pipe[2] = {-1, -1};
        int err_pipe[2] = {-1, -1};
        if (::pipe(out_pipe) != 0) {
            return ProcessResult::failure(foldDiagnostics("", "", std::string("pipe failed: ") + std::strerror(errno)));
        }
        if (::pipe(err_pipe) != 0) {
            const std::string reason = std::strerror(errno);
            closeIfOpen(out_pipe[0]);
            closeIfOpen(out_pipe[1]);
            return ProcessResult::failure(foldDiagnostics("", "", "pipe failed: " + reason));
        }

        pid_t pid = ::fork();
        if (pid < 0) {
            const std::string reason = std::strerror(errno);
            closeIfOpen(out_pipe[0]);
            closeIfOpen(out_pipe[1]);
            closeIfOpen(err_pipe[0]);
            closeIfOpen(err_pipe[1]);
            return ProcessResult::failure(foldDiagnostics("", "", "fork failed: " + reason));
        }

        if (pid == 0) {
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::dup2(err_pipe[1], STDERR_FILENO);
            ::close(out_pipe[0]);
            ::close(out_pipe[1]);
            ::close(err_pipe[0]);
            ::close(err_pipe[1]);

            if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
                writeChildError("cannot change directory: ", cwd.c_str());
                _exit(127);
            }
            ::execvp(cargs[0], cargs.data());
            writeChildError("cannot execute: ", cargs[0]);
            _exit(127);
        }

        closeIfOpen(out_pipe[1]);
        closeIfOpen(err_pipe[1]);

        std::string stdout_text;
        std::string stderr_text;
        std::string message;
        bool overflow = false;

        pollfd fds[2];
        fds[0].fd = out_pipe[0];
        fds[0].events = POLLIN;
        fds[1].fd = err_pipe[0];
        fds[1].events = POLLIN;
        std::string* sinks[2] = {&stdout_text, &stderr_text};
        int open_fds = 2;
        char buffer[4096];

        while (open_fds > 0 && !overflow) {
            fds[0].revents = 0;
            fds[1].revents = 0;
            int ready = ::poll(fds, 2, -1);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                message = std::string("poll failed: ") + std::strerror(errno);
                break;
            }

            for (int i = 0; i < 2; i++) {
                if (fds[i].fd < 0 || fds[i].revents == 0) {
                    continue;
                }
                ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
                if (n > 0) {
                    sinks[i]->append(buffer, static_cast<size_t>(n));
                    if (stdout_text.size() + stderr_text.size() > m_max_buffer_bytes) {
                        overflow = true;
                    }
                } else if (n == 0 || errno != EINTR) {
                    ::close(fds[i].fd);
                    fds[i].fd = -1;
                    open_fds--;
                }
            }
        }

        if (overflow || !message.empty()) {
            ::kill(pid, SIGKILL);
        }
        for (auto& fd : fds) {
            closeIfOpen(fd.fd);
        }

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                break;
            }
        }

        if (overflow) {
            return ProcessResult::failure(foldDiagnostics(stderr_text, "",
                "Command output exceeded " + std::to_string(m_max_buffer_bytes) + " bytes: " + command_line));
        }
        if (!message.empty()) {
            return ProcessResult::failure(foldDiagnostics(stderr_text, stdout_text, message));
        }

        if (WIFEXITED(status)) {
            int code = WEXITSTATUS(status);
            if (code == 0) {
                return ProcessResult::success(stdout_text, stderr_text);
            }
            return ProcessResult::failure(
                foldDiagnostics(stderr_text, stdout_text,
                                "Command failed (exit code " + std::to_string(code) + "): " + command_line),
                code);
        }
        if (WIFSIGNALED(status)) {
            return ProcessResult::failure(
                foldDiagnostics(stderr_text, stdout_text,
                                "Command terminated by signal " + std::to_string(WTERMSIG(status)) + ": " + command_line));
        }
        return ProcessResult::failure(foldDiagnostics(stderr_text, stdout_text, "Command ended abnormally: " + command_line));

    } catch (const std::exception& e) {
        return ProcessResult::failure(foldDiagnostics("", "", std::string("Failed to run command: ") + e.what()));
    }
#endif
}

} // namespace Testgate
