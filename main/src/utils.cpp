#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {
    bool verbose_mode = false;
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    // Helper function to reduce code duplication in logging
    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);

        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void log_trace(int depth, std::string_view msg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    std::cout << std::string(static_cast<size_t>(depth > 0 ? depth : 0) * 2, ' ') << msg << std::endl;
}

void set_verbose_mode(bool enable) {
    verbose_mode = enable;
}

bool get_verbose_mode() {
    return verbose_mode;
}

bool is_running_as_root() {
    return geteuid() == 0;
}

CommandResult run_command(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw PkgslimException(get_string("error.empty_command"));
    }

    int pipe_fds[2];
    if (pipe2(pipe_fds, O_CLOEXEC) != 0) {
        throw PkgslimException(string_format("error.pipe_failed", std::string(strerror(errno))));
    }

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close(pipe_fds[0]);
        close(pipe_fds[1]);
        throw PkgslimException(string_format("error.fork_failed", std::string(strerror(err))));
    }
    if (pid == 0) {
        dup2(pipe_fds[1], STDOUT_FILENO);
        dup2(pipe_fds[1], STDERR_FILENO);

        std::vector<char*> c_args;
        for (const auto& arg : argv) c_args.push_back(const_cast<char*>(arg.c_str()));
        c_args.push_back(nullptr);

        execv(c_args[0], c_args.data());
        _exit(127);
    }

    close(pipe_fds[1]);
    CommandResult result;
    char buf[4096];
    for (;;) {
        ssize_t n = read(pipe_fds[0], buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            break;
        }
    }
    close(pipe_fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw PkgslimException(string_format("error.wait_failed", std::string(strerror(errno))));
        }
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

std::vector<std::string> read_lines(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw PkgslimException(string_format("error.open_file_failed", path.string()));
    }
    std::vector<std::string> result;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) result.push_back(line);
    }
    return result;
}

std::string trim(std::string_view s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) return "";
    const auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(begin, end - begin + 1));
}
