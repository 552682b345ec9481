#include "log_utils.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cstdio>
#include <string>

namespace rnnsearch::utils {

namespace {

bool is_fd_tty(FILE* fd) { return isatty(fileno(fd)); }

/**
 * @brief Get the file path associated with a given file descriptor.
 *
 * Returns an empty string if the descriptor does not correspond to a file or cannot be resolved.
 */
std::string get_file_path(int fd) {
    std::array<char, 256> file_path;
    std::array<char, 256> procfd_path;
    std::snprintf(procfd_path.data(), procfd_path.size(), "/proc/self/fd/%d", fd);
    const ssize_t len = readlink(procfd_path.data(), file_path.data(), file_path.size() - 1);
    if (len != -1) {
        file_path[len] = '\0';
        return std::string(file_path.data());
    }
    return "";
}

bool is_safe_to_log() {
    if (get_file_path(fileno(stdout)) == get_file_path(fileno(stderr))) {
        // if both stdout and stderr are ttys it's safe to log
        return is_fd_tty(stderr);
    }
    return true;
}

}  // namespace

void InitLogging() {
    // Without modification, the default logger will write to stdout.
    // Replace the default logger with a (color, multi-threaded) stderr logger
    // (but first replace it with an arbitrarily-named logger to prevent a name clash)
    spdlog::set_default_logger(spdlog::stderr_color_mt("unused_name"));
    spdlog::set_default_logger(spdlog::stderr_color_mt(""));
    if (!is_safe_to_log()) {
        spdlog::set_level(spdlog::level::off);
    }
}

}  // namespace rnnsearch::utils
