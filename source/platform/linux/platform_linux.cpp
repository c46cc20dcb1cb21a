#include "platform/platform_abi.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char **environ;

namespace platform {

SpawnResult spawn_process_with_pipes(const std::string &executable_path,
                                     const std::vector<std::string> &arguments) {
    SpawnResult result;

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        return result;
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        close_descriptor(stdin_pipe[0]);
        close_descriptor(stdin_pipe[1]);
        return result;
    }

    // Build argv array: [executable, arg1, arg2, ..., nullptr]
    // We need mutable copies of strings for posix_spawn.
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable_path);
    for (const auto &argument : arguments) {
        argv_strings.push_back(argument);
    }
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    // dup2 clears O_CLOEXEC on the child's copies; the originals close on exec.
    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_adddup2(&file_actions, stdin_pipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(),
                                    &file_actions, nullptr,
                                    argv_pointers.data(), environ);
    posix_spawn_file_actions_destroy(&file_actions);

    // The child's ends are ours to close either way.
    close_descriptor(stdin_pipe[0]);
    close_descriptor(stdout_pipe[1]);

    if (spawn_status != 0) {
        close_descriptor(stdin_pipe[1]);
        close_descriptor(stdout_pipe[0]);
        result.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    result.stdin_fd = stdin_pipe[1];
    result.stdout_fd = stdout_pipe[0];
    return result;
}

ReadResult read_available(int fd, int timeout_milliseconds) {
    ReadResult result;
    if (fd < 0) {
        result.error_message = "descriptor is closed";
        return result;
    }

    pollfd poll_descriptor;
    poll_descriptor.fd = fd;
    poll_descriptor.events = POLLIN;
    poll_descriptor.revents = 0;

    int ready = 0;
    do {
        ready = poll(&poll_descriptor, 1, timeout_milliseconds);
    } while (ready < 0 && errno == EINTR);

    if (ready < 0) {
        result.error_message = "poll failed: " + std::string(strerror(errno));
        return result;
    }
    if (ready == 0) {
        result.success = true;
        result.timed_out = true;
        return result;
    }

    char buffer[4096];
    ssize_t bytes_read = 0;
    do {
        bytes_read = read(fd, buffer, sizeof(buffer));
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0) {
        result.error_message = "read failed: " + std::string(strerror(errno));
        return result;
    }

    result.success = true;
    if (bytes_read == 0) {
        result.end_of_file = true;
        return result;
    }
    result.data.assign(buffer, static_cast<size_t>(bytes_read));
    return result;
}

bool write_all(int fd, const std::string &data, std::string &error_message) {
    if (fd < 0) {
        error_message = "descriptor is closed";
        return false;
    }

    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t written = write(fd, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_message = "write failed: " + std::string(strerror(errno));
            return false;
        }
        offset += static_cast<size_t>(written);
    }
    return true;
}

void close_descriptor(int &fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

bool wait_for_exit(int process_id, int timeout_milliseconds) {
    if (process_id <= 0) {
        return true;
    }

    int poll_interval_milliseconds = 20;
    int elapsed_milliseconds = 0;
    while (true) {
        int status = 0;
        pid_t waited = waitpid(static_cast<pid_t>(process_id), &status, WNOHANG);
        if (waited == process_id || (waited < 0 && errno == ECHILD)) {
            return true;
        }
        if (elapsed_milliseconds >= timeout_milliseconds) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_milliseconds));
        elapsed_milliseconds += poll_interval_milliseconds;
    }
}

bool kill_process(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    int kill_result = kill(static_cast<pid_t>(process_id), SIGTERM);
    return (kill_result == 0);
}

bool force_kill_process(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    if (kill(static_cast<pid_t>(process_id), SIGKILL) != 0) {
        return false;
    }
    int status = 0;
    static_cast<void>(waitpid(static_cast<pid_t>(process_id), &status, 0));
    return true;
}

bool is_executable_file(const std::string &path) {
    struct stat file_status;
    if (stat(path.c_str(), &file_status) != 0 || !S_ISREG(file_status.st_mode)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

std::string executable_directory() {
    std::error_code error;
    std::filesystem::path executable = std::filesystem::read_symlink("/proc/self/exe", error);
    if (error) {
        return "";
    }
    return executable.parent_path().string();
}

} // namespace platform
