#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <thread>
#include <chrono>
#include <cstring>
#include <filesystem>

extern char **environ;

namespace platform {

SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments) {
    SpawnResult result;

    // Build argv array: [executable, arg1, arg2, ..., nullptr]
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

    // stdout belongs to the JSON-RPC stream.
    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_adddup2(&file_actions, STDERR_FILENO, STDOUT_FILENO);
    posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(),
                                   &file_actions, nullptr,
                                   argv_pointers.data(), environ);
    posix_spawn_file_actions_destroy(&file_actions);

    if (spawn_status != 0) {
        result.success = false;
        result.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    return result;
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

bool wait_for_file(const std::string &file_path, int timeout_milliseconds) {
    int elapsed_milliseconds = 0;
    int poll_interval_milliseconds = 100;

    while (true) {
        if (std::filesystem::exists(file_path)) {
            // Chrome may create the file before writing it.
            std::string contents;
            if (read_file_contents(file_path, contents) && !contents.empty()) {
                return true;
            }
        }

        if (elapsed_milliseconds >= timeout_milliseconds) {
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_milliseconds));
        elapsed_milliseconds += poll_interval_milliseconds;
    }
}

bool terminate_process(int process_id, int grace_milliseconds) {
    if (process_id <= 0) {
        return false;
    }
    pid_t child_pid = static_cast<pid_t>(process_id);
    if (kill(child_pid, SIGTERM) != 0) {
        // Already gone; reap in case it is a zombie.
        waitpid(child_pid, nullptr, WNOHANG);
        return true;
    }

    int poll_interval_milliseconds = 50;
    for (int elapsed_milliseconds = 0; elapsed_milliseconds < grace_milliseconds;
         elapsed_milliseconds += poll_interval_milliseconds) {
        pid_t wait_result = waitpid(child_pid, nullptr, WNOHANG);
        if (wait_result == child_pid || wait_result < 0) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_milliseconds));
    }

    kill(child_pid, SIGKILL);
    waitpid(child_pid, nullptr, 0);
    return true;
}

bool is_process_running(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    pid_t wait_result = waitpid(static_cast<pid_t>(process_id), nullptr, WNOHANG);
    return wait_result == 0;
}

bool is_running_as_root() {
    return getuid() == 0;
}

} // namespace platform
