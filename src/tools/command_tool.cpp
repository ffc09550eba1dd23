#include "mcpsrv/tools/builtin_tools.hpp"
#include "mcpsrv/error.hpp"
#include "mcpsrv/log.hpp"
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace mcpsrv {
namespace tools {

namespace {

struct CommandOutput {
    std::string out;
    std::string err;
    int exit_status = -1;
};

// Closes whatever descriptors are still open when the scope ends.
class FdSet {
public:
    ~FdSet() {
        for (int fd : fds_) {
            if (fd >= 0) ::close(fd);
        }
    }
    void add(int fd) { fds_.push_back(fd); }
    void close(int fd) {
        for (int& f : fds_) {
            if (f == fd) {
                ::close(f);
                f = -1;
            }
        }
    }
private:
    std::vector<int> fds_;
};

[[noreturn]] void child_fail(int status_fd) {
    int err = errno;
    ssize_t r = ::write(status_fd, &err, sizeof(err));
    (void)r;
    _exit(127);
}

// Fork and exec `argv` with stdin from /dev/null. Returns errno when the
// program could not be started, 0 otherwise.
int run_process(const std::vector<std::string>& args, CommandOutput& result) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    FdSet fds;
    int out_pipe[2], err_pipe[2], status_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) return errno;
    fds.add(out_pipe[0]); fds.add(out_pipe[1]);
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) return errno;
    fds.add(err_pipe[0]); fds.add(err_pipe[1]);
    if (::pipe2(status_pipe, O_CLOEXEC) < 0) return errno;
    fds.add(status_pipe[0]); fds.add(status_pipe[1]);
    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) return errno;
    fds.add(devnull);

    pid_t pid = ::fork();
    if (pid < 0) return errno;
    if (pid == 0) {
        if (::dup2(devnull, STDIN_FILENO) < 0) child_fail(status_pipe[1]);
        if (::dup2(out_pipe[1], STDOUT_FILENO) < 0) child_fail(status_pipe[1]);
        if (::dup2(err_pipe[1], STDERR_FILENO) < 0) child_fail(status_pipe[1]);
        ::execvp(argv[0], argv.data());
        child_fail(status_pipe[1]);
    }

    fds.close(out_pipe[1]);
    fds.close(err_pipe[1]);
    fds.close(status_pipe[1]);
    fds.close(devnull);

    struct pollfd pfds[2];
    pfds[0] = {out_pipe[0], POLLIN, 0};
    pfds[1] = {err_pipe[0], POLLIN, 0};
    std::string* sinks[2] = {&result.out, &result.err};
    int open_streams = 2;
    char buf[4096];
    while (open_streams > 0) {
        int ret = ::poll(pfds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (pfds[i].fd < 0 || pfds[i].revents == 0) continue;
            ssize_t n = ::read(pfds[i].fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                pfds[i].fd = -1;
                --open_streams;
                continue;
            }
            sinks[i]->append(buf, static_cast<size_t>(n));
        }
    }

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n != static_cast<ssize_t>(sizeof(exec_errno))) exec_errno = 0;

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return errno;
    }
    if (exec_errno != 0) return exec_errno;

    if (WIFEXITED(status)) {
        result.exit_status = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_status = 128 + WTERMSIG(status);
    }
    return 0;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

} // anonymous namespace

const std::vector<std::string>& ExecuteCommandTool::allowed_commands() {
    static const std::vector<std::string> allowed = {
        "echo", "date", "whoami", "pwd", "ls", "cat", "head", "tail", "wc"
    };
    return allowed;
}

bool ExecuteCommandTool::is_allowed(const std::string& command) {
    const auto& allowed = allowed_commands();
    return std::find(allowed.begin(), allowed.end(), command) != allowed.end();
}

std::string ExecuteCommandTool::description() const {
    return "Execute a safe system command (restricted for security)";
}

nlohmann::json ExecuteCommandTool::input_schema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"command", {
                {"type", "string"},
                {"description", "Command to execute"}
            }},
            {"args", {
                {"type", "array"},
                {"items", {{"type", "string"}}},
                {"description", "Command arguments"}
            }}
        }},
        {"required", nlohmann::json::array({"command"})}
    };
}

CallToolResult ExecuteCommandTool::call(const nlohmann::json& arguments) const {
    auto it = arguments.find("command");
    if (it == arguments.end() || !it->is_string()) {
        throw McpError("Command is required");
    }
    std::string command = it->get<std::string>();

    if (!is_allowed(command)) {
        return error_result("Command '" + command + "' is not allowed. Allowed commands: "
                            + join(allowed_commands(), ", "));
    }

    // Non-string entries are skipped.
    std::vector<std::string> cmd_args;
    auto a = arguments.find("args");
    if (a != arguments.end() && a->is_array()) {
        for (const auto& v : *a) {
            if (v.is_string()) cmd_args.push_back(v.get<std::string>());
        }
    }

    std::vector<std::string> argv;
    argv.push_back(command);
    argv.insert(argv.end(), cmd_args.begin(), cmd_args.end());

    log_debug("tools", "Executing: " + join(argv, " "));
    CommandOutput output;
    int err = run_process(argv, output);
    if (err != 0) {
        return error_result(std::string("Error executing command: ") + std::strerror(err));
    }

    std::string text = "Command: " + command + " " + join(cmd_args, " ");
    if (!output.err.empty()) {
        text += "\nSTDOUT:\n" + output.out + "\nSTDERR:\n" + output.err;
    } else {
        text += "\nOutput:\n" + output.out;
    }

    CallToolResult result = text_result(std::move(text));
    result.is_error = output.exit_status != 0;
    return result;
}

} // namespace tools
} // namespace mcpsrv
