#include "local_tools.hpp"
#include "../utils.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <sstream>
#include <vector>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace bashbuddy {

// ── Argument parsing ───────────────────────────────────────────────────

static std::string require_string(const nlohmann::json& args, const char* key) {
    if (!args.contains(key) || !args[key].is_string()) {
        throw ToolArgumentError(std::string("missing required argument '") + key + "'");
    }
    return args[key].get<std::string>();
}

static std::string optional_string(const nlohmann::json& args, const char* key,
                                   const std::string& fallback) {
    if (!args.contains(key) || args[key].is_null()) return fallback;
    if (args[key].is_string()) return args[key].get<std::string>();
    if (args[key].is_number_integer()) return std::to_string(args[key].get<long long>());
    throw ToolArgumentError(std::string("argument '") + key + "' must be a string");
}

void register_local_tools(ToolRegistry& reg) {
    // ── get_current_directory ──
    {
        ToolDef def;
        def.name = "get_current_directory";
        def.description = "Get the user's current working directory path";
        def.parse = [](const nlohmann::json&) -> ToolArgs {
            return GetCurrentDirectoryArgs{};
        };
        reg.register_tool(std::move(def));
    }

    // ── list_files ──
    {
        ToolDef def;
        def.name = "list_files";
        def.description = "List files and directories in a given path";
        def.parameters = nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "path": {"type": "string", "description": "The directory path to list (use '.' for current)"}
            },
            "required": ["path"]
        })JSON");
        def.parse = [](const nlohmann::json& args) -> ToolArgs {
            ListFilesArgs a;
            a.path = optional_string(args, "path", ".");
            if (a.path.empty()) a.path = ".";
            return a;
        };
        reg.register_tool(std::move(def));
    }

    // ── check_command_exists ──
    {
        ToolDef def;
        def.name = "check_command_exists";
        def.description = "Check if a bash command or program is installed on the system";
        def.parameters = nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "command": {"type": "string", "description": "The command name to check (e.g., 'git', 'docker')"}
            },
            "required": ["command"]
        })JSON");
        def.parse = [](const nlohmann::json& args) -> ToolArgs {
            return CheckCommandExistsArgs{require_string(args, "command")};
        };
        reg.register_tool(std::move(def));
    }

    // ── get_man_page ──
    {
        ToolDef def;
        def.name = "get_man_page";
        def.description = "Retrieve the manual page for a given bash command";
        def.parameters = nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "command": {"type": "string", "description": "The command name to get the manual for (e.g., 'ls', 'grep')"},
                "section": {"type": "string", "description": "Optional: Manual section number (1-8). Most commands are in section 1. Leave empty for default."}
            },
            "required": ["command"]
        })JSON");
        def.parse = [](const nlohmann::json& args) -> ToolArgs {
            GetManPageArgs a;
            a.command = require_string(args, "command");
            a.section = optional_string(args, "section", "");
            return a;
        };
        reg.register_tool(std::move(def));
    }

    // ── suggested_command ──
    {
        ToolDef def;
        def.name = FINAL_ANSWER_TOOL;
        def.description = "Provide the bash command that answers the user's question. "
                          "Call this with the final command after explaining it.";
        def.parameters = nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "command": {"type": "string", "description": "The bash command to run"},
                "explanation": {"type": "string", "description": "Brief explanation of what the command does"}
            },
            "required": ["command", "explanation"]
        })JSON");
        def.parse = [](const nlohmann::json& args) -> ToolArgs {
            SuggestedCommandArgs a;
            a.command = require_string(args, "command");
            a.explanation = optional_string(args, "explanation", "");
            return a;
        };
        reg.register_tool(std::move(def));
    }
}

// ── Child process capture (man) ────────────────────────────────────────

namespace {

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
};

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags != -1) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void drain_pipe(int fd, bool& is_open, std::string& out) {
    if (!is_open) return;
    char buffer[4096];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        if (n < 0 && errno == EINTR) continue;
        is_open = false;
        close(fd);
        return;
    }
}

// Runs argv without a shell. Throws std::runtime_error only when the
// process cannot be created at all.
ProcessCapture run_process(const std::vector<std::string>& argv, int timeout_ms) {
    int out_pipe[2], err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }

    // Everything the child needs is prepared before fork; the daemon is
    // multithreaded so the child only calls async-signal-safe functions.
    std::vector<char*> child_argv;
    for (auto& a : argv) child_argv.push_back(const_cast<char*>(a.c_str()));
    child_argv.push_back(nullptr);

    std::vector<std::string> env_strs;
    for (char** e = environ; e && *e; ++e) {
        std::string kv(*e);
        if (kv.rfind("MANPAGER=", 0) == 0 || kv.rfind("PAGER=", 0) == 0 ||
            kv.rfind("MANWIDTH=", 0) == 0) continue;
        env_strs.push_back(std::move(kv));
    }
    env_strs.push_back("MANPAGER=cat");
    env_strs.push_back("PAGER=cat");
    env_strs.push_back("MANWIDTH=80");
    std::vector<char*> child_env;
    for (auto& kv : env_strs) child_env.push_back(const_cast<char*>(kv.c_str()));
    child_env.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) { dup2(devnull, STDIN_FILENO); close(devnull); }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);

        execvpe(child_argv[0], child_argv.data(), child_env.data());

        static const char msg[] = "exec failed\n";
        ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    ProcessCapture capture;
    bool out_open = true;
    bool err_open = true;
    bool exited = false;
    int status = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (out_open || err_open || !exited) {
        bool past_deadline = std::chrono::steady_clock::now() >= deadline;
        if (!exited && !capture.timed_out && past_deadline) {
            capture.timed_out = true;
            kill(pid, SIGKILL);
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_open) { fds[nfds].fd = out_pipe[0]; fds[nfds].events = POLLIN; nfds++; }
        if (err_open) { fds[nfds].fd = err_pipe[0]; fds[nfds].events = POLLIN; nfds++; }
        if (nfds > 0) {
            poll(fds, nfds, 50);
        } else {
            usleep(10000);
        }

        drain_pipe(out_pipe[0], out_open, capture.stdout_text);
        drain_pipe(err_pipe[0], err_open, capture.stderr_text);

        if (!exited) {
            pid_t r = waitpid(pid, &status, WNOHANG);
            if (r == pid || (r < 0 && errno == ECHILD)) exited = true;
        }
        // Grandchildren (groff, col) may outlive man and hold the pipes open.
        if (exited && past_deadline) break;
    }

    if (out_open) close(out_pipe[0]);
    if (err_open) close(err_pipe[0]);

    if (WIFEXITED(status)) capture.exit_code = WEXITSTATUS(status);
    return capture;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string::size_type start = 0;
    while (true) {
        auto nl = text.find('\n', start);
        if (nl == std::string::npos) {
            if (start < text.size()) lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

} // namespace

// ── Executor ───────────────────────────────────────────────────────────

LocalToolExecutor::LocalToolExecutor(const ToolRegistry& registry, const Config& cfg)
    : registry_(registry)
    , list_limit_(cfg.list_files_limit)
    , man_timeout_sec_(cfg.man_timeout_sec)
    , man_max_lines_(cfg.man_max_lines) {}

ToolOutcome LocalToolExecutor::execute(const std::string& name, const nlohmann::json& args,
                                       const ToolContext& ctx) const {
    std::optional<ToolArgs> parsed;
    try {
        parsed = registry_.parse(name, args);
    } catch (const ToolArgumentError& e) {
        return {{{"error", e.what()}}, false};
    }
    if (!parsed) {
        return {{{"error", "Unknown function: " + name}}, false};
    }

    struct Dispatch {
        const LocalToolExecutor& self;
        const ToolContext& ctx;
        ToolOutcome operator()(const GetCurrentDirectoryArgs&) const {
            return {self.get_current_directory(ctx), false};
        }
        ToolOutcome operator()(const ListFilesArgs& a) const {
            return {self.list_files(a, ctx), false};
        }
        ToolOutcome operator()(const CheckCommandExistsArgs& a) const {
            return {self.check_command_exists(a), false};
        }
        ToolOutcome operator()(const GetManPageArgs& a) const {
            return {self.get_man_page(a), false};
        }
        ToolOutcome operator()(const SuggestedCommandArgs& a) const {
            return {self.suggested_command(a), true};
        }
    };
    return std::visit(Dispatch{*this, ctx}, *parsed);
}

nlohmann::json LocalToolExecutor::get_current_directory(const ToolContext& ctx) const {
    if (!ctx.cwd.empty()) return {{"result", ctx.cwd}};
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (ec) return {{"error", "cannot determine current directory: " + ec.message()}};
    return {{"result", cwd.string()}};
}

nlohmann::json LocalToolExecutor::list_files(const ListFilesArgs& args, const ToolContext& ctx) const {
    fs::path target(args.path);
    if (target.is_relative() && !ctx.cwd.empty()) target = fs::path(ctx.cwd) / target;

    std::error_code ec;
    fs::directory_iterator it(target, ec);
    if (ec) return {{"error", args.path + ": " + ec.message()}};

    std::vector<std::string> names;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) return {{"error", args.path + ": " + ec.message()}};
        names.push_back(it->path().filename().string());
    }
    std::sort(names.begin(), names.end());

    size_t total = names.size();
    size_t limit = list_limit_ > 0 ? static_cast<size_t>(list_limit_) : total;
    if (names.size() > limit) names.resize(limit);

    return {
        {"result", names},
        {"count", total},
        {"truncated", total > limit}
    };
}

nlohmann::json LocalToolExecutor::check_command_exists(const CheckCommandExistsArgs& args) const {
    auto is_executable = [](const std::string& path) {
        struct stat st{};
        return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
    };

    bool exists = false;
    if (!args.command.empty()) {
        if (args.command.find('/') != std::string::npos) {
            exists = is_executable(args.command);
        } else {
            const char* path_env = std::getenv("PATH");
            std::stringstream ss(path_env ? path_env : "");
            std::string dir;
            while (std::getline(ss, dir, ':')) {
                if (dir.empty()) dir = ".";
                if (is_executable(dir + "/" + args.command)) { exists = true; break; }
            }
        }
    }
    return {{"exists", exists}, {"command", args.command}};
}

nlohmann::json LocalToolExecutor::get_man_page(const GetManPageArgs& args) const {
    if (args.command.empty() || args.command[0] == '-') {
        return {{"found", false}, {"command", args.command}, {"error", "Invalid command name"}};
    }

    std::vector<std::string> argv = {"man"};
    if (!args.section.empty()) argv.push_back(args.section);
    argv.push_back(args.command);

    ProcessCapture cap;
    try {
        cap = run_process(argv, man_timeout_sec_ * 1000);
    } catch (const std::exception& e) {
        return {{"found", false}, {"command", args.command}, {"error", e.what()}};
    }

    if (cap.timed_out) {
        return {{"found", false}, {"command", args.command}, {"error", "Command timed out"}};
    }

    if (cap.exit_code != 0) {
        std::string err = trim(cap.stderr_text);
        if (err.empty()) err = "No manual entry for " + args.command;
        return {{"found", false}, {"command", args.command}, {"error", err}};
    }

    auto lines = split_lines(cap.stdout_text);
    size_t total = lines.size();
    size_t keep = std::min(total, static_cast<size_t>(std::max(man_max_lines_, 1)));
    std::string content;
    for (size_t i = 0; i < keep; i++) {
        if (i > 0) content += '\n';
        content += lines[i];
    }

    return {
        {"found", true},
        {"command", args.command},
        {"content", content},
        {"truncated", total > keep},
        {"total_lines", total}
    };
}

nlohmann::json LocalToolExecutor::suggested_command(const SuggestedCommandArgs& args) const {
    return {
        {"command", args.command},
        {"explanation", args.explanation},
        {"is_final_answer", true}
    };
}

} // namespace bashbuddy
