#include "cli/clipboard.hpp"
#include "core/utils.hpp"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>

namespace biip {

namespace {

std::vector<char*> make_argv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    return argv;
}

std::string describe_status(int status) {
    if (WIFEXITED(status)) return std::format("exit status {}", WEXITSTATUS(status));
    if (WIFSIGNALED(status)) return std::format("killed by signal {}", WTERMSIG(status));
    return "abnormal termination";
}

// Ignores SIGPIPE for its lifetime so a helper that exits early surfaces as EPIPE
class ScopedSigpipeIgnore {
public:
    ScopedSigpipeIgnore() {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        installed_ = ::sigaction(SIGPIPE, &ignore, &previous_) == 0;
    }
    ~ScopedSigpipeIgnore() {
        if (installed_) ::sigaction(SIGPIPE, &previous_, nullptr);
    }

    ScopedSigpipeIgnore(const ScopedSigpipeIgnore&) = delete;
    ScopedSigpipeIgnore& operator=(const ScopedSigpipeIgnore&) = delete;

private:
    struct sigaction previous_ {};
    bool installed_ = false;
};

int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return status;
}

} // anonymous namespace

std::optional<std::string> find_in_path(std::string_view program, std::string_view path_env) {
    if (program.find('/') != std::string_view::npos) {
        const std::string p(program);
        if (::access(p.c_str(), X_OK) == 0) return p;
        return std::nullopt;
    }

    size_t pos = 0;
    while (pos <= path_env.size()) {
        size_t end = path_env.find(':', pos);
        if (end == std::string_view::npos) end = path_env.size();
        const auto dir = path_env.substr(pos, end - pos);
        if (!dir.empty()) {
            const auto candidate = (std::filesystem::path(dir) / program).string();
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec) &&
                ::access(candidate.c_str(), X_OK) == 0) {
                return candidate;
            }
        }
        pos = end + 1;
    }
    return std::nullopt;
}

const std::vector<Clipboard::Tool>& Clipboard::known_tools() {
    static const std::vector<Tool> tools = {
        {"wl-clipboard", {"wl-paste", "--no-newline"}, {"wl-copy"}},
        {"xclip", {"xclip", "-selection", "clipboard", "-o"}, {"xclip", "-selection", "clipboard", "-i"}},
        {"xsel", {"xsel", "--clipboard", "--output"}, {"xsel", "--clipboard", "--input"}},
        {"pasteboard", {"pbpaste"}, {"pbcopy"}},
    };
    return tools;
}

Result<Clipboard> Clipboard::detect(std::string_view path_env) {
    for (const auto& tool : known_tools()) {
        if (find_in_path(tool.read_argv.front(), path_env) &&
            find_in_path(tool.write_argv.front(), path_env)) {
            utils::log::debug(std::format("Clipboard helper: {}", tool.name));
            return Result<Clipboard>::ok(Clipboard(tool));
        }
    }
    return Result<Clipboard>::error(ErrorCategory::CLIPBOARD_ERROR,
        "no clipboard helper found (install wl-clipboard, xclip or xsel)");
}

Result<std::string> Clipboard::read() const {
    int pipefd[2];
    if (::pipe(pipefd) != 0) {
        return Result<std::string>::error(ErrorCategory::CLIPBOARD_ERROR,
            std::format("pipe failed: {}", std::strerror(errno)));
    }

    auto argv = make_argv(tool_.read_argv);
    const pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return Result<std::string>::error(ErrorCategory::CLIPBOARD_ERROR,
            std::format("fork failed: {}", std::strerror(errno)));
    }
    if (pid == 0) {
        ::dup2(pipefd[1], STDOUT_FILENO);
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(pipefd[1]);
    std::string contents;
    char buf[4096];
    for (;;) {
        const ssize_t r = ::read(pipefd[0], buf, sizeof(buf));
        if (r > 0) {
            contents.append(buf, static_cast<size_t>(r));
        } else if (r < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    ::close(pipefd[0]);

    const int status = wait_child(pid);
    if (status < 0 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return Result<std::string>::error(ErrorCategory::CLIPBOARD_ERROR,
            std::format("{} failed: {}", tool_.read_argv.front(),
                        status < 0 ? "wait failed" : describe_status(status)));
    }
    return Result<std::string>::ok(std::move(contents));
}

Result<size_t> Clipboard::write(std::string_view text) const {
    int pipefd[2];
    if (::pipe(pipefd) != 0) {
        return Result<size_t>::error(ErrorCategory::CLIPBOARD_ERROR,
            std::format("pipe failed: {}", std::strerror(errno)));
    }

    auto argv = make_argv(tool_.write_argv);
    const pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return Result<size_t>::error(ErrorCategory::CLIPBOARD_ERROR,
            std::format("fork failed: {}", std::strerror(errno)));
    }
    if (pid == 0) {
        ::dup2(pipefd[0], STDIN_FILENO);
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(pipefd[0]);
    size_t written = 0;
    {
        // Installed after fork so the helper keeps the default disposition
        const ScopedSigpipeIgnore no_sigpipe;
        while (written < text.size()) {
            const ssize_t w = ::write(pipefd[1], text.data() + written, text.size() - written);
            if (w < 0 && errno == EINTR) continue;
            if (w <= 0) break;
            written += static_cast<size_t>(w);
        }
    }
    ::close(pipefd[1]);

    const int status = wait_child(pid);
    if (status < 0 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return Result<size_t>::error(ErrorCategory::CLIPBOARD_ERROR,
            std::format("{} failed: {}", tool_.write_argv.front(),
                        status < 0 ? "wait failed" : describe_status(status)));
    }
    if (written < text.size()) {
        return Result<size_t>::error(ErrorCategory::CLIPBOARD_ERROR,
            std::format("{} accepted {} of {} bytes", tool_.write_argv.front(),
                        written, text.size()));
    }
    return Result<size_t>::ok(written);
}

} // namespace biip
