#include <stencil/git.hpp>
#include <stencil/log.hpp>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace stencil {

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

static void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds,
                                  const EnvVars& env) {
    if (args.empty()) {
        return StencilError{StencilError::InvalidArg, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    // The child only execs; anything that allocates happens here
    std::vector<std::string> env_strings;
    std::vector<char*> envp;
    if (!env.empty()) {
        for (char** e = environ; e && *e; ++e) {
            std::string entry(*e);
            std::string key = entry.substr(0, entry.find('='));
            bool overridden = false;
            for (const auto& kv : env) {
                if (kv.first == key) { overridden = true; break; }
            }
            if (!overridden) env_strings.push_back(std::move(entry));
        }
        for (const auto& [key, value] : env) env_strings.push_back(key + "=" + value);
        for (auto& e : env_strings) envp.push_back(e.data());
        envp.push_back(nullptr);
    }

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) != 0) {
        return StencilError{StencilError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return StencilError{StencilError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return StencilError{StencilError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        // Child process
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (!working_dir.empty()) {
            if (chdir(working_dir.c_str()) != 0) {
                _exit(127);
            }
        }

        if (envp.empty()) {
            execvp(argv[0], const_cast<char* const*>(argv.data()));
        } else {
            execvpe(argv[0], const_cast<char* const*>(argv.data()), envp.data());
        }
        _exit(127);  // exec failed
    }

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    auto start = std::chrono::steady_clock::now();

    for (;;) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                >= timeout_seconds) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return StencilError{StencilError::IO,
                "command '" + args[0] + "' timed out after " +
                std::to_string(timeout_seconds) + "s"};
        }

        drain(stdout_pipe[0], out_buf);
        drain(stderr_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], out_buf);
            drain(stderr_pipe[0], err_buf);
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        } else if (w < 0) {
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return StencilError{StencilError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }

        usleep(1000);
    }
}

// ---------------------------------------------------------------------------
// URL credentials
// ---------------------------------------------------------------------------

static std::string percent_encode_userinfo(const std::string& s) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0f];
        }
    }
    return out;
}

// Returns [authority_begin, authority_end) of the URL, or npos when there is no scheme
static std::pair<size_t, size_t> authority_range(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return {std::string::npos, std::string::npos};
    }
    size_t begin = scheme_end + 3;
    size_t end = url.find('/', begin);
    if (end == std::string::npos) end = url.size();
    return {begin, end};
}

std::string url_with_credentials(const std::string& url,
                                 const std::optional<std::string>& username,
                                 const std::optional<std::string>& token) {
    if (!username && !token) return url;
    if (url.compare(0, 8, "https://") != 0 && url.compare(0, 7, "http://") != 0) {
        return url;
    }

    auto [begin, end] = authority_range(url);
    std::string host = url.substr(begin, end - begin);
    auto at = host.rfind('@');
    if (at != std::string::npos) host = host.substr(at + 1);

    std::string userinfo = percent_encode_userinfo(username.value_or("x-access-token"));
    if (token) {
        userinfo += ":" + percent_encode_userinfo(*token);
    }

    return url.substr(0, begin) + userinfo + "@" + host + url.substr(end);
}

std::string redact_url(const std::string& url) {
    auto [begin, end] = authority_range(url);
    if (begin == std::string::npos) return url;

    std::string authority = url.substr(begin, end - begin);
    auto at = authority.rfind('@');
    if (at == std::string::npos) return url;

    return url.substr(0, begin) + "***@" + authority.substr(at + 1) + url.substr(end);
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

Result<CommandResult> GitCli::git(const std::vector<std::string>& args,
                                  const std::string& working_dir) {
    std::vector<std::string> full{"git"};
    full.insert(full.end(), args.begin(), args.end());
    // Never block on a credential prompt
    return run_command(full, working_dir, timeout_seconds_,
                       {{"GIT_TERMINAL_PROMPT", "0"}, {"GIT_ASKPASS", "true"}});
}

Result<std::string> GitCli::check_version() {
    auto r = git({"--version"});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return StencilError{StencilError::SourceUnavailable,
            "git not found or failed", "install git >= 2.20"};
    }

    std::string out = cmd.stdout_str;
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) {
        out.pop_back();
    }

    auto pos = out.find("git version ");
    if (pos == std::string::npos) {
        return StencilError{StencilError::Parse,
            "unexpected git --version output: " + out};
    }
    std::string ver_str = out.substr(pos + 12);

    int major = 0, minor = 0;
    if (std::sscanf(ver_str.c_str(), "%d.%d", &major, &minor) < 2) {
        return StencilError{StencilError::Parse,
            "cannot parse git version: " + ver_str};
    }

    if (major < 2 || (major == 2 && minor < 20)) {
        return StencilError{StencilError::SourceUnavailable,
            "git version " + ver_str + " too old",
            "upgrade to git >= 2.20"};
    }

    return Result<std::string>::ok(std::move(ver_str));
}

Status GitCli::shallow_clone(const std::string& url,
                             const std::optional<std::string>& branch,
                             const std::string& dest) {
    std::vector<std::string> args{"clone", "--depth", "1", "--quiet"};
    if (branch) {
        args.push_back("--branch");
        args.push_back(*branch);
    }
    args.push_back(url);
    args.push_back(dest);

    stencil::log::debug("git clone --depth 1 %s %s",
                        redact_url(url).c_str(), dest.c_str());
    auto r = git(args);
    if (r.is_err()) {
        return StencilError{StencilError::SourceUnavailable, r.error().message};
    }

    if (r.value().exit_code != 0) {
        return StencilError{StencilError::SourceUnavailable,
            "git clone of " + redact_url(url) + " failed: " + r.value().stderr_str};
    }
    return ok_status();
}

Status GitCli::update_shallow(const std::string& repo,
                              const std::string& url,
                              const std::optional<std::string>& branch) {
    std::string ref = branch.value_or("HEAD");

    stencil::log::debug("git -C %s fetch --depth 1 %s %s",
                        repo.c_str(), redact_url(url).c_str(), ref.c_str());
    auto r = git({"-C", repo, "fetch", "--depth", "1", "--quiet", url, ref});
    if (r.is_err()) {
        return StencilError{StencilError::SourceUnavailable, r.error().message};
    }
    if (r.value().exit_code != 0) {
        return StencilError{StencilError::SourceUnavailable,
            "git fetch of " + redact_url(url) + " failed: " + r.value().stderr_str};
    }

    auto r2 = git({"-C", repo, "reset", "--hard", "--quiet", "FETCH_HEAD"});
    if (r2.is_err()) return std::move(r2).error();
    if (r2.value().exit_code != 0) {
        return StencilError{StencilError::IO,
            "git reset in " + repo + " failed: " + r2.value().stderr_str};
    }
    return ok_status();
}

Status GitCli::set_remote_url(const std::string& repo, const std::string& url) {
    auto r = git({"-C", repo, "remote", "set-url", "origin", url});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return StencilError{StencilError::IO,
            "git remote set-url in " + repo + " failed: " + r.value().stderr_str};
    }
    return ok_status();
}

Result<std::string> GitCli::head_commit(const std::string& repo) {
    auto r = git({"-C", repo, "rev-parse", "HEAD"});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return StencilError{StencilError::IO,
            "cannot read HEAD of " + repo + ": " + cmd.stderr_str};
    }

    std::string sha = cmd.stdout_str;
    while (!sha.empty() && (sha.back() == '\n' || sha.back() == '\r')) {
        sha.pop_back();
    }
    return Result<std::string>::ok(std::move(sha));
}

} // namespace stencil
