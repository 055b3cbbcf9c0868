#pragma once

#include <stencil/result.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stencil {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

using EnvVars = std::vector<std::pair<std::string, std::string>>;

// Run an external command, capturing stdout and stderr.
// Returns error on fork/exec failure or timeout. `env` entries are set in
// the child on top of the inherited environment.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60,
                                  const EnvVars& env = {});

// Embed username/token into an https URL. Other schemes are returned as-is.
std::string url_with_credentials(const std::string& url,
                                 const std::optional<std::string>& username,
                                 const std::optional<std::string>& token);

// Replace any userinfo in a URL with "***" for logging
std::string redact_url(const std::string& url);

// Wrapper around git CLI operations on shallow working-tree clones
class GitCli {
public:
    // Check git is available and version >= 2.20
    Result<std::string> check_version();

    // `git clone --depth 1 [--branch <branch>] <url> <dest>`
    Status shallow_clone(const std::string& url,
                         const std::optional<std::string>& branch,
                         const std::string& dest);

    // `git -C <repo> fetch --depth 1 <url> <ref>` then hard reset to FETCH_HEAD.
    // With no branch the remote HEAD is fetched.
    Status update_shallow(const std::string& repo,
                          const std::string& url,
                          const std::optional<std::string>& branch);

    // `git -C <repo> remote set-url origin <url>`
    Status set_remote_url(const std::string& repo, const std::string& url);

    // Full SHA of HEAD in a working tree
    Result<std::string> head_commit(const std::string& repo);

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }
    int timeout() const { return timeout_seconds_; }

private:
    Result<CommandResult> git(const std::vector<std::string>& args,
                              const std::string& working_dir = "");

    int timeout_seconds_ = 300;
};

} // namespace stencil
