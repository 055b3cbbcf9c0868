#include <stencil/adapters/git.hpp>
#include <stencil/archive.hpp>
#include <stencil/log.hpp>
#include <stencil/sha256.hpp>

#include <filesystem>

namespace fs = std::filesystem;

namespace stencil {

GitAdapter::GitAdapter(std::string cache_dir, int timeout_seconds)
    : cache_dir_(std::move(cache_dir)) {
    git_.set_timeout(timeout_seconds);
}

std::string GitAdapter::checkout_path(const GitSource& source) const {
    std::string identity = source.url + "\n" + source.branch.value_or("") +
                           "\n" + source.subfolder.value_or("");
    return (fs::path(cache_dir_) / "git" / sha256_hex(identity).substr(0, 16)).string();
}

Result<std::string> GitAdapter::materialize(const GitSource& source) {
    std::string dir = checkout_path(source);
    std::string url = source.url;
    if (source.auth) {
        url = url_with_credentials(source.url, source.auth->username, source.auth->token);
    }

    auto guard = locks_.lock(dir);
    std::error_code ec;

    if (fs::is_directory(fs::path(dir) / ".git", ec)) {
        stencil::log::debug("updating checkout %s", dir.c_str());
        STENCIL_TRY(git_.update_shallow(dir, url, source.branch));
    } else {
        fs::create_directories(fs::path(dir).parent_path(), ec);
        auto staging = make_staging_dir(dir);
        if (staging.is_err()) return std::move(staging).error();

        stencil::log::info("cloning %s", redact_url(source.url).c_str());
        auto cloned = git_.shallow_clone(url, source.branch, staging.value().string());
        if (cloned.is_err()) {
            fs::remove_all(staging.value(), ec);
            return std::move(cloned).error();
        }
        // Keep credentials out of the cached .git/config
        if (source.auth) {
            auto st = git_.set_remote_url(staging.value().string(), source.url);
            if (st.is_err()) {
                fs::remove_all(staging.value(), ec);
                return std::move(st).error();
            }
        }
        STENCIL_TRY(commit_staging_dir(staging.value(), dir));
    }

    fs::path root = dir;
    if (source.subfolder) {
        root /= *source.subfolder;
        if (!fs::is_directory(root, ec)) {
            return StencilError{StencilError::TemplateNotFound,
                "subfolder '" + *source.subfolder + "' not found in " +
                redact_url(source.url)};
        }
    }
    return Result<std::string>::ok(root.lexically_normal().string());
}

static Result<const GitSource*> as_git(const TemplateSource& source) {
    const auto* git = std::get_if<GitSource>(&source);
    if (!git) {
        return StencilError{StencilError::InvalidArg,
            "git adapter given a " +
            std::string(source_kind_name(source_kind(source))) + " source"};
    }
    return Result<const GitSource*>::ok(git);
}

Result<std::vector<TemplateMetadata>> GitAdapter::fetch_list(const TemplateSource& source) {
    auto git = as_git(source);
    if (git.is_err()) return std::move(git).error();
    return list_from_root(materialize(*git.value()));
}

Result<FetchedTemplate> GitAdapter::fetch_one(const TemplateSource& source,
                                              const std::string& template_name) {
    auto git = as_git(source);
    if (git.is_err()) return std::move(git).error();

    auto root = materialize(*git.value());
    if (root.is_err()) return std::move(root).error();
    return find_template(root.value(), template_name);
}

} // namespace stencil
