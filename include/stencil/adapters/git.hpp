#pragma once

#include <stencil/adapter.hpp>
#include <stencil/git.hpp>

namespace stencil {

// Shallow clones under <cache_dir>/git/<hash>, refreshed on every fetch so the
// working tree always matches the requested branch.
class GitAdapter : public SourceAdapter {
public:
    GitAdapter(std::string cache_dir, int timeout_seconds = 300);

    SourceKind kind() const override { return SourceKind::Git; }

    Result<std::vector<TemplateMetadata>> fetch_list(const TemplateSource& source) override;

    Result<FetchedTemplate> fetch_one(const TemplateSource& source,
                                      const std::string& template_name) override;

    // Deterministic checkout directory for (url, branch, subfolder)
    std::string checkout_path(const GitSource& source) const;

    // Clone or update, then return the template root (subfolder applied)
    Result<std::string> materialize(const GitSource& source);

private:
    std::string cache_dir_;
    GitCli git_;
    PathLocks locks_;
};

} // namespace stencil
