#pragma once

#include <stencil/adapter.hpp>
#include <stencil/http.hpp>

namespace stencil {

// Archives downloaded over HTTP(S) and extracted under <cache_dir>/http.
// With a checksum, a previously verified extraction is reused; without
// one the archive is downloaded on every fetch.
class HttpAdapter : public SourceAdapter {
public:
    HttpAdapter(std::string cache_dir, std::shared_ptr<HttpClient> client);

    SourceKind kind() const override { return SourceKind::Http; }

    Result<std::vector<TemplateMetadata>> fetch_list(const TemplateSource& source) override;

    Result<FetchedTemplate> fetch_one(const TemplateSource& source,
                                      const std::string& template_name) override;

    std::string extract_path(const HttpSource& source) const;

    // Download, verify, extract; returns the template root
    Result<std::string> materialize(const HttpSource& source);

private:
    std::string cache_dir_;
    std::shared_ptr<HttpClient> client_;
    PathLocks locks_;
};

} // namespace stencil
