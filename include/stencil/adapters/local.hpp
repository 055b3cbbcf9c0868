#pragma once

#include <stencil/adapter.hpp>

namespace stencil {

// Templates are subdirectories of a local directory
class LocalAdapter : public SourceAdapter {
public:
    SourceKind kind() const override { return SourceKind::Local; }

    Result<std::vector<TemplateMetadata>> fetch_list(const TemplateSource& source) override;

    Result<FetchedTemplate> fetch_one(const TemplateSource& source,
                                      const std::string& template_name) override;

private:
    // Absolute root, or SourceUnavailable when it is not a directory
    static Result<std::string> root_of(const TemplateSource& source);
};

} // namespace stencil
