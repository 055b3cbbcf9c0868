#include <stencil/adapters/local.hpp>
#include <stencil/log.hpp>

#include <filesystem>

namespace fs = std::filesystem;

namespace stencil {

Result<std::string> LocalAdapter::root_of(const TemplateSource& source) {
    const auto* local = std::get_if<LocalSource>(&source);
    if (!local) {
        return StencilError{StencilError::InvalidArg,
            "local adapter given a " +
            std::string(source_kind_name(source_kind(source))) + " source"};
    }

    std::error_code ec;
    fs::path root = fs::absolute(local->path, ec);
    if (ec || !fs::exists(root, ec)) {
        return StencilError{StencilError::SourceUnavailable,
            "template directory does not exist: " + local->path};
    }
    if (!fs::is_directory(root, ec)) {
        return StencilError{StencilError::SourceUnavailable,
            "template path is not a directory: " + local->path};
    }
    return Result<std::string>::ok(root.lexically_normal().string());
}

Result<std::vector<TemplateMetadata>> LocalAdapter::fetch_list(const TemplateSource& source) {
    return list_from_root(root_of(source));
}

Result<FetchedTemplate> LocalAdapter::fetch_one(const TemplateSource& source,
                                                const std::string& template_name) {
    auto root = root_of(source);
    if (root.is_err()) return std::move(root).error();

    stencil::log::trace("looking for '%s' in %s", template_name.c_str(), root.value().c_str());
    return find_template(root.value(), template_name);
}

} // namespace stencil
