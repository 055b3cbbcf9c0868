#include <stencil/source.hpp>
#include <stencil/git.hpp>
#include <stencil/sha256.hpp>

namespace stencil {

namespace {

struct KindOf {
    SourceKind operator()(const LocalSource&) const { return SourceKind::Local; }
    SourceKind operator()(const GitSource&) const { return SourceKind::Git; }
    SourceKind operator()(const HttpSource&) const { return SourceKind::Http; }
    SourceKind operator()(const PackageRegistrySource&) const { return SourceKind::PackageRegistry; }
};

struct Describe {
    std::string operator()(const LocalSource& s) const {
        return "local:" + s.path;
    }
    std::string operator()(const GitSource& s) const {
        std::string out = "git:" + redact_url(s.url);
        if (s.branch) out += "#" + *s.branch;
        if (s.subfolder) out += ":" + *s.subfolder;
        return out;
    }
    std::string operator()(const HttpSource& s) const {
        return "http:" + redact_url(s.url);
    }
    std::string operator()(const PackageRegistrySource& s) const {
        return "npm:" + s.package + "@" + s.version;
    }
};

Status invalid(const std::string& what, const std::string& hint = "") {
    return StencilError{StencilError::Configuration, what, hint};
}

struct Validate {
    Status operator()(const LocalSource& s) const {
        if (s.path.empty()) return invalid("local source has empty path");
        return ok_status();
    }

    Status operator()(const GitSource& s) const {
        if (s.url.empty()) return invalid("git source has empty url");
        if (s.branch && s.branch->empty()) {
            return invalid("git source has empty branch",
                           "omit 'branch' to use the remote default branch");
        }
        if (s.subfolder) {
            if (s.subfolder->empty()) return invalid("git source has empty subfolder");
            if (s.subfolder->find("..") != std::string::npos) {
                return invalid("git subfolder may not contain '..'");
            }
        }
        return ok_status();
    }

    Status operator()(const HttpSource& s) const {
        if (s.url.empty()) return invalid("http source has empty url");
        if (s.checksum) {
            auto parsed = parse_checksum(*s.checksum);
            if (parsed.is_err()) return std::move(parsed).error();
        }
        if (s.auth && s.auth->bearer_token && s.auth->basic_auth) {
            return invalid("http auth cannot combine bearer token and basic credentials");
        }
        return ok_status();
    }

    Status operator()(const PackageRegistrySource& s) const {
        if (s.package.empty()) return invalid("package source has empty package name");
        if (s.version.empty()) {
            return invalid("package source '" + s.package + "' has empty version",
                           "use an exact version or a dist-tag such as \"latest\"");
        }
        if (s.registry_url && s.registry_url->empty()) {
            return invalid("package source '" + s.package + "' has empty registry url");
        }
        return ok_status();
    }
};

} // namespace

SourceKind source_kind(const TemplateSource& source) {
    return std::visit(KindOf{}, source);
}

const char* source_kind_name(SourceKind kind) {
    switch (kind) {
        case SourceKind::Local:           return "local";
        case SourceKind::Git:             return "git";
        case SourceKind::Http:            return "http";
        case SourceKind::PackageRegistry: return "npm";
    }
    return "unknown";
}

std::string describe_source(const TemplateSource& source) {
    return std::visit(Describe{}, source);
}

Status validate_source(const TemplateSource& source) {
    return std::visit(Validate{}, source);
}

} // namespace stencil
