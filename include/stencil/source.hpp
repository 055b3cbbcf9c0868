#pragma once

#include <stencil/result.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace stencil {

struct GitAuth {
    std::optional<std::string> username;
    std::optional<std::string> token;
};

struct HttpAuth {
    std::optional<std::string> bearer_token;
    std::optional<std::pair<std::string, std::string>> basic_auth;  // user, password
};

struct LocalSource {
    std::string path;
};

struct GitSource {
    std::string url;
    std::optional<std::string> branch;     // remote default branch when unset
    std::optional<std::string> subfolder;  // template root inside the checkout
    std::optional<GitAuth> auth;
};

struct HttpSource {
    std::string url;
    std::optional<std::string> checksum;   // "sha256:<hex>" or bare hex
    std::optional<HttpAuth> auth;
};

struct PackageRegistrySource {
    std::string package;                   // e.g. "@acme/templates"
    std::string version;                   // exact version or dist-tag
    std::optional<std::string> registry_url;
};

enum class SourceKind { Local, Git, Http, PackageRegistry };

using TemplateSource = std::variant<LocalSource, GitSource, HttpSource, PackageRegistrySource>;

SourceKind source_kind(const TemplateSource& source);
const char* source_kind_name(SourceKind kind);

// Short human-readable description for logs (credentials redacted)
std::string describe_source(const TemplateSource& source);

// Check required fields of the active alternative
Status validate_source(const TemplateSource& source);

} // namespace stencil
