#pragma once

#include <stencil/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stencil {

// Descriptor file every template directory carries
inline constexpr const char* kDescriptorFile = "template.json";

struct VariableType {
    enum Kind { String, Boolean, Number, Choice };

    Kind kind = String;
    std::vector<std::string> options;  // Choice only, never empty

    static const char* kind_name(Kind k);
};

struct TemplateVariable {
    std::string name;
    std::string description;
    std::optional<std::string> default_value;
    bool required = false;
    VariableType type;

    // Required variables have no usable default
    std::optional<std::string> effective_default() const;
};

struct TemplateMetadata {
    std::string name;
    std::string version;
    std::string description;
    std::string author;
    std::string project_type;
    std::vector<TemplateVariable> variables;
    std::vector<std::string> dependencies;
    std::vector<std::string> tags;

    // Parse a template.json document. `origin` names the file in errors.
    static Result<TemplateMetadata> parse(const std::string& json_str,
                                          const std::string& origin = kDescriptorFile);

    // Load <dir>/template.json
    static Result<TemplateMetadata> load(const std::filesystem::path& dir);

    std::string to_json() const;
};

// A template materialized on disk
struct FetchedTemplate {
    std::string path;
    TemplateMetadata metadata;
};

// A template root is either a single template (descriptor at the root) or a
// collection whose immediate subdirectories are templates. Subdirectories
// without a descriptor are skipped; malformed descriptors are skipped with a
// warning. Results are ordered by directory name.
Result<std::vector<FetchedTemplate>> scan_template_root(const std::filesystem::path& root);

// Locate one template by name inside a template root.
//   absent                         -> TemplateNotFound
//   present, descriptor bad/absent -> TemplateProcessing
Result<FetchedTemplate> find_template(const std::filesystem::path& root,
                                      const std::string& name);

} // namespace stencil
