#include <stencil/template.hpp>
#include <stencil/log.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using nlohmann::json;

namespace stencil {

// ---------------------------------------------------------------------------
// Field helpers
// ---------------------------------------------------------------------------

static StencilError descriptor_error(const std::string& origin, const std::string& what) {
    return StencilError{StencilError::TemplateProcessing, origin + ": " + what};
}

static Result<std::string> read_string(const json& obj, const char* key,
                                       const std::string& origin, bool required) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        if (required) {
            return descriptor_error(origin, std::string("missing required field '") + key + "'");
        }
        return Result<std::string>::ok("");
    }
    if (!it->is_string()) {
        return descriptor_error(origin, std::string("field '") + key + "' must be a string");
    }
    return Result<std::string>::ok(it->get<std::string>());
}

static Result<std::vector<std::string>> read_string_list(const json& obj, const char* key,
                                                         const std::string& origin) {
    std::vector<std::string> out;
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return Result<std::vector<std::string>>::ok(std::move(out));
    }
    if (!it->is_array()) {
        return descriptor_error(origin, std::string("field '") + key + "' must be an array");
    }
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return descriptor_error(origin,
                std::string("field '") + key + "' must contain only strings");
        }
        out.push_back(item.get<std::string>());
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

// "string" | "boolean" | "number" | "choice" (+ sibling "options")
// | {"choice": {"options": [...]}}
static Result<VariableType> parse_type(const json& var, const std::string& origin,
                                       const std::string& var_name) {
    VariableType type;
    const json* node = nullptr;
    if (var.contains("type")) node = &var["type"];
    else if (var.contains("var_type")) node = &var["var_type"];
    if (!node || node->is_null()) {
        return Result<VariableType>::ok(type);
    }

    const json* options = nullptr;
    if (node->is_string()) {
        std::string kind = node->get<std::string>();
        if (kind == "string") type.kind = VariableType::String;
        else if (kind == "boolean" || kind == "bool") type.kind = VariableType::Boolean;
        else if (kind == "number") type.kind = VariableType::Number;
        else if (kind == "choice") {
            type.kind = VariableType::Choice;
            if (var.contains("options")) options = &var["options"];
        } else {
            return descriptor_error(origin,
                "variable '" + var_name + "' has unknown type '" + kind + "'");
        }
    } else if (node->is_object() && node->contains("choice")) {
        type.kind = VariableType::Choice;
        const json& choice = (*node)["choice"];
        if (choice.is_object() && choice.contains("options")) options = &choice["options"];
    } else {
        return descriptor_error(origin, "variable '" + var_name + "' has malformed type");
    }

    if (type.kind == VariableType::Choice) {
        if (!options || !options->is_array() || options->empty()) {
            return descriptor_error(origin,
                "choice variable '" + var_name + "' needs a non-empty options list");
        }
        for (const auto& opt : *options) {
            if (!opt.is_string()) {
                return descriptor_error(origin,
                    "choice variable '" + var_name + "' has a non-string option");
            }
            type.options.push_back(opt.get<std::string>());
        }
    }
    return Result<VariableType>::ok(std::move(type));
}

static Result<TemplateVariable> parse_variable(const json& var, const std::string& origin) {
    if (!var.is_object()) {
        return descriptor_error(origin, "each variable must be an object");
    }

    TemplateVariable v;
    auto name = read_string(var, "name", origin, true);
    STENCIL_TRY(name);
    v.name = std::move(name).value();

    auto desc = read_string(var, "description", origin, false);
    STENCIL_TRY(desc);
    v.description = std::move(desc).value();

    if (var.contains("required")) {
        if (!var["required"].is_boolean()) {
            return descriptor_error(origin, "variable '" + v.name + "': 'required' must be a boolean");
        }
        v.required = var["required"].get<bool>();
    }

    if (var.contains("default") && !var["default"].is_null()) {
        const json& d = var["default"];
        v.default_value = d.is_string() ? d.get<std::string>() : d.dump();
    }

    auto type = parse_type(var, origin, v.name);
    STENCIL_TRY(type);
    v.type = std::move(type).value();

    return Result<TemplateVariable>::ok(std::move(v));
}

// ---------------------------------------------------------------------------
// VariableType / TemplateVariable
// ---------------------------------------------------------------------------

const char* VariableType::kind_name(Kind k) {
    switch (k) {
        case String:  return "string";
        case Boolean: return "boolean";
        case Number:  return "number";
        case Choice:  return "choice";
    }
    return "string";
}

std::optional<std::string> TemplateVariable::effective_default() const {
    if (required) return std::nullopt;
    return default_value;
}

// ---------------------------------------------------------------------------
// TemplateMetadata
// ---------------------------------------------------------------------------

Result<TemplateMetadata> TemplateMetadata::parse(const std::string& json_str,
                                                 const std::string& origin) {
    json doc;
    try {
        doc = json::parse(json_str);
    } catch (const json::parse_error& e) {
        return descriptor_error(origin, std::string("JSON parse error: ") + e.what());
    }
    if (!doc.is_object()) {
        return descriptor_error(origin, "descriptor must be a JSON object");
    }

    TemplateMetadata meta;

    auto name = read_string(doc, "name", origin, true);
    STENCIL_TRY(name);
    meta.name = std::move(name).value();
    if (meta.name.empty()) {
        return descriptor_error(origin, "field 'name' is empty");
    }

    auto version = read_string(doc, "version", origin, true);
    STENCIL_TRY(version);
    meta.version = std::move(version).value();

    auto project_type = read_string(doc, "project_type", origin, true);
    STENCIL_TRY(project_type);
    meta.project_type = std::move(project_type).value();

    auto description = read_string(doc, "description", origin, false);
    STENCIL_TRY(description);
    meta.description = std::move(description).value();

    auto author = read_string(doc, "author", origin, false);
    STENCIL_TRY(author);
    meta.author = std::move(author).value();

    auto deps = read_string_list(doc, "dependencies", origin);
    STENCIL_TRY(deps);
    meta.dependencies = std::move(deps).value();

    auto tags = read_string_list(doc, "tags", origin);
    STENCIL_TRY(tags);
    meta.tags = std::move(tags).value();

    if (doc.contains("variables") && !doc["variables"].is_null()) {
        if (!doc["variables"].is_array()) {
            return descriptor_error(origin, "field 'variables' must be an array");
        }
        for (const auto& var : doc["variables"]) {
            auto v = parse_variable(var, origin);
            STENCIL_TRY(v);
            meta.variables.push_back(std::move(v).value());
        }
    }

    return Result<TemplateMetadata>::ok(std::move(meta));
}

Result<TemplateMetadata> TemplateMetadata::load(const fs::path& dir) {
    fs::path file = dir / kDescriptorFile;
    std::ifstream in(file);
    if (!in.is_open()) {
        return StencilError{StencilError::TemplateProcessing,
            "missing template descriptor: " + file.string(),
            std::string("every template directory needs a ") + kDescriptorFile};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse(ss.str(), file.string());
}

std::string TemplateMetadata::to_json() const {
    json doc;
    doc["name"] = name;
    doc["version"] = version;
    doc["description"] = description;
    doc["author"] = author;
    doc["project_type"] = project_type;
    doc["dependencies"] = dependencies;
    doc["tags"] = tags;

    json vars = json::array();
    for (const auto& v : variables) {
        json jv;
        jv["name"] = v.name;
        jv["description"] = v.description;
        jv["required"] = v.required;
        if (v.default_value) jv["default"] = *v.default_value;
        jv["type"] = VariableType::kind_name(v.type.kind);
        if (v.type.kind == VariableType::Choice) jv["options"] = v.type.options;
        vars.push_back(std::move(jv));
    }
    doc["variables"] = std::move(vars);
    return doc.dump();
}

// ---------------------------------------------------------------------------
// Template roots
// ---------------------------------------------------------------------------

static bool has_descriptor(const fs::path& dir) {
    std::error_code ec;
    return fs::is_regular_file(dir / kDescriptorFile, ec);
}

Result<std::vector<FetchedTemplate>> scan_template_root(const fs::path& root) {
    std::vector<FetchedTemplate> out;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return StencilError{StencilError::SourceUnavailable,
            "template root is not a directory: " + root.string()};
    }

    if (has_descriptor(root)) {
        auto meta = TemplateMetadata::load(root);
        STENCIL_TRY(meta);
        out.push_back({root.string(), std::move(meta).value()});
        return Result<std::vector<FetchedTemplate>>::ok(std::move(out));
    }

    std::vector<fs::path> dirs;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_directory()) continue;
        std::string dirname = it->path().filename().string();
        if (dirname.empty() || dirname[0] == '.') continue;
        dirs.push_back(it->path());
    }
    if (ec) {
        return StencilError{StencilError::IO,
            "cannot read template root " + root.string() + ": " + ec.message()};
    }
    std::sort(dirs.begin(), dirs.end());

    for (const auto& dir : dirs) {
        if (!has_descriptor(dir)) {
            stencil::log::debug("skipping %s: no %s", dir.string().c_str(), kDescriptorFile);
            continue;
        }
        auto meta = TemplateMetadata::load(dir);
        if (meta.is_err()) {
            stencil::log::warn("skipping template %s: %s",
                               dir.string().c_str(), meta.error().message.c_str());
            continue;
        }
        out.push_back({dir.string(), std::move(meta).value()});
    }

    return Result<std::vector<FetchedTemplate>>::ok(std::move(out));
}

Result<FetchedTemplate> find_template(const fs::path& root, const std::string& name) {
    if (name.empty() || name.find('/') != std::string::npos ||
        name.find('\\') != std::string::npos || name == "." || name == "..") {
        return StencilError{StencilError::InvalidArg,
            "invalid template name '" + name + "'"};
    }

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return StencilError{StencilError::SourceUnavailable,
            "template root is not a directory: " + root.string()};
    }

    if (has_descriptor(root)) {
        auto meta = TemplateMetadata::load(root);
        STENCIL_TRY(meta);
        if (meta.value().name != name) {
            return StencilError{StencilError::TemplateNotFound,
                "template '" + name + "' not found in " + root.string()};
        }
        return Result<FetchedTemplate>::ok({root.string(), std::move(meta).value()});
    }

    fs::path dir = root / name;
    if (!fs::is_directory(dir, ec)) {
        return StencilError{StencilError::TemplateNotFound,
            "template '" + name + "' not found in " + root.string()};
    }

    auto meta = TemplateMetadata::load(dir);
    STENCIL_TRY(meta);
    return Result<FetchedTemplate>::ok({dir.string(), std::move(meta).value()});
}

} // namespace stencil
