// demo_registry.cpp
//
// Drives the template manager from the command line against whatever
// registries the configuration names:
//
//     ./demo_registry list                    # every template, all registries
//     ./demo_registry list vue                # only vue templates
//     ./demo_registry resolve vue starter     # path + metadata of one template
//     ./demo_registry -c other.toml list      # explicit config file
//     ./demo_registry clear                   # drop cached resolutions
//
// Without -c the config is discovered: ./stencil.toml, then
// ~/.stencil/registry.toml, then a single local registry at ./templates.
// Pass -v for debug logging.

#include <stencil/config.hpp>
#include <stencil/log.hpp>
#include <stencil/manager.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace stencil;

struct Args {
    std::string config_path;
    bool verbose = false;
    std::vector<std::string> positional;
};

Result<Args> parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-v") {
            args.verbose = true;
        } else if (a == "-c") {
            if (i + 1 >= argc) {
                return StencilError{StencilError::InvalidArg,
                    "-c needs a file argument", "usage: demo_registry -c <config.toml> ..."};
            }
            args.config_path = argv[++i];
        } else {
            args.positional.push_back(a);
        }
    }
    if (args.positional.empty()) {
        return StencilError{StencilError::InvalidArg, "no command given",
            "usage: demo_registry [-v] [-c config] list [type] | resolve <type> <name> | clear"};
    }
    return Result<Args>::ok(std::move(args));
}

void print_metadata(const TemplateMetadata& meta) {
    std::cout << meta.name << " " << meta.version << " [" << meta.project_type << "]";
    if (!meta.description.empty()) std::cout << "  " << meta.description;
    std::cout << "\n";
    for (const auto& var : meta.variables) {
        std::cout << "    " << var.name << " (" << VariableType::kind_name(var.type.kind) << ")";
        if (var.required) std::cout << " required";
        if (auto def = var.effective_default()) std::cout << " default=" << *def;
        std::cout << "\n";
    }
}

Status run(const Args& args) {
    auto config = args.config_path.empty()
        ? discover_config(fs::current_path())
        : RegistryConfig::load(args.config_path);
    if (config.is_err()) return std::move(config).error();

    for (const RegistryEntry* entry : config.value().active_entries()) {
        log::debug("registry '%s' (priority %u): %s", entry->name.c_str(),
                   entry->priority, describe_source(entry->source).c_str());
    }

    auto opened = TemplateManager::open(std::move(config).value());
    if (opened.is_err()) return std::move(opened).error();
    TemplateManager& manager = opened.value();

    const std::string& cmd = args.positional[0];
    if (cmd == "list") {
        std::optional<std::string> type;
        if (args.positional.size() > 1) type = args.positional[1];
        auto listed = manager.list_templates(type);
        if (listed.is_err()) return std::move(listed).error();
        for (const auto& meta : listed.value()) print_metadata(meta);
        return ok_status();
    }
    if (cmd == "resolve") {
        if (args.positional.size() != 3) {
            return StencilError{StencilError::InvalidArg,
                "resolve takes a project type and a template name",
                "usage: demo_registry resolve <type> <name>"};
        }
        auto resolved = manager.resolve(args.positional[1], args.positional[2]);
        if (resolved.is_err()) return std::move(resolved).error();
        std::cout << resolved.value().path << "\n";
        print_metadata(resolved.value().metadata);
        return ok_status();
    }
    if (cmd == "clear") {
        return manager.clear_cache();
    }
    return StencilError{StencilError::InvalidArg, "unknown command: " + cmd,
        "commands are list, resolve and clear"};
}

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        std::cerr << args.error().format() << "\n";
        return 2;
    }
    if (args.value().verbose) log::set_level(log::Debug);

    auto status = run(args.value());
    if (status.is_err()) {
        std::cerr << status.error().format() << "\n";
        return 1;
    }
    return 0;
}
