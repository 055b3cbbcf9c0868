#include <stencil/adapter.hpp>
#include <stencil/adapters/local.hpp>
#include <stencil/adapters/git.hpp>
#include <stencil/adapters/http.hpp>
#include <stencil/adapters/package.hpp>
#include <stencil/config.hpp>
#include <stencil/http.hpp>

namespace stencil {

void AdapterSet::add(std::unique_ptr<SourceAdapter> adapter) {
    SourceKind kind = adapter->kind();
    adapters_[kind] = std::move(adapter);
}

SourceAdapter* AdapterSet::find(SourceKind kind) const {
    auto it = adapters_.find(kind);
    return it == adapters_.end() ? nullptr : it->second.get();
}

AdapterSet AdapterSet::defaults(const RegistryConfig& config) {
    auto http = std::make_shared<CurlHttpClient>(config.fetch_timeout_seconds);

    AdapterSet set;
    set.add(std::make_unique<LocalAdapter>());
    set.add(std::make_unique<GitAdapter>(config.cache_dir, config.fetch_timeout_seconds));
    set.add(std::make_unique<HttpAdapter>(config.cache_dir, http));
    set.add(std::make_unique<PackageAdapter>(config.cache_dir, http));
    return set;
}

std::unique_lock<std::mutex> PathLocks::lock(const std::string& path) {
    std::mutex* m = nullptr;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto& slot = locks_[path];
        if (!slot) slot = std::make_unique<std::mutex>();
        m = slot.get();
    }
    return std::unique_lock<std::mutex>(*m);
}

Result<std::vector<TemplateMetadata>> list_from_root(Result<std::string> root) {
    if (root.is_err()) return std::move(root).error();

    auto found = scan_template_root(root.value());
    if (found.is_err()) return std::move(found).error();

    std::vector<TemplateMetadata> out;
    out.reserve(found.value().size());
    for (auto& t : found.value()) {
        out.push_back(std::move(t.metadata));
    }
    return Result<std::vector<TemplateMetadata>>::ok(std::move(out));
}

} // namespace stencil
