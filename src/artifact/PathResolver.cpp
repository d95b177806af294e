#include "artifact/PathResolver.hpp"
#include "runtime/Environment.hpp"
#include "util/errors.hpp"

#include <fmt/core.h>

using namespace vc::artifact;
using namespace vc::config;

PathResolver::PathResolver(CacheProfileConfig layout, std::shared_ptr<const runtime::Environment> env)
    : layout_(std::move(layout)), env_(std::move(env)) {
    if (!env_) throw std::invalid_argument("PathResolver requires an environment");
}

std::string PathResolver::storageName(const std::string& name) {
    return "public/" + name + ".tar.gz";
}

fs::path PathResolver::cacheDir() const {
    fs::path root;
    if (!layout_.cache_dir.env.empty())
        if (const auto v = env_->get(layout_.cache_dir.env)) root = *v;
    if (root.empty()) root = layout_.cache_dir.root;

    if (root.empty()) throw PreconditionError(fmt::format(
        "Cannot resolve cache directory: ${} is unset and no fallback root is configured",
        layout_.cache_dir.env));

    return layout_.cache_dir.subdir.empty() ? root : root / layout_.cache_dir.subdir;
}

fs::path PathResolver::localPath(const std::string& name) const {
    if (name.empty()) throw PreconditionError("Artifact name must not be empty");

    // Result stays under cacheDir(): an absolute component would replace it on append.
    const fs::path relative(layout_.cache_name.prefix + name + layout_.cache_name.suffix);
    if (relative.has_root_path())
        throw PreconditionError(fmt::format("Artifact name '{}' must be relative to the cache directory", name));
    for (const auto& part : relative)
        if (part == "..") throw PreconditionError(fmt::format("Artifact name '{}' must not contain '..'", name));

    return cacheDir() / relative;
}
