#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace vc::runtime { struct Environment; }

namespace vc::artifact {

namespace fs = std::filesystem;

class PathResolver {
public:
    PathResolver(config::CacheProfileConfig layout, std::shared_ptr<const runtime::Environment> env);

    // Wire-visible naming convention, never configurable.
    [[nodiscard]] static std::string storageName(const std::string& name);

    // Pure: consults only the layout and the injected environment, never the filesystem.
    // Names that are absolute or contain ".." raise PreconditionError.
    [[nodiscard]] fs::path localPath(const std::string& name) const;
    [[nodiscard]] fs::path cacheDir() const;

private:
    config::CacheProfileConfig layout_;
    std::shared_ptr<const runtime::Environment> env_;
};

}
