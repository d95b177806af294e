#pragma once

#include "config/Config.hpp"

#include <map>
#include <memory>
#include <string>

namespace vc::index { class Client; }
namespace vc::storage { class Client; }
namespace vc::transfer { class Engine; }
namespace vc::archive { class Archiver; }
namespace vc::artifact { class Cache; }

namespace vc::runtime {

struct Environment;

// Collaborators shared by every cache profile of one process.
struct Deps {
    std::shared_ptr<const Environment> env;
    std::shared_ptr<index::Client> indexClient;
    std::shared_ptr<storage::Client> storageClient;
    std::shared_ptr<const transfer::Engine> transferEngine;
    std::shared_ptr<const archive::Archiver> archiver;
    std::map<std::string, config::CacheProfileConfig> profiles;

    // Taskcluster index and queue, libcurl transport with retries, system tar.
    static Deps fromConfig(const config::Config& cfg, std::shared_ptr<const Environment> env);

    // Throws PreconditionError for an unknown profile.
    [[nodiscard]] std::shared_ptr<artifact::Cache> cache(const std::string& profile) const;
};

}
