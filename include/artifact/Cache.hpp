#pragma once

#include "artifact/PathResolver.hpp"
#include "index/Client.hpp"
#include "util/timestamp.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vc::storage { class Client; }
namespace vc::transfer { class Engine; }
namespace vc::archive { class Archiver; }
namespace vc::runtime { struct Environment; }

namespace vc::artifact {

namespace fs = std::filesystem;

// Unset fields fall back to TASK_ID, RUN_ID, now + 30 days and now (ms).
struct PublishOptions {
    std::optional<std::string> taskId;
    std::optional<std::string> runId;
    std::optional<util::Clock::time_point> expires;
    std::optional<std::int64_t> rank;
};

class Cache {
public:
    static constexpr std::chrono::hours DEFAULT_EXPIRY{24 * 30};

    Cache(PathResolver paths,
          std::shared_ptr<index::Client> index,
          std::shared_ptr<storage::Client> storage,
          std::shared_ptr<const transfer::Engine> transfer,
          std::shared_ptr<const archive::Archiver> archiver,
          std::shared_ptr<const runtime::Environment> env);

    // Extracts the artifact into `destination`, preferring the local copy.
    // A local copy that fails to extract is deleted together with `destination`
    // and the remote copy is tried once. Returns false only when neither exists.
    bool resolve(const std::string& name, const std::string& ns, const fs::path& destination) const;

    [[nodiscard]] std::optional<std::string> lookupRemote(const std::string& ns, const std::string& storageName) const;

    // Requires package() to have produced the local file. Returns the registered record.
    index::Record publish(const std::string& name, const std::string& ns, const PublishOptions& options = {}) const;

    fs::path package(const std::string& name, const fs::path& cwd, const std::vector<std::string>& files) const;

    [[nodiscard]] const PathResolver& paths() const { return paths_; }

private:
    PathResolver paths_;
    std::shared_ptr<index::Client> index_;
    std::shared_ptr<storage::Client> storage_;
    std::shared_ptr<const transfer::Engine> transfer_;
    std::shared_ptr<const archive::Archiver> archiver_;
    std::shared_ptr<const runtime::Environment> env_;

    bool extractLocal(const fs::path& localPath, const fs::path& destination) const;
};

}
