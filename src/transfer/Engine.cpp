#include "transfer/Engine.hpp"
#include "transfer/CurlTransferer.hpp"
#include "transfer/RetryingTransferer.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"
#include "util/errors.hpp"

#include <fmt/core.h>

using namespace vc::transfer;
using namespace vc::logging;

Engine::Engine(std::shared_ptr<const Transferer> transport) : transport_(std::move(transport)) {
    if (!transport_) throw std::invalid_argument("transfer::Engine requires a transport");
}

std::shared_ptr<Engine> Engine::fromConfig(const config::TransferConfig& cfg) {
    auto curl = std::make_shared<CurlTransferer>(cfg);
    auto retrying = std::make_shared<RetryingTransferer>(std::move(curl), RetryPolicy::fromConfig(cfg));
    return std::make_shared<Engine>(std::move(retrying));
}

void Engine::download(const std::string& url, const fs::path& localPath) const {
    if (localPath.has_parent_path()) fs::create_directories(localPath.parent_path());
    LogRegistry::transfer()->info("[Transfer] downloading {} -> {}", url, localPath.string());
    transport_->download(url, localPath);
}

void Engine::upload(const fs::path& localPath, const std::string& destinationUrl) const {
    if (!fs::exists(localPath)) throw PreconditionError(fmt::format("{} must exist", localPath.string()));
    LogRegistry::transfer()->info("[Transfer] uploading {}", localPath.string());
    transport_->upload(localPath, destinationUrl);
}
