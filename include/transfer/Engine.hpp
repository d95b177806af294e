#pragma once

#include "transfer/Transferer.hpp"

#include <memory>

namespace vc::config { struct TransferConfig; }

namespace vc::transfer {

// Pre/postconditions of a transfer; how bytes move and how often they are retried
// belongs to the wrapped Transferer.
class Engine {
public:
    explicit Engine(std::shared_ptr<const Transferer> transport);

    // libcurl transport wrapped in the retry decorator, budgets from config
    static std::shared_ptr<Engine> fromConfig(const config::TransferConfig& cfg);

    // Creates the parent directory of `localPath` first.
    void download(const std::string& url, const fs::path& localPath) const;

    // Throws PreconditionError when `localPath` does not exist.
    void upload(const fs::path& localPath, const std::string& destinationUrl) const;

private:
    std::shared_ptr<const Transferer> transport_;
};

}
