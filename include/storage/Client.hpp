#pragma once

#include "util/timestamp.hpp"

#include <string>

namespace vc::storage {

struct DestinationOptions {
    std::string storageType = "s3";
    util::Clock::time_point expires{};
    std::string contentType = "application/x-tar";
};

struct Destination {
    std::string putUrl;
};

// Registers upload destinations and builds retrieval URLs. Bytes never flow through here.
class Client {
public:
    virtual ~Client() = default;

    [[nodiscard]] virtual Destination createDestination(const std::string& taskId, const std::string& runId,
                                                        const std::string& storageName,
                                                        const DestinationOptions& opts) = 0;

    // Pure string building, no I/O.
    [[nodiscard]] virtual std::string buildRetrievalUrl(const std::string& taskId,
                                                        const std::string& storageName) const = 0;
};

}
