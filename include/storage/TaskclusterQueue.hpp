#pragma once

#include "storage/Client.hpp"
#include "taskcluster/Client.hpp"

namespace vc::storage {

class TaskclusterQueue final : public Client {
public:
    explicit TaskclusterQueue(taskcluster::Client api);

    [[nodiscard]] Destination createDestination(const std::string& taskId, const std::string& runId,
                                                const std::string& storageName,
                                                const DestinationOptions& opts) override;

    // Latest run; the queue redirects to the blob.
    [[nodiscard]] std::string buildRetrievalUrl(const std::string& taskId,
                                                const std::string& storageName) const override;

private:
    taskcluster::Client api_;
};

}
