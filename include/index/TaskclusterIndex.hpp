#pragma once

#include "index/Client.hpp"
#include "taskcluster/Client.hpp"

namespace vc::index {

class TaskclusterIndex final : public Client {
public:
    explicit TaskclusterIndex(taskcluster::Client api);

    [[nodiscard]] std::optional<Record> find(const std::string& ns) const override;
    void insert(const std::string& ns, const Record& record) override;

    [[nodiscard]] std::string taskUrl(const std::string& ns) const;

private:
    taskcluster::Client api_;
};

}
