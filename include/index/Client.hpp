#pragma once

#include "util/timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace vc::index {

struct Record {
    std::string ns;
    std::string taskId;
    std::int64_t rank = 0;
    util::Clock::time_point expires{};
    nlohmann::json data = nlohmann::json::object();
};

// Namespace -> best current record. The index service owns ranking, retention and
// eviction: insert() registers a candidate and never resolves conflicts itself.
class Client {
public:
    virtual ~Client() = default;

    // nullopt when nothing is indexed under `ns`. Any other failure throws UpstreamError.
    [[nodiscard]] virtual std::optional<Record> find(const std::string& ns) const = 0;

    virtual void insert(const std::string& ns, const Record& record) = 0;
};

void to_json(nlohmann::json& j, const Record& r);
void from_json(const nlohmann::json& j, Record& r);

}
