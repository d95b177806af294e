#include "index/Client.hpp"

namespace vc::index {

void to_json(nlohmann::json& j, const Record& r) {
    j = {
        {"taskId", r.taskId},
        {"rank", r.rank},
        {"data", r.data.is_null() ? nlohmann::json::object() : r.data},
        {"expires", util::toIso8601(r.expires)}
    };
}

void from_json(const nlohmann::json& j, Record& r) {
    r.ns = j.value("namespace", std::string{});
    r.taskId = j.at("taskId").get<std::string>();
    r.rank = j.value("rank", static_cast<std::int64_t>(0));
    r.data = j.value("data", nlohmann::json::object());
    if (j.contains("expires") && j["expires"].is_string()) r.expires = util::parseIso8601(j["expires"].get<std::string>());
}

}
