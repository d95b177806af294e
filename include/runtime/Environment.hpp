#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace vc::runtime {

struct Environment {
    virtual ~Environment() = default;

    // Unset and empty variables both yield nullopt.
    [[nodiscard]] virtual std::optional<std::string> get(const std::string& name) const = 0;
};

struct ProcessEnvironment final : Environment {
    [[nodiscard]] std::optional<std::string> get(const std::string& name) const override;
};

class StaticEnvironment final : public Environment {
public:
    StaticEnvironment() = default;
    explicit StaticEnvironment(std::unordered_map<std::string, std::string> vars) : vars_(std::move(vars)) {}

    void set(const std::string& name, std::string value) { vars_[name] = std::move(value); }

    [[nodiscard]] std::optional<std::string> get(const std::string& name) const override;

private:
    std::unordered_map<std::string, std::string> vars_;
};

}
