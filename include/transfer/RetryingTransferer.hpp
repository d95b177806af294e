#pragma once

#include "transfer/Transferer.hpp"

#include <chrono>
#include <memory>

namespace vc::config { struct TransferConfig; }

namespace vc::transfer {

struct RetryPolicy {
    unsigned int downloadAttempts = 20;
    unsigned int uploadAttempts = 10;
    std::chrono::milliseconds delay{0};

    static RetryPolicy fromConfig(const config::TransferConfig& cfg);
};

// Retries transient TransferErrors of any transport up to a fixed attempt budget per call.
// Exhausting the budget raises RetriesExhaustedError; non-transient failures are rethrown at once.
class RetryingTransferer final : public Transferer {
public:
    RetryingTransferer(std::shared_ptr<const Transferer> inner, RetryPolicy policy);

    void download(const std::string& url, const fs::path& destination) const override;
    void upload(const fs::path& source, const std::string& url) const override;

    [[nodiscard]] const RetryPolicy& policy() const { return policy_; }

private:
    std::shared_ptr<const Transferer> inner_;
    RetryPolicy policy_;

    template <typename Fn>
    void withRetries(const char* op, const std::string& target, unsigned int budget, Fn&& fn) const;
};

}
