#include "transfer/RetryingTransferer.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"
#include "util/errors.hpp"

#include <algorithm>
#include <thread>
#include <fmt/core.h>

using namespace vc::transfer;
using namespace vc::logging;

RetryPolicy RetryPolicy::fromConfig(const config::TransferConfig& cfg) {
    return {cfg.download_attempts, cfg.upload_attempts, cfg.retry_delay};
}

RetryingTransferer::RetryingTransferer(std::shared_ptr<const Transferer> inner, RetryPolicy policy)
    : inner_(std::move(inner)), policy_(policy) {
    if (!inner_) throw std::invalid_argument("RetryingTransferer requires a transport");
    policy_.downloadAttempts = std::max(1u, policy_.downloadAttempts);
    policy_.uploadAttempts = std::max(1u, policy_.uploadAttempts);
}

template <typename Fn>
void RetryingTransferer::withRetries(const char* op, const std::string& target, const unsigned int budget, Fn&& fn) const {
    for (unsigned int attempt = 1;; ++attempt) {
        try {
            fn();
            if (attempt > 1) LogRegistry::transfer()->info("[Transfer] {} {} succeeded on attempt {}/{}",
                                                           op, target, attempt, budget);
            return;
        } catch (const TransferError& e) {
            if (!e.transient()) {
                LogRegistry::transfer()->error("[Transfer] {} {} failed with a non-retryable error on attempt {}/{}: {}",
                                               op, target, attempt, budget, e.what());
                throw;
            }

            if (attempt >= budget) {
                LogRegistry::transfer()->error("[Transfer] {} {} exhausted {} attempt(s), last error: {}",
                                               op, target, budget, e.what());
                throw RetriesExhaustedError(
                    fmt::format("{} {} failed after {} attempt(s): {}", op, target, attempt, e.what()),
                    attempt, e.httpStatus());
            }

            if (attempt == 1) LogRegistry::transfer()->warn("[Transfer] {} {} failed on first attempt, retrying ({} left): {}",
                                                            op, target, budget - attempt, e.what());
            else LogRegistry::transfer()->warn("[Transfer] {} {} attempt {}/{} failed: {}",
                                               op, target, attempt, budget, e.what());

            if (policy_.delay.count() > 0) std::this_thread::sleep_for(policy_.delay);
        }
    }
}

void RetryingTransferer::download(const std::string& url, const fs::path& destination) const {
    withRetries("download", url, policy_.downloadAttempts, [&] { inner_->download(url, destination); });
}

void RetryingTransferer::upload(const fs::path& source, const std::string& url) const {
    withRetries("upload", source.string(), policy_.uploadAttempts, [&] { inner_->upload(source, url); });
}
