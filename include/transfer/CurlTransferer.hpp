#pragma once

#include "transfer/Transferer.hpp"
#include "config/Config.hpp"

#include <curl/curl.h>

namespace vc::transfer {

class CurlTransferer final : public Transferer {
public:
    static constexpr auto CONTENT_TYPE = "application/x-tar";
    static constexpr auto CONTENT_ENCODING = "gzip";

    explicit CurlTransferer(config::TransferConfig cfg = {});

    void download(const std::string& url, const fs::path& destination) const override;
    void upload(const fs::path& source, const std::string& url) const override;

    [[nodiscard]] static bool isTransient(CURLcode code, long httpStatus);

private:
    config::TransferConfig cfg_;

    void applyLimits(CURL* h) const;
};

}
