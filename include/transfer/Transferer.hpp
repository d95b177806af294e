#pragma once

#include <filesystem>
#include <string>

namespace vc::transfer {

namespace fs = std::filesystem;

// Moves one blob between a URL and a local file. Implementations report failures as TransferError,
// flagging whether another attempt could succeed.
struct Transferer {
    virtual ~Transferer() = default;

    virtual void download(const std::string& url, const fs::path& destination) const = 0;
    virtual void upload(const fs::path& source, const std::string& url) const = 0;
};

}
