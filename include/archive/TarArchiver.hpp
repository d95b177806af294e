#pragma once

#include "archive/Archiver.hpp"

#include <string>
#include <utility>

namespace vc::archive {

// Gzipped tarballs through the system tar binary.
class TarArchiver final : public Archiver {
public:
    explicit TarArchiver(std::string tarPath = "tar") : tarPath_(std::move(tarPath)) {}

protected:
    void doExtract(const fs::path& source, const fs::path& destination) const override;
    void doCompress(const std::vector<std::string>& files, const fs::path& cwd,
                    const fs::path& destination) const override;

private:
    std::string tarPath_;
};

}
