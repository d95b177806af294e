#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace vc::archive {

namespace fs = std::filesystem;

// Preconditions are enforced here, the packing format is left to the backend.
class Archiver {
public:
    virtual ~Archiver() = default;

    // Creates `destination` when missing. Throws PreconditionError if `source` is missing,
    // ExtractError if the backend fails.
    void extract(const fs::path& source, const fs::path& destination) const;

    // Every entry of `files` must exist relative to `cwd`. Parent of `destination` is created first.
    // Throws PreconditionError naming the first missing path, CompressError if the backend fails.
    void compress(const std::vector<std::string>& files, const fs::path& cwd, const fs::path& destination) const;

protected:
    virtual void doExtract(const fs::path& source, const fs::path& destination) const = 0;
    virtual void doCompress(const std::vector<std::string>& files, const fs::path& cwd,
                            const fs::path& destination) const = 0;
};

}
