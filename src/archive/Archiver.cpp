#include "archive/Archiver.hpp"
#include "util/errors.hpp"

#include <fmt/core.h>

using namespace vc::archive;

void Archiver::extract(const fs::path& source, const fs::path& destination) const {
    if (destination.empty()) throw PreconditionError("Extraction requires a destination directory");
    fs::create_directories(destination);
    if (!fs::exists(source)) throw PreconditionError(fmt::format("{} must exist to extract", source.string()));

    doExtract(source, destination);
}

void Archiver::compress(const std::vector<std::string>& files, const fs::path& cwd, const fs::path& destination) const {
    if (files.empty()) throw PreconditionError("Refusing to create an empty artifact, no files given");

    for (const auto& file : files) {
        const auto path = cwd / file;
        if (!fs::exists(path)) throw PreconditionError(fmt::format("Missing file in artifact path ({})", path.string()));
    }

    if (destination.has_parent_path()) fs::create_directories(destination.parent_path());

    doCompress(files, cwd, destination);
}
