#include "archive/TarArchiver.hpp"
#include "logging/LogRegistry.hpp"
#include "util/errors.hpp"
#include "util/process.hpp"

#include <fmt/core.h>

using namespace vc::archive;
using namespace vc::logging;
using namespace vc::util;

void TarArchiver::doExtract(const fs::path& source, const fs::path& destination) const {
    const std::vector<std::string> argv = {
        tarPath_, "-xzf", source.string(), "-C", destination.string()
    };

    LogRegistry::archive()->debug("[TarArchiver] {}", joinArgs(argv));
    const auto res = runProcess(argv);

    if (!res.ok()) {
        LogRegistry::archive()->error("[TarArchiver] extract of {} failed (exit {}): {}",
                                      source.string(), res.exitCode, res.stderrText);
        throw ExtractError(fmt::format("Failed to extract {} into {} (tar exit {}): {}",
                                       source.string(), destination.string(), res.exitCode, res.stderrText));
    }
}

void TarArchiver::doCompress(const std::vector<std::string>& files, const fs::path& cwd,
                             const fs::path& destination) const {
    std::vector<std::string> argv = {
        tarPath_, "-czf", fs::absolute(destination).string(), "-C", cwd.string(), "--"
    };
    argv.insert(argv.end(), files.begin(), files.end());

    LogRegistry::archive()->debug("[TarArchiver] {}", joinArgs(argv));
    const auto res = runProcess(argv);

    if (!res.ok()) {
        LogRegistry::archive()->error("[TarArchiver] compress into {} failed (exit {}): {}",
                                      destination.string(), res.exitCode, res.stderrText);
        std::error_code ec;
        fs::remove(destination, ec);
        if (ec) LogRegistry::archive()->warn("[TarArchiver] could not remove partial archive {}: {}",
                                             destination.string(), ec.message());
        throw CompressError(fmt::format("Failed to create {} (tar exit {}): {}",
                                        destination.string(), res.exitCode, res.stderrText));
    }
}
