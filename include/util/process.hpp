#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vc::util {

struct ProcessResult {
    int exitCode = -1;
    std::string stderrText;

    [[nodiscard]] bool ok() const { return exitCode == 0; }
};

// Runs argv[0] from PATH, blocking until it exits. stdout is discarded, stderr is captured.
// Throws std::runtime_error only when the child could not be started.
ProcessResult runProcess(const std::vector<std::string>& argv,
                         const std::optional<std::filesystem::path>& cwd = std::nullopt);

std::string joinArgs(const std::vector<std::string>& argv);

}
