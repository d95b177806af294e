#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace vc {

// Raised when a caller-supplied input or a required local file is missing.
// Never retried.
struct PreconditionError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct TransferError : std::runtime_error {
    TransferError(const std::string& msg, const bool transient = true, const long httpStatus = 0)
        : std::runtime_error(msg), transient_(transient), httpStatus_(httpStatus) {}

    [[nodiscard]] bool transient() const { return transient_; }
    [[nodiscard]] long httpStatus() const { return httpStatus_; }

private:
    bool transient_;
    long httpStatus_;
};

struct RetriesExhaustedError : TransferError {
    RetriesExhaustedError(const std::string& msg, const unsigned int attempts, const long httpStatus = 0)
        : TransferError(msg, false, httpStatus), attempts_(attempts) {}

    [[nodiscard]] unsigned int attempts() const { return attempts_; }

private:
    unsigned int attempts_;
};

struct ArchiveError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A failed extraction. On a local cache entry this means the entry is corrupt.
struct ExtractError : ArchiveError {
    using ArchiveError::ArchiveError;
};

struct CompressError : ArchiveError {
    using ArchiveError::ArchiveError;
};

// Index or queue API failure other than a lookup miss.
struct UpstreamError : std::runtime_error {
    UpstreamError(const std::string& msg, const long status, std::string body = {})
        : std::runtime_error(msg), status_(status), body_(std::move(body)) {}

    [[nodiscard]] long status() const { return status_; }
    [[nodiscard]] const std::string& body() const { return body_; }

private:
    long status_;
    std::string body_;
};

}
