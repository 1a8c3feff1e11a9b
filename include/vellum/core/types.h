#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace vellum {

using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using ProjectId = std::string;
using JobId = std::string;
using DocumentId = std::string;
using ChunkId = std::string;
using Embedding = std::vector<float>;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    InvalidState,
    InvalidData,
    NotFound,
    NetworkError,
    Timeout,
    RateLimited,
    ResourceExhausted,
    DatabaseError,
    TransactionFailed,
    OperationCancelled,
    UnsupportedFormat,
    ExtractionFailed,
    EmbeddingFailed,
    RerankerUnavailable,
    TenantIsolationViolation,
    JobNotFound,
    ProjectNotFound,
    NotInitialized,
    InternalError,
    Unknown
};

constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::RateLimited: return "Rate limited";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::TransactionFailed: return "Transaction failed";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::UnsupportedFormat: return "Unsupported format";
        case ErrorCode::ExtractionFailed: return "Extraction failed";
        case ErrorCode::EmbeddingFailed: return "Embedding failed";
        case ErrorCode::RerankerUnavailable: return "Reranker unavailable";
        case ErrorCode::TenantIsolationViolation: return "Tenant isolation violation";
        case ErrorCode::JobNotFound: return "Job not found";
        case ErrorCode::ProjectNotFound: return "Project not found";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Error kind recorded against a failed file in an ingestion job
constexpr const char* errorKindName(ErrorCode error) {
    switch (error) {
        case ErrorCode::UnsupportedFormat: return "UnsupportedFormatError";
        case ErrorCode::ExtractionFailed:
        case ErrorCode::InvalidData: return "ExtractionError";
        case ErrorCode::EmbeddingFailed:
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::RateLimited: return "EmbeddingProviderError";
        case ErrorCode::DatabaseError:
        case ErrorCode::TransactionFailed: return "StorageError";
        case ErrorCode::OperationCancelled: return "Cancelled";
        default: return "InternalError";
    }
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + error_.message);
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace vellum

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<vellum::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(vellum::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", vellum::errorToString(error));
    }
};
#endif
