#pragma once

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace kreuzberg {

// Type aliases
using ByteVector = std::vector<std::uint8_t>;
using ByteSpan = std::span<const std::uint8_t>;

// Error types. The first eight values are the codes reported through the C ABI;
// the remaining ones are internal refinements that collapse onto them.
enum class ErrorCode {
    Success = 0,
    GenericError = 1,
    Panic = 2,
    InvalidArgument = 3,
    IoError = 4,
    ParsingError = 5,
    OcrError = 6,
    MissingDependency = 7,

    ValidationError = 100,
    PluginError,
    UnsupportedFormat,
    NotFound,
    InternalError
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::GenericError: return "Generic error";
        case ErrorCode::Panic: return "Panic";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::ParsingError: return "Parsing error";
        case ErrorCode::OcrError: return "OCR error";
        case ErrorCode::MissingDependency: return "Missing dependency";
        case ErrorCode::ValidationError: return "Validation error";
        case ErrorCode::PluginError: return "Plugin error";
        case ErrorCode::UnsupportedFormat: return "Unsupported format";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::InternalError: return "Internal error";
    }
    return "Unknown error";
}

// Map any code onto the eight codes visible at the C boundary.
constexpr ErrorCode toAbiCode(ErrorCode error) {
    switch (error) {
        case ErrorCode::ValidationError: return ErrorCode::InvalidArgument;
        case ErrorCode::PluginError: return ErrorCode::GenericError;
        case ErrorCode::UnsupportedFormat: return ErrorCode::MissingDependency;
        case ErrorCode::NotFound: return ErrorCode::IoError;
        case ErrorCode::InternalError: return ErrorCode::GenericError;
        default: return error;
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

// Simple Result type for operations that can fail
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
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
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

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
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

} // namespace kreuzberg

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<kreuzberg::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(kreuzberg::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", kreuzberg::errorToString(error));
    }
};
#endif
