#pragma once

#include <kreuzberg/core/types.h>

#include <cstdint>
#include <optional>
#include <string>

namespace kreuzberg::core {

/**
 * @brief Context captured when an exception escapes into the C boundary
 */
struct PanicContext {
    std::string message;
    std::string function;
    std::string file;
    std::uint32_t line = 0;
    std::uint64_t timestampMs = 0; ///< Milliseconds since the Unix epoch

    /**
     * @brief JSON rendering used by kreuzberg_last_panic_context()
     */
    std::string toJson() const;
};

/**
 * @brief Snapshot of the calling thread's last error
 */
struct ErrorDetails {
    ErrorCode code = ErrorCode::Success; ///< Already mapped onto the C ABI codes
    std::string message;
    std::string errorType;
    std::string sourceFile;
    std::string sourceFunction;
    std::uint32_t lineNumber = 0;
    std::string contextInfo;
    bool isPanic = false;
};

/**
 * @brief Thread-local error registry behind the C ABI
 *
 * Each OS thread owns an independent slot. Nothing here locks; values written
 * on one thread are never observed from another.
 */
class ErrorState {
public:
    /**
     * @brief Record a failure for the calling thread
     * @param error Error to record; internal codes are mapped with toAbiCode()
     * @param function Name of the C entry point that failed (optional)
     */
    static void set(const Error& error, const char* function = nullptr);

    /**
     * @brief Record a caught exception as a Panic
     */
    static void setPanic(std::string message, const char* function, const char* file,
                         std::uint32_t line);

    /**
     * @brief Reset the slot at the start of a fallible call
     *
     * The panic context survives until the next panic so it can be inspected
     * after the failing call returned.
     */
    static void clear();

    /**
     * @brief Last message, or nullptr when the last call succeeded
     *
     * The pointer stays valid until the next call on the same thread.
     */
    static const char* message();

    static ErrorCode code();

    static std::optional<PanicContext> panicContext();

    static ErrorDetails details();

    /**
     * @brief Attach free-form context (e.g. the offending path) to the current error
     */
    static void setContextInfo(std::string info);
};

} // namespace kreuzberg::core
