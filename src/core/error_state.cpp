#include <kreuzberg/core/error_state.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>

namespace kreuzberg::core {

namespace {

struct ThreadErrorSlot {
    ErrorCode code = ErrorCode::Success;
    std::string message;
    std::string errorType;
    std::string function;
    std::string file;
    std::uint32_t line = 0;
    std::string contextInfo;
    bool isPanic = false;
    std::optional<PanicContext> panic;
};

thread_local ThreadErrorSlot g_slot;

std::uint64_t nowMs() {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace

std::string PanicContext::toJson() const {
    nlohmann::json j;
    j["message"] = message;
    j["function"] = function;
    j["file"] = file;
    j["line"] = line;
    j["timestamp_ms"] = timestampMs;
    return j.dump();
}

void ErrorState::set(const Error& error, const char* function) {
    g_slot.code = toAbiCode(error.code);
    g_slot.message = error.message.empty() ? errorToString(error.code) : error.message;
    g_slot.errorType = errorToString(error.code);
    g_slot.function = function ? function : "";
    g_slot.file.clear();
    g_slot.line = 0;
    g_slot.contextInfo.clear();
    g_slot.isPanic = false;
    spdlog::debug("[ffi] {} failed: {} ({})", g_slot.function, g_slot.message,
                  errorToString(error.code));
}

void ErrorState::setPanic(std::string message, const char* function, const char* file,
                          std::uint32_t line) {
    PanicContext ctx;
    ctx.message = message;
    ctx.function = function ? function : "";
    ctx.file = file ? file : "";
    ctx.line = line;
    ctx.timestampMs = nowMs();

    g_slot.code = ErrorCode::Panic;
    g_slot.message = "Internal panic in " + ctx.function + ": " + message;
    g_slot.errorType = errorToString(ErrorCode::Panic);
    g_slot.function = ctx.function;
    g_slot.file = ctx.file;
    g_slot.line = line;
    g_slot.contextInfo.clear();
    g_slot.isPanic = true;
    g_slot.panic = std::move(ctx);
    spdlog::error("[ffi] caught panic in {}: {}", g_slot.function, message);
}

void ErrorState::clear() {
    g_slot.code = ErrorCode::Success;
    g_slot.message.clear();
    g_slot.errorType.clear();
    g_slot.function.clear();
    g_slot.file.clear();
    g_slot.line = 0;
    g_slot.contextInfo.clear();
    g_slot.isPanic = false;
}

const char* ErrorState::message() {
    if (g_slot.message.empty())
        return nullptr;
    return g_slot.message.c_str();
}

ErrorCode ErrorState::code() {
    return g_slot.code;
}

std::optional<PanicContext> ErrorState::panicContext() {
    return g_slot.panic;
}

ErrorDetails ErrorState::details() {
    ErrorDetails d;
    d.code = g_slot.code;
    d.message = g_slot.message;
    d.errorType = g_slot.errorType;
    d.sourceFile = g_slot.file;
    d.sourceFunction = g_slot.function;
    d.lineNumber = g_slot.line;
    d.contextInfo = g_slot.contextInfo;
    d.isPanic = g_slot.isPanic;
    return d;
}

void ErrorState::setContextInfo(std::string info) {
    g_slot.contextInfo = std::move(info);
}

} // namespace kreuzberg::core
