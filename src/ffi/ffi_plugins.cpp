#include "ffi_internal.h"

#include <kreuzberg/config/config_helpers.h>
#include <kreuzberg/plugins/callback_adapters.h>
#include <kreuzberg/plugins/plugin_registry.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

using namespace kreuzberg;
using json = nlohmann::json;
using plugins::PluginRegistry;

bool checkRegistration(const char* name, bool hasCallback) {
    if (!name) {
        ffi::recordError({ErrorCode::InvalidArgument, "plugin name cannot be NULL"});
        return false;
    }
    if (!hasCallback) {
        ffi::recordError({ErrorCode::InvalidArgument,
                          std::string("callback for plugin '") + name + "' cannot be NULL"});
        return false;
    }
    return true;
}

bool registered(const Result<void>& r) {
    if (!r) {
        ffi::recordError(r.error());
        return false;
    }
    return true;
}

/**
 * @brief Parse a list given either as a JSON array of strings or comma separated text
 */
Result<std::vector<std::string>> parseNameList(std::string_view text, const char* what) {
    std::string trimmed(text);
    config::trim(trimmed);
    if (!trimmed.empty() && trimmed.front() == '[') {
        auto parsed = json::parse(trimmed, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_array())
            return Error{ErrorCode::InvalidArgument, std::string(what) + " is not a JSON array"};
        std::vector<std::string> out;
        for (const auto& item : parsed) {
            if (!item.is_string())
                return Error{ErrorCode::InvalidArgument,
                             std::string(what) + " must contain only strings"};
            out.push_back(item.get<std::string>());
        }
        return out;
    }
    return config::split_list(trimmed, ',');
}

} // namespace

extern "C" {

// ============================================================================
// OCR backends
// ============================================================================

bool kreuzberg_register_ocr_backend(const char* name, KreuzbergOcrBackendCallback callback) {
    return ffi::guarded<bool>(false, [&] {
        if (!checkRegistration(name, callback != nullptr))
            return false;
        auto backend = std::make_shared<plugins::CallbackOcrBackend>(name, callback);
        return registered(PluginRegistry::instance().registerOcrBackend(std::move(backend)));
    });
}

bool kreuzberg_register_ocr_backend_with_languages(const char* name,
                                                   KreuzbergOcrBackendCallback callback,
                                                   const char* languages_json) {
    return ffi::guarded<bool>(false, [&] {
        if (!checkRegistration(name, callback != nullptr))
            return false;
        std::vector<std::string> languages;
        if (languages_json) {
            auto parsed = parseNameList(languages_json, "languages");
            if (!parsed) {
                ffi::recordError(parsed.error());
                return false;
            }
            languages = std::move(parsed).value();
        }
        auto backend = std::make_shared<plugins::CallbackOcrBackend>(name, callback, languages);
        return registered(
            PluginRegistry::instance().registerOcrBackend(std::move(backend), languages));
    });
}

bool kreuzberg_unregister_ocr_backend(const char* name) {
    return ffi::guarded<bool>(false, [&] {
        if (!name) {
            ffi::recordError({ErrorCode::InvalidArgument, "plugin name cannot be NULL"});
            return false;
        }
        PluginRegistry::instance().unregisterOcrBackend(name);
        return true;
    });
}

bool kreuzberg_clear_ocr_backends(void) {
    return ffi::guarded<bool>(false, [] {
        PluginRegistry::instance().clearOcrBackends();
        return true;
    });
}

char* kreuzberg_list_ocr_backends(void) {
    return ffi::guarded<char*>(
        nullptr, [] { return ffi::toJsonArray(PluginRegistry::instance().listOcrBackends()); });
}

char* kreuzberg_get_ocr_languages(const char* backend) {
    return ffi::guarded<char*>(nullptr, [&]() -> char* {
        if (!backend) {
            ffi::recordError({ErrorCode::InvalidArgument, "backend name cannot be NULL"});
            return nullptr;
        }
        for (const auto& entry : PluginRegistry::instance().ocrBackendEntries()) {
            if (entry.name == backend)
                return ffi::toJsonArray(entry.languages);
        }
        ffi::recordError(
            {ErrorCode::NotFound, std::string("OCR backend not registered: ") + backend});
        return nullptr;
    });
}

int32_t kreuzberg_is_language_supported(const char* backend, const char* language) {
    return ffi::guarded<int32_t>(0, [&]() -> int32_t {
        if (!backend || !language)
            return 0;
        auto snapshot = PluginRegistry::instance().snapshot();
        auto plugin = snapshot->findOcrBackend(backend);
        return plugin && plugin->supportsLanguage(language) ? 1 : 0;
    });
}

char* kreuzberg_list_ocr_backends_with_languages(void) {
    return ffi::guarded<char*>(nullptr, [] {
        json out = json::object();
        for (const auto& entry : PluginRegistry::instance().ocrBackendEntries())
            out[entry.name] = entry.languages;
        return ffi::toCString(out.dump());
    });
}

// ============================================================================
// Post-processors
// ============================================================================

bool kreuzberg_register_post_processor(const char* name, KreuzbergPostProcessorCallback callback,
                                       int32_t priority) {
    return kreuzberg_register_post_processor_with_stage(name, callback, priority, nullptr);
}

bool kreuzberg_register_post_processor_with_stage(const char* name,
                                                  KreuzbergPostProcessorCallback callback,
                                                  int32_t priority, const char* stage) {
    return ffi::guarded<bool>(false, [&] {
        if (!checkRegistration(name, callback != nullptr))
            return false;
        auto parsedStage = plugins::ProcessingStage::Middle;
        if (stage) {
            auto s = plugins::parseProcessingStage(stage);
            if (!s) {
                ffi::recordError({ErrorCode::InvalidArgument,
                                  std::string("Invalid processing stage '") + stage +
                                      "', expected early, middle or late"});
                return false;
            }
            parsedStage = *s;
        }
        auto processor = std::make_shared<plugins::CallbackPostProcessor>(name, callback);
        return registered(PluginRegistry::instance().registerPostProcessor(std::move(processor),
                                                                           priority, parsedStage));
    });
}

bool kreuzberg_unregister_post_processor(const char* name) {
    return ffi::guarded<bool>(false, [&] {
        if (!name) {
            ffi::recordError({ErrorCode::InvalidArgument, "plugin name cannot be NULL"});
            return false;
        }
        PluginRegistry::instance().unregisterPostProcessor(name);
        return true;
    });
}

bool kreuzberg_clear_post_processors(void) {
    return ffi::guarded<bool>(false, [] {
        PluginRegistry::instance().clearPostProcessors();
        return true;
    });
}

char* kreuzberg_list_post_processors(void) {
    return ffi::guarded<char*>(
        nullptr, [] { return ffi::toJsonArray(PluginRegistry::instance().listPostProcessors()); });
}

// ============================================================================
// Validators
// ============================================================================

bool kreuzberg_register_validator(const char* name, KreuzbergValidatorCallback callback,
                                  int32_t priority) {
    return ffi::guarded<bool>(false, [&] {
        if (!checkRegistration(name, callback != nullptr))
            return false;
        auto validator = std::make_shared<plugins::CallbackValidator>(name, callback);
        return registered(
            PluginRegistry::instance().registerValidator(std::move(validator), priority));
    });
}

bool kreuzberg_unregister_validator(const char* name) {
    return ffi::guarded<bool>(false, [&] {
        if (!name) {
            ffi::recordError({ErrorCode::InvalidArgument, "plugin name cannot be NULL"});
            return false;
        }
        PluginRegistry::instance().unregisterValidator(name);
        return true;
    });
}

bool kreuzberg_clear_validators(void) {
    return ffi::guarded<bool>(false, [] {
        PluginRegistry::instance().clearValidators();
        return true;
    });
}

char* kreuzberg_list_validators(void) {
    return ffi::guarded<char*>(
        nullptr, [] { return ffi::toJsonArray(PluginRegistry::instance().listValidators()); });
}

// ============================================================================
// Document extractors
// ============================================================================

bool kreuzberg_register_document_extractor(const char* name,
                                           KreuzbergDocumentExtractorCallback callback,
                                           const char* mime_types, int32_t priority) {
    return ffi::guarded<bool>(false, [&] {
        if (!checkRegistration(name, callback != nullptr))
            return false;
        if (!mime_types) {
            ffi::recordError({ErrorCode::InvalidArgument, "mime_types cannot be NULL"});
            return false;
        }
        auto mimes = parseNameList(mime_types, "mime_types");
        if (!mimes) {
            ffi::recordError(mimes.error());
            return false;
        }
        auto extractor = std::make_shared<plugins::CallbackDocumentExtractor>(name, callback);
        return registered(PluginRegistry::instance().registerDocumentExtractor(
            std::move(extractor), std::move(mimes).value(), priority));
    });
}

bool kreuzberg_unregister_document_extractor(const char* name) {
    return ffi::guarded<bool>(false, [&] {
        if (!name) {
            ffi::recordError({ErrorCode::InvalidArgument, "plugin name cannot be NULL"});
            return false;
        }
        PluginRegistry::instance().unregisterDocumentExtractor(name);
        return true;
    });
}

bool kreuzberg_clear_document_extractors(void) {
    return ffi::guarded<bool>(false, [] {
        PluginRegistry::instance().clearDocumentExtractors();
        return true;
    });
}

char* kreuzberg_list_document_extractors(void) {
    return ffi::guarded<char*>(nullptr, [] {
        return ffi::toJsonArray(PluginRegistry::instance().listDocumentExtractors());
    });
}

} // extern "C"
