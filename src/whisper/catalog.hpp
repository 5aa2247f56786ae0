#pragma once

#include <string_view>
#include <vector>

struct ModelInfo {
    std::string_view name;         // user-facing tag, e.g. "large-v3"
    std::string_view file_name;    // ggml weights file in the model cache
    std::string_view params;
    std::string_view description;
    double realtime_factor;        // processing seconds per audio second on CPU
};

struct LanguageInfo {
    std::string_view code;
    std::string_view name;
};

const std::vector<ModelInfo>& model_catalog();
const std::vector<LanguageInfo>& language_catalog();

// nullptr for unknown names.
const ModelInfo* find_model(std::string_view name);
const LanguageInfo* find_language(std::string_view code);
