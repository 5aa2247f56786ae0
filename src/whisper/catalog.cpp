#include "whisper/catalog.hpp"

#include <algorithm>

const std::vector<ModelInfo>& model_catalog() {
    static const std::vector<ModelInfo> models = {
        {"tiny",     "ggml-tiny.bin",     "39M",   "fastest, basic quality",       0.6},
        {"base",     "ggml-base.bin",     "74M",   "fast, reasonable quality",     1.0},
        {"small",    "ggml-small.bin",    "244M",  "good quality",                 1.6},
        {"medium",   "ggml-medium.bin",   "769M",  "very good (recommended)",      3.0},
        {"large",    "ggml-large-v2.bin", "1550M", "best quality, slow",           5.0},
        {"large-v3", "ggml-large-v3.bin", "1550M", "newest, best for Dutch",       5.0},
    };
    return models;
}

const std::vector<LanguageInfo>& language_catalog() {
    static const std::vector<LanguageInfo> languages = {
        {"nl", "Nederlands"},
        {"en", "English"},
        {"fr", "Francais"},
        {"de", "Deutsch"},
        {"es", "Espanol"},
        {"it", "Italiano"},
        {"pt", "Portugues"},
        {"ja", "Japanese"},
        {"zh", "Chinese"},
        {"ko", "Korean"},
    };
    return languages;
}

const ModelInfo* find_model(std::string_view name) {
    const auto& models = model_catalog();
    auto it = std::find_if(models.begin(), models.end(),
                           [name](const ModelInfo& m) { return m.name == name; });
    return it != models.end() ? &*it : nullptr;
}

const LanguageInfo* find_language(std::string_view code) {
    const auto& languages = language_catalog();
    auto it = std::find_if(languages.begin(), languages.end(),
                           [code](const LanguageInfo& l) { return l.code == code; });
    return it != languages.end() ? &*it : nullptr;
}
