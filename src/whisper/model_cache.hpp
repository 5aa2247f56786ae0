#pragma once

#include "whisper/catalog.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <string>

// On-disk cache of ggml model weights, keyed by model name. A model is
// downloaded the first time it is needed and reused afterwards.
class ModelCache {
public:
    using DownloadProgress = std::function<void(uint64_t received, uint64_t total)>;

    ModelCache(std::string cache_dir, std::string base_url);
    ~ModelCache();

    ModelCache(const ModelCache&) = delete;
    ModelCache& operator=(const ModelCache&) = delete;

    const std::string& dir() const { return dir_; }
    std::string path_for(const ModelInfo& model) const;
    bool is_cached(const ModelInfo& model) const;

    // Returns the local weights path, downloading (or replacing a corrupt
    // cached copy) as needed.
    std::expected<std::string, std::string> ensure(const ModelInfo& model,
                                                   const DownloadProgress& progress = {});

    static bool has_ggml_magic(const std::string& path);

private:
    std::expected<void, std::string> download(const std::string& url, const std::string& dest,
                                              const DownloadProgress& progress);

    std::string dir_;
    std::string base_url_;
};
