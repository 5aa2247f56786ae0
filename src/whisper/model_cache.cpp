#include "whisper/model_cache.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <curl/curl.h>
#include <filesystem>
#include <fstream>
#include <print>

namespace fs = std::filesystem;

namespace {

// "ggml" as a little-endian uint32, the first word of every ggml model file.
constexpr uint32_t kGgmlMagic = 0x67676d6c;

size_t write_file_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    return std::fwrite(ptr, size, nmemb, static_cast<std::FILE*>(userdata)) * size;
}

int xferinfo_callback(void* userdata, curl_off_t dltotal, curl_off_t dlnow,
                      curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* progress = static_cast<const ModelCache::DownloadProgress*>(userdata);
    if (*progress && dltotal > 0) {
        (*progress)(static_cast<uint64_t>(dlnow), static_cast<uint64_t>(dltotal));
    }
    return 0;
}

} // namespace

ModelCache::ModelCache(std::string cache_dir, std::string base_url)
    : dir_(std::move(cache_dir)), base_url_(std::move(base_url)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

ModelCache::~ModelCache() {
    curl_global_cleanup();
}

std::string ModelCache::path_for(const ModelInfo& model) const {
    return (fs::path(dir_) / model.file_name).string();
}

bool ModelCache::is_cached(const ModelInfo& model) const {
    return has_ggml_magic(path_for(model));
}

bool ModelCache::has_ggml_magic(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return false;
    uint32_t magic = 0;
    f.read(reinterpret_cast<char*>(&magic), sizeof(magic));
    return f && magic == kGgmlMagic;
}

std::expected<std::string, std::string>
ModelCache::ensure(const ModelInfo& model, const DownloadProgress& progress) {
    auto path = path_for(model);
    std::error_code ec;

    if (fs::exists(path, ec)) {
        if (has_ggml_magic(path)) return path;
        std::println(stderr, "model-cache: {} is corrupt, downloading again", path);
        fs::remove(path, ec);
    }

    fs::create_directories(dir_, ec);
    if (ec) {
        return std::unexpected("cannot create model cache " + dir_ + ": " + ec.message());
    }

    auto url = base_url_ + "/" + std::string(model.file_name);
    auto part = path + ".part";
    auto res = download(url, part, progress);
    if (!res) {
        fs::remove(part, ec);
        return std::unexpected(res.error());
    }

    if (!has_ggml_magic(part)) {
        fs::remove(part, ec);
        return std::unexpected("downloaded file is not a ggml model: " + url);
    }

    fs::rename(part, path, ec);
    if (ec) {
        fs::remove(part, ec);
        return std::unexpected("cannot move model into cache: " + ec.message());
    }
    return path;
}

std::expected<void, std::string>
ModelCache::download(const std::string& url, const std::string& dest,
                     const DownloadProgress& progress) {
    std::FILE* out = std::fopen(dest.c_str(), "wb");
    if (!out) {
        return std::unexpected("cannot write " + dest + ": " + std::strerror(errno));
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::fclose(out);
        return std::unexpected("curl_easy_init failed");
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_file_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, out);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &progress);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);

    bool write_ok = std::fclose(out) == 0;

    if (res != CURLE_OK) {
        return std::unexpected(std::string("download of ") + url + " failed: " + curl_easy_strerror(res));
    }
    if (!write_ok) {
        return std::unexpected("error writing " + dest);
    }
    return {};
}
