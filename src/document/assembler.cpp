#include "document/assembler.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\n\r") == std::string::npos;
}

std::string errno_message(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

} // namespace

std::expected<void, std::string> write_file_atomic(const fs::path& path,
                                                   std::span<const uint8_t> data) {
    fs::path dir = path.parent_path();
    if (dir.empty()) dir = ".";

    auto tmpl_str = (dir / ("." + path.filename().string() + ".XXXXXX")).string();
    std::vector<char> tmpl(tmpl_str.begin(), tmpl_str.end());
    tmpl.push_back('\0');

    int fd = ::mkstemp(tmpl.data());
    if (fd < 0) {
        return std::unexpected(errno_message(("cannot create temporary file in " + dir.string()).c_str()));
    }
    std::string tmp_path(tmpl.data());

    auto fail = [&](std::string msg) -> std::expected<void, std::string> {
        if (fd >= 0) ::close(fd);
        ::unlink(tmp_path.c_str());
        return std::unexpected(std::move(msg));
    };

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return fail(errno_message("write() failed"));
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) < 0) return fail(errno_message("fsync() failed"));
    // mkstemp creates 0600.
    if (::fchmod(fd, 0644) < 0) return fail(errno_message("fchmod() failed"));

    int rc = ::close(fd);
    fd = -1;
    if (rc < 0) return fail(errno_message("close() failed"));

    if (::rename(tmp_path.c_str(), path.c_str()) < 0) {
        return fail(errno_message(("cannot rename to " + path.string()).c_str()));
    }
    return {};
}

fs::path DocumentAssembler::output_path(const fs::path& output_dir,
                                        const std::string& base_name) const {
    std::string stem = fs::path(base_name).stem().string();
    if (stem.empty()) stem = "transcript";
    return output_dir / (stem + "." + std::string(writer_.extension()));
}

std::expected<OutputDocument, PipelineError>
DocumentAssembler::assemble(const std::vector<TranscriptSegment>& segments,
                            const fs::path& output_dir, const std::string& base_name,
                            const DocumentMetadata& meta) {
    std::vector<TranscriptSegment> rendered;
    rendered.reserve(segments.size());
    for (const auto& seg : segments) {
        if (!is_blank(seg.text)) rendered.push_back(seg);
    }

    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        return std::unexpected(PipelineError{
            ErrorKind::WriteFailed,
            "cannot create output directory " + output_dir.string() + ": " + ec.message()});
    }

    auto bytes = writer_.render(rendered, meta);
    if (!bytes) {
        return std::unexpected(PipelineError{ErrorKind::WriteFailed, bytes.error()});
    }

    auto path = output_path(output_dir, base_name);
    if (auto res = write_file_atomic(path, *bytes); !res) {
        return std::unexpected(PipelineError{ErrorKind::WriteFailed, res.error()});
    }

    return OutputDocument{.path = path.string(), .segments = std::move(rendered)};
}
