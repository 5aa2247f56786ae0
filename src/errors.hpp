#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    UnsupportedFormat,
    ExtractionFailed,
    ModelLoadFailed,
    InferenceFailed,
    WriteFailed,
    Cancelled,
};

struct PipelineError {
    ErrorKind kind;
    std::string message;
};

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorKind::ExtractionFailed: return "ExtractionFailed";
        case ErrorKind::ModelLoadFailed: return "ModelLoadFailed";
        case ErrorKind::InferenceFailed: return "InferenceFailed";
        case ErrorKind::WriteFailed: return "WriteFailed";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}
