#include "core/types.hpp"

namespace imgii {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::FILE_NOT_FOUND: return "file not found";
        case ErrorCode::INVALID_FORMAT: return "invalid format";
        case ErrorCode::MEMORY_ERROR: return "memory error";
        case ErrorCode::PROCESSING_ERROR: return "processing error";
        case ErrorCode::FONT_ERROR: return "font error";
        case ErrorCode::INVALID_ARGUMENT: return "invalid argument";
        case ErrorCode::PARSE_VALUE: return "value parse error";
        case ErrorCode::PATTERN: return "pattern error";
        case ErrorCode::WIDTH_MISMATCH: return "width mismatch";
        case ErrorCode::EMPTY_INPUT: return "empty input";
        case ErrorCode::RENDER_ERROR: return "render error";
        case ErrorCode::CODEC_ERROR: return "codec error";
    }
    return "unknown error";
}

std::string Result::describe() const {
    std::string out = message.empty() ? std::string(error_code_name(error)) : message;
    for (const Result* inner = cause.get(); inner; inner = inner->cause.get()) {
        out += ": ";
        out += inner->message.empty() ? std::string(error_code_name(inner->error)) : inner->message;
    }
    return out;
}

}
