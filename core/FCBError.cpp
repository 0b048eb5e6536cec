#include "FCBError.h"

#include <format>

namespace FCBForge {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TruncatedInput: return "TruncatedInput";
        case ErrorKind::MalformedHeader: return "MalformedHeader";
        case ErrorKind::EncodingError: return "EncodingError";
        case ErrorKind::MarkupError: return "MarkupError";
        case ErrorKind::IOFailure: return "IOFailure";
        case ErrorKind::IDCollision: return "IDCollision";
    }
    return "Unknown";
}

static std::string describe(ErrorKind kind, const std::string& message, size_t offset) {
    if (offset == FCBError::kNoOffset) {
        return std::format("{}: {}", errorKindName(kind), message);
    }
    return std::format("{} at offset 0x{:X}: {}", errorKindName(kind), offset, message);
}

FCBError::FCBError(ErrorKind kind, const std::string& message, size_t offset)
    : std::runtime_error(describe(kind, message, offset)), kind_(kind), offset_(offset), detail_(message) {}

} // namespace FCBForge
