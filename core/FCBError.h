#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace FCBForge {

/**
 * @brief Failure categories reported by the codec and the level services
 *
 * Unknown type tags and dangling references are not errors: the former are
 * preserved opaquely, the latter are reported as warnings.
 */
enum class ErrorKind {
    TruncatedInput,   // input ends before what a header or scalar declares
    MalformedHeader,  // internally inconsistent counts, lengths or magic
    EncodingError,    // string/boolean bytes disagree with their declaration
    MarkupError,      // markup that cannot be mapped back to a node tree
    IOFailure,        // file could not be read or written
    IDCollision       // resolver invariant violated, internal fault
};

const char* errorKindName(ErrorKind kind);

class FCBError : public std::runtime_error {
public:
    static constexpr size_t kNoOffset = static_cast<size_t>(-1);

    FCBError(ErrorKind kind, const std::string& message, size_t offset = kNoOffset);

    ErrorKind kind() const { return kind_; }
    size_t offset() const { return offset_; }
    bool hasOffset() const { return offset_ != kNoOffset; }
    const std::string& detail() const { return detail_; }

private:
    ErrorKind kind_;
    size_t offset_;
    std::string detail_;
};

} // namespace FCBForge
