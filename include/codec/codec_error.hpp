#ifndef K7_CODEC_ERROR_HPP
#define K7_CODEC_ERROR_HPP

#include <stdexcept>
#include <string>

namespace k7 {
namespace codec {

enum class CodecErrorCode {
    SerializeFailed,
    CompressFailed,
    EncryptFailed,
    DecompressFailed,
    ParseFailed
};

inline const char* to_string(CodecErrorCode code) {
    switch (code) {
        case CodecErrorCode::SerializeFailed: return "Serialize failed";
        case CodecErrorCode::CompressFailed: return "Compress failed";
        case CodecErrorCode::EncryptFailed: return "Encrypt failed";
        case CodecErrorCode::DecompressFailed: return "Decompress failed";
        case CodecErrorCode::ParseFailed: return "Parse failed";
        default: return "Undefined error";
    }
}

class CodecError : public std::runtime_error {
public:
    CodecError(CodecErrorCode code, const std::string& message)
        : std::runtime_error(std::string(to_string(code)) + ": " + message)
        , code_(code) {}

    CodecErrorCode code() const { return code_; }

private:
    CodecErrorCode code_;
};

} // namespace codec
} // namespace k7

#endif // K7_CODEC_ERROR_HPP
