#ifndef K7_CRYPTO_ERROR_HPP
#define K7_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace k7::crypto {

enum class CryptoErrorCode {
    MissingPassword,
    MalformedEncoding,
    Truncated,
    DecryptFailed,
    CipherFailure
};

inline const char* to_string(CryptoErrorCode code) {
    switch (code) {
        case CryptoErrorCode::MissingPassword: return "Missing password";
        case CryptoErrorCode::MalformedEncoding: return "Malformed encoding";
        case CryptoErrorCode::Truncated: return "Truncated";
        case CryptoErrorCode::DecryptFailed: return "Decrypt failed";
        case CryptoErrorCode::CipherFailure: return "Cipher failure";
        default: return "Undefined error";
    }
}

class CryptoError : public std::runtime_error {
public:
    CryptoError(CryptoErrorCode code, const std::string& message)
        : std::runtime_error(std::string(to_string(code)) + ": " + message)
        , code_(code) {}

    CryptoErrorCode code() const { return code_; }

private:
    CryptoErrorCode code_;
};

} // namespace k7::crypto

#endif // K7_CRYPTO_ERROR_HPP
