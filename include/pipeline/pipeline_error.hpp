#ifndef K7_PIPELINE_ERROR_HPP
#define K7_PIPELINE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace k7 {
namespace pipeline {

enum class PipelineErrorCode {
    EmptyArchive,
    ArchiveTooLarge,
    InvalidFileType
};

inline const char* to_string(PipelineErrorCode code) {
    switch (code) {
        case PipelineErrorCode::EmptyArchive: return "Empty archive";
        case PipelineErrorCode::ArchiveTooLarge: return "Archive too large";
        case PipelineErrorCode::InvalidFileType: return "Invalid file type";
        default: return "Undefined error";
    }
}

class PipelineError : public std::runtime_error {
public:
    PipelineError(PipelineErrorCode code, const std::string& message)
        : std::runtime_error(std::string(to_string(code)) + ": " + message)
        , code_(code) {}

    PipelineErrorCode code() const { return code_; }

private:
    PipelineErrorCode code_;
};

} // namespace pipeline
} // namespace k7

#endif // K7_PIPELINE_ERROR_HPP
