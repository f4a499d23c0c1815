#include "errors.h"

namespace voxgate {

const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::MissingKey: return "MissingKey";
        case ErrorType::KeyMismatch: return "KeyMismatch";
        case ErrorType::GuardrailRejected: return "GuardrailRejected";
        case ErrorType::VerificationRejected: return "VerificationRejected";
        case ErrorType::Timeout: return "Timeout";
        case ErrorType::ExtractionError: return "ExtractionError";
        case ErrorType::Unverified: return "Unverified";
        case ErrorType::InvalidArgs: return "InvalidArgs";
        case ErrorType::NotEnrolled: return "NotEnrolled";
        case ErrorType::UnknownTool: return "UnknownTool";
        case ErrorType::NotConfirmed: return "NotConfirmed";
        case ErrorType::LowConfidence: return "LowConfidence";
        case ErrorType::ConfigError: return "ConfigError";
        case ErrorType::IOError: return "IOError";
        case ErrorType::NetworkError: return "NetworkError";
        case ErrorType::ParseError: return "ParseError";
        case ErrorType::InvalidState: return "InvalidState";
        case ErrorType::Unknown: return "Unknown";
    }
    return "Unknown";
}

} // namespace voxgate
