#include "utilities/verify_error.h"

namespace ctverify {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::LogConfig:
        return "LogConfigError";
    case ErrorKind::Transport:
        return "TransportError";
    case ErrorKind::Encoding:
        return "EncodingError";
    case ErrorKind::SignatureInvalid:
        return "SignatureInvalid";
    case ErrorKind::ProofInvalid:
        return "ProofInvalid";
    }
    return "Unknown";
}

VerifyError::VerifyError(ErrorKind kind, const std::string &logDescription,
                         const std::string &context, const std::string &cause)
    : std::runtime_error(format(kind, logDescription, context, cause)),
      kind_(kind), log_(logDescription), context_(context), cause_(cause) {}

VerifyError VerifyError::withLog(const std::string &logDescription) const {
    return VerifyError(kind_, logDescription, context_, cause_);
}

std::string VerifyError::format(ErrorKind kind, const std::string &log,
                                const std::string &context,
                                const std::string &cause) {
    std::string msg = errorKindToString(kind) + ": " + context;
    if (!log.empty())
        msg += " (log \"" + log + "\")";
    if (!cause.empty())
        msg += ": " + cause;
    return msg;
}

} // namespace ctverify
