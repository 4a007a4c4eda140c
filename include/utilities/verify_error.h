#pragma once
#ifndef CTVERIFY_VERIFY_ERROR_H
#define CTVERIFY_VERIFY_ERROR_H

#include <stdexcept>
#include <string>

namespace ctverify {

/**
 * @brief Failure categories reported by the verification client.
 *
 * SignatureInvalid and ProofInvalid indicate log misbehaviour. Transport
 * indicates an operational failure the caller may retry.
 */
enum class ErrorKind {
    LogConfig,
    Transport,
    Encoding,
    SignatureInvalid,
    ProofInvalid
};

std::string errorKindToString(ErrorKind kind);

/**
 * @brief Exception carrying an ErrorKind plus the log and operation it
 * happened in.
 */
class VerifyError : public std::runtime_error {
public:
    VerifyError(ErrorKind kind, const std::string &logDescription,
                const std::string &context, const std::string &cause = "");

    ErrorKind kind() const noexcept { return kind_; }
    const std::string &logDescription() const noexcept { return log_; }
    const std::string &context() const noexcept { return context_; }
    const std::string &cause() const noexcept { return cause_; }

    /** Copy of this error with a different log description attached. */
    VerifyError withLog(const std::string &logDescription) const;

    /** True for kinds that signal a misbehaving or malicious log. */
    bool isLogMisbehaviour() const noexcept {
        return kind_ == ErrorKind::SignatureInvalid ||
               kind_ == ErrorKind::ProofInvalid;
    }

private:
    static std::string format(ErrorKind kind, const std::string &log,
                              const std::string &context,
                              const std::string &cause);

    ErrorKind kind_;
    std::string log_;
    std::string context_;
    std::string cause_;
};

} // namespace ctverify

#endif // CTVERIFY_VERIFY_ERROR_H
