#pragma once
#include <QString>
#include <QStringList>
#include <stdexcept>

namespace nhilabel {

enum class ErrorCategory {
    ConfigurationAbsent,
    BindingUnsupported,
    BindingFailed,
    DeviceCallFailed,
    DecodeFailed,
    ValidationFailed,
    Busy,
    OfflinePlaceholder
};

const char* categoryName(ErrorCategory c);
bool isRetryable(ErrorCategory c);

// Ordered checklist shown to the operator. `paths` is listed for ConfigurationAbsent.
QString remediationText(ErrorCategory c, const QStringList& paths = {});

struct AcquisitionFailure {
    ErrorCategory category = ErrorCategory::DeviceCallFailed;
    QString message;
    QString remediation;
    QString context;   // strategy / path / raw code, for the log

    QString shortText(int maxLen = 80) const;
    QString fullText() const;
};

class NhiError : public std::runtime_error {
public:
    NhiError(ErrorCategory c, const QString& msg)
        : std::runtime_error(msg.toStdString()), category_(c) {}
    ErrorCategory category() const { return category_; }
    QString message() const { return QString::fromStdString(what()); }
private:
    ErrorCategory category_;
};

// Loading or resolving the vendor library failed.
class NativeLibraryError : public NhiError {
public:
    NativeLibraryError(ErrorCategory c, const QString& path, const QString& osError,
                       const QStringList& checked = {});
    const QString& path() const { return path_; }
    const QString& osError() const { return osError_; }
    const QStringList& checkedPaths() const { return checked_; }
private:
    QString path_;
    QString osError_;
    QStringList checked_;
};

class AcquisitionError : public NhiError {
public:
    AcquisitionError(ErrorCategory c, const QString& msg, int code = 0)
        : NhiError(c, msg), code_(code) {}
    int code() const { return code_; }
private:
    int code_;
};

class DecodeError : public NhiError {
public:
    explicit DecodeError(const QString& msg) : NhiError(ErrorCategory::DecodeFailed, msg) {}
};

class ValidationError : public NhiError {
public:
    explicit ValidationError(const QString& msg) : NhiError(ErrorCategory::ValidationFailed, msg) {}
};

} // namespace nhilabel
