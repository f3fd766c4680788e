#include "Errors.hpp"

namespace nhilabel {

const char* categoryName(ErrorCategory c){
    switch (c){
    case ErrorCategory::ConfigurationAbsent: return "ConfigurationAbsent";
    case ErrorCategory::BindingUnsupported:  return "BindingUnsupported";
    case ErrorCategory::BindingFailed:       return "BindingFailed";
    case ErrorCategory::DeviceCallFailed:    return "DeviceCallFailed";
    case ErrorCategory::DecodeFailed:        return "DecodeFailed";
    case ErrorCategory::ValidationFailed:    return "ValidationFailed";
    case ErrorCategory::Busy:                return "Busy";
    case ErrorCategory::OfflinePlaceholder:  return "OfflinePlaceholder";
    }
    return "Unknown";
}

bool isRetryable(ErrorCategory c){
    switch (c){
    case ErrorCategory::DeviceCallFailed:
    case ErrorCategory::DecodeFailed:
    case ErrorCategory::ValidationFailed:
    case ErrorCategory::Busy:
        return true;
    default:
        return false;
    }
}

QString remediationText(ErrorCategory c, const QStringList& paths){
    QStringList steps;
    switch (c){
    case ErrorCategory::ConfigurationAbsent:
        steps << "Install the NHI card reader control software"
              << "Set [CardReader] dll_path in config.ini or the NHI_CARD_DLL_PATH variable"
              << "Make sure the program may read the library file";
        break;
    case ErrorCategory::BindingUnsupported:
        steps << "This driver is a COM/.NET component and needs Windows automation (COM) support"
              << "Point dll_path at the flat CsHis library instead, or run on a host with COM registered";
        break;
    case ErrorCategory::BindingFailed:
        steps << "Check that the library matches this program's architecture (32/64 bit)"
              << "Check that its dependency files sit next to it"
              << "Reinstall the reader control software";
        break;
    case ErrorCategory::DeviceCallFailed:
        steps << "Check that the reader is connected and powered"
              << "Check that the card is inserted the right way up"
              << "Check the reader port setting (auto-detect or set it manually)"
              << "Retry the read";
        break;
    case ErrorCategory::DecodeFailed:
    case ErrorCategory::ValidationFailed:
        steps << "Re-seat the card and read again"
              << "If it keeps failing, use manual entry";
        break;
    case ErrorCategory::Busy:
        steps << "Wait for the current read to finish";
        break;
    case ErrorCategory::OfflinePlaceholder:
        steps << "Enter the patient data manually";
        break;
    }
    QString out;
    for (int i=0;i<steps.size();++i) out += QString("%1. %2\n").arg(i+1).arg(steps[i]);
    if (!paths.isEmpty()){
        out += "\nPaths checked:\n";
        for (const auto& p : paths) out += "  " + p + "\n";
    }
    return out.trimmed();
}

QString AcquisitionFailure::shortText(int maxLen) const {
    QString first = message.section('\n', 0, 0);
    if (first.size() <= maxLen) return first;
    return first.left(maxLen - 3) + "...";
}

QString AcquisitionFailure::fullText() const {
    if (remediation.isEmpty()) return message;
    return message + "\n\n" + remediation;
}

NativeLibraryError::NativeLibraryError(ErrorCategory c, const QString& path, const QString& osError,
                                       const QStringList& checked)
    : NhiError(c, QString("Cannot bind card reader library %1: %2").arg(path, osError)),
      path_(path), osError_(osError), checked_(checked) {}

} // namespace nhilabel
