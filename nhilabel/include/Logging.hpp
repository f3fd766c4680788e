#pragma once
#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcBinder)
Q_DECLARE_LOGGING_CATEGORY(lcStrategy)
Q_DECLARE_LOGGING_CATEGORY(lcDecoder)
Q_DECLARE_LOGGING_CATEGORY(lcAcquisition)
Q_DECLARE_LOGGING_CATEGORY(lcRecords)
Q_DECLARE_LOGGING_CATEGORY(lcLabel)
Q_DECLARE_LOGGING_CATEGORY(lcSerial)
Q_DECLARE_LOGGING_CATEGORY(lcApp)

namespace nhilabel {

// Appends every Qt log message to `path` (directories created on demand) and mirrors it to stderr.
// Returns false if the file cannot be opened; stderr logging stays active in that case.
bool installFileLog(const QString& path);

} // namespace nhilabel
