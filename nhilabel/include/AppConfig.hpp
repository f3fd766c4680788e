#pragma once
#include <QMap>
#include <QString>

namespace nhilabel {

// Vendor contract of the basic-data call. The reference values are defaults only;
// installations have shipped incompatible layouts.
struct BasicDataLayout {
    int bufferSize = 72;
    int serialLength = 12;
    int idOffset = 32;
    int idLength = 10;
    int preSettleMs = 400;
    int postSettleMs = 600;
};

struct ReaderOptions {
    QString dllPath;
    bool standalone = false;
    QString controlProgramPath;
    bool autoDetectPort = false;
    int comPort = 3;
    QString textEncoding = "Big5";
    BasicDataLayout basicData;
    QMap<int, QString> vendorErrors;   // additions/overrides of the built-in table
};

enum class PrintMode { Pdf, Text, Zpl };

struct LabelOptions {
    double widthMm = 50.0;
    double heightMm = 35.0;
    bool barcode = true;
    PrintMode printMode = PrintMode::Pdf;
    QString printerName;
    bool showPrintDialog = true;
};

struct AppConfig {
    ReaderOptions reader;
    LabelOptions label;
    QString recordDir = "records";
    QString logFile = "logs/app_log.log";
    QString sourceFile;

    // Missing file or keys fall back to defaults.
    static AppConfig load(const QString& iniPath);
    void saveComPort(int port) const;
};

QString defaultControlProgramPath();
PrintMode parsePrintMode(const QString& s);

} // namespace nhilabel
