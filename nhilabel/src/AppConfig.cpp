#include "AppConfig.hpp"
#include "Logging.hpp"
#include <QFileInfo>
#include <QSettings>

namespace nhilabel {

QString defaultControlProgramPath(){
#if defined(Q_OS_WIN)
    return "C:\\NHI\\BIN\\csfsim.exe";
#else
    return "/opt/nhi/bin/csfsim";
#endif
}

PrintMode parsePrintMode(const QString& s){
    const QString m = s.trimmed().toLower();
    if (m=="text" || m=="txt") return PrintMode::Text;
    if (m=="zpl") return PrintMode::Zpl;
    return PrintMode::Pdf;
}

AppConfig AppConfig::load(const QString& iniPath){
    AppConfig c;
    c.sourceFile = iniPath;
    c.reader.controlProgramPath = defaultControlProgramPath();
    if (!QFileInfo::exists(iniPath)){
        qCInfo(lcApp) << "No configuration at" << iniPath << "- using defaults";
        return c;
    }

    QSettings s(iniPath, QSettings::IniFormat);
    s.setIniCodec("UTF-8");

    s.beginGroup("CardReader");
    c.reader.dllPath = s.value("dll_path").toString().trimmed();
    c.reader.standalone = s.value("standalone_mode", false).toBool();
    c.reader.controlProgramPath = s.value("csfsim_path", c.reader.controlProgramPath).toString();
    c.reader.autoDetectPort = s.value("auto_detect_com_port", false).toBool();
    c.reader.comPort = s.value("com_port", 3).toInt();
    c.reader.textEncoding = s.value("text_encoding", "Big5").toString();
    s.endGroup();

    s.beginGroup("BasicData");
    auto& b = c.reader.basicData;
    b.bufferSize   = s.value("buffer_size", b.bufferSize).toInt();
    b.serialLength = s.value("serial_length", b.serialLength).toInt();
    b.idOffset     = s.value("id_offset", b.idOffset).toInt();
    b.idLength     = s.value("id_length", b.idLength).toInt();
    b.preSettleMs  = s.value("pre_settle_ms", b.preSettleMs).toInt();
    b.postSettleMs = s.value("post_settle_ms", b.postSettleMs).toInt();
    s.endGroup();
    if (b.bufferSize < b.idOffset + b.idLength){
        qCWarning(lcApp) << "BasicData buffer_size" << b.bufferSize << "cannot hold the ID field, using 72";
        b.bufferSize = 72;
    }

    s.beginGroup("VendorErrors");
    for (const auto& key : s.childKeys()){
        bool ok=false;
        int code = key.toInt(&ok);
        if (ok) c.reader.vendorErrors.insert(code, s.value(key).toString());
        else qCWarning(lcApp) << "Ignoring non-numeric vendor error key" << key;
    }
    s.endGroup();

    s.beginGroup("Label");
    c.label.widthMm  = s.value("width_mm", c.label.widthMm).toDouble();
    c.label.heightMm = s.value("height_mm", c.label.heightMm).toDouble();
    c.label.barcode  = s.value("barcode", c.label.barcode).toBool();
    s.endGroup();

    s.beginGroup("Printer");
    c.label.printMode = parsePrintMode(s.value("print_mode", "pdf").toString());
    c.label.printerName = s.value("printer_name").toString();
    c.label.showPrintDialog = s.value("show_print_dialog", true).toBool();
    s.endGroup();

    c.recordDir = s.value("Records/directory", c.recordDir).toString();
    c.logFile = s.value("Logging/file", c.logFile).toString();

    qCInfo(lcApp) << "Configuration loaded from" << iniPath;
    return c;
}

void AppConfig::saveComPort(int port) const {
    if (sourceFile.isEmpty()) return;
    QSettings s(sourceFile, QSettings::IniFormat);
    s.setIniCodec("UTF-8");
    s.setValue("CardReader/com_port", port);
    s.sync();
    if (s.status()!=QSettings::NoError)
        qCWarning(lcApp) << "Could not save com_port to" << sourceFile;
}

} // namespace nhilabel
