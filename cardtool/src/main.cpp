#include <QGuiApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <iostream>
#include <mutex>
#include "AcquisitionOrchestrator.hpp"
#include "AppConfig.hpp"
#include "LabelRenderer.hpp"
#include "Logging.hpp"
#include "RecordLog.hpp"

using namespace nhilabel;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitOffline = 3;

struct UsageError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

std::string out(const QString& s){ return s.toStdString(); }

QByteArray parseHex(const QString& hex){
    QString cleaned = hex;
    cleaned.remove(' ').remove(':');
    if (cleaned.isEmpty()) throw UsageError("Empty hex string");
    if (cleaned.size() % 2 != 0) throw UsageError("Hex string has an odd length");
    QByteArray bytes; bytes.reserve(cleaned.size()/2);
    for (int i=0; i<cleaned.size(); i+=2){
        bool ok=false;
        const uint v = cleaned.mid(i,2).toUInt(&ok,16);
        if (!ok) throw UsageError("Invalid hex string");
        bytes.append(char(v));
    }
    return bytes;
}

void printRecord(const PatientRecord& r){
    std::cout << "ID number  : " << out(r.idNumber()) << "\n"
              << "Name       : " << out(r.fullName()) << "\n"
              << "Birth date : " << out(r.birthDate()) << "\n"
              << "Sex        : " << out(sexLabel(r.sex())) << "\n"
              << "Card number: " << out(r.cardNumber()) << "\n";
    if (!r.source().isEmpty()) std::cout << "Source     : " << out(r.source()) << "\n";
}

int reportFailure(const AcquisitionFailure& f){
    std::cerr << "Error [" << categoryName(f.category) << "]: " << out(f.message) << "\n";
    if (!f.remediation.isEmpty()) std::cerr << "\n" << out(f.remediation) << "\n";
    return f.category==ErrorCategory::OfflinePlaceholder ? kExitOffline : kExitFailure;
}

int cmdInfo(const AppConfig& cfg, const CandidateSources& sources, const QString& lib){
    std::cout << "Configuration: " << out(cfg.sourceFile) << (QFileInfo::exists(cfg.sourceFile) ? "" : " (defaults)") << "\n"
              << "Standalone   : " << (cfg.reader.standalone ? "yes" : "no") << "\n"
              << "COM port     : " << cfg.reader.comPort << "\n"
              << "Encoding     : " << out(cfg.reader.textEncoding) << "\n"
              << "Automation   : " << (automationSupported() ? "available" : "not available on this host") << "\n";
    if (cfg.reader.standalone) return kExitOk;

    NativeLibraryBinder binder(cfg.reader, sources);
    const ResolvedPath rp = binder.resolvePath(lib);
    std::cout << "Library      : " << out(rp.path) << (rp.exists ? "" : " (not found)") << "\n"
              << "Checked      :\n";
    for (const auto& p : rp.checked) std::cout << "  " << out(p) << "\n";

    try {
        auto bound = binder.bind(lib);
        std::cout << "Bound        : " << out(bound->describe()) << "\n";
        return kExitOk;
    } catch (const NativeLibraryError& ex) {
        std::cerr << "Binding failed [" << categoryName(ex.category()) << "]: " << ex.what() << "\n\n"
                  << out(remediationText(ex.category(), ex.checkedPaths())) << "\n";
        return kExitFailure;
    }
}

int cmdRead(const AppConfig& cfg, const CandidateSources& sources, const QString& lib, bool recordIt){
    std::mutex deviceLock;
    AcquisitionOrchestrator orch(makeBackendFactory(cfg.reader, sources),
                                 CardDataDecoder(cfg.reader.textEncoding, cfg.reader.basicData),
                                 deviceLock, lib);
    const AcquisitionResult r = orch.acquire();
    if (!r.ok()) return reportFailure(r.failure());
    printRecord(r.record());
    if (recordIt){
        RecordLog log(cfg.recordDir);
        log.logOperation(toLabelFields(r.record()), QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss"), 0, "read");
    }
    return kExitOk;
}

int cmdDecode(const AppConfig& cfg, const QString& hex, const QString& format){
    BlobFormat fmt;
    if (format=="basic") fmt = BlobFormat::BasicData;
    else if (format=="text") fmt = BlobFormat::Text;
    else throw UsageError(out("Unknown format: " + format));

    const CardDataDecoder decoder(cfg.reader.textEncoding, cfg.reader.basicData);
    const QByteArray blob = parseHex(hex);
    try {
        const CardFields f = decoder.decode(blob, fmt);
        printRecord(PatientRecord::fromFields(f, blob, "decode"));
        return kExitOk;
    } catch (const NhiError& ex) {
        AcquisitionFailure f;
        f.category = ex.category();
        f.message = ex.message();
        f.remediation = remediationText(ex.category());
        return reportFailure(f);
    }
}

int cmdLabel(const AppConfig& cfg, const QString& file, const LabelFields& f){
    if (f.id.isEmpty() || f.name.isEmpty()) throw UsageError("label needs --id and --name");
    const LabelRenderer renderer(cfg.label);
    const QDateTime now = QDateTime::currentDateTime();
    const QString suffix = QFileInfo(file).suffix().toLower();
    if (suffix=="pdf"){
        renderer.renderPdf(f, now, file);
    } else {
        const QByteArray data = suffix=="zpl" ? renderer.renderZpl(f, now) : renderer.renderText(f, now).toUtf8();
        QFile fh(file);
        if (!fh.open(QIODevice::WriteOnly | QIODevice::Truncate))
            throw LabelError(out("Cannot write " + file + ": " + fh.errorString()));
        if (fh.write(data) != data.size())
            throw LabelError(out("Short write to " + file));
    }
    std::cout << "Label written to " << out(file) << "\n";
    return kExitOk;
}

int cmdStats(const AppConfig& cfg, const QString& day){
    QDate d = QDate::currentDate();
    if (!day.isEmpty()){
        d = QDate::fromString(day, "yyyyMMdd");
        if (!d.isValid()) throw UsageError(out("Invalid date: " + day + " (expected YYYYMMDD)"));
    }
    const RecordLog log(cfg.recordDir);
    const RecordStats s = log.statistics(d);
    std::cout << "Date            : " << out(d.toString("yyyy-MM-dd")) << "\n"
              << "Card reads      : " << s.reads << "\n"
              << "Print jobs      : " << s.prints << "\n"
              << "Labels printed  : " << s.labels << "\n"
              << "Total operations: " << s.total << "\n";
    return kExitOk;
}

int cmdBackup(const AppConfig& cfg, const QString& dir){
    const RecordLog log(cfg.recordDir);
    const int n = log.backup(dir);
    std::cout << "Backed up " << n << " record file(s) to " << out(dir) << "\n";
    return kExitOk;
}

}

int main(int argc, char *argv[])
{
    // Rendering PDF labels needs fonts; no window is ever shown, so no display is needed.
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) qputenv("QT_QPA_PLATFORM", "offscreen");
    QGuiApplication app(argc, argv);
    QCoreApplication::setApplicationName("cardtool");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser p;
    p.setApplicationDescription(
        "NHI card reader command line tool.\n"
        "Commands:\n"
        "  info                 show configuration and the bound card reader library\n"
        "  read                 read the inserted card\n"
        "  decode <hex>         decode a raw card data dump\n"
        "  label <file>         render a label (.pdf, .zpl or text) from --id/--name/...\n"
        "  stats                show the day's record statistics\n"
        "  backup <dir>         copy every record file into <dir>\n"
        );
    p.addHelpOption();
    p.addVersionOption();

    QCommandLineOption cfgOpt("config", "Configuration file (default: config.ini next to the program)", "FILE");
    QCommandLineOption libOpt("lib", "Card reader library, overrides every other source", "PATH");
    QCommandLineOption offlineOpt("offline", "Do not touch the reader; reads end in manual entry");
    QCommandLineOption portOpt("port", "Reader COM port number", "N");
    QCommandLineOption formatOpt("format", "decode: blob format, basic|text (default basic)", "FMT", "basic");
    QCommandLineOption recordOpt("record", "read: append the read to the record log");
    QCommandLineOption dateOpt("date", "stats: day as YYYYMMDD (default today)", "DATE");
    QCommandLineOption idOpt("id", "label: ID number", "ID");
    QCommandLineOption nameOpt("name", "label: patient name", "NAME");
    QCommandLineOption dobOpt("dob", "label: birth date", "DATE");
    QCommandLineOption sexOpt("sex", "label: sex (M/F)", "SEX");
    QCommandLineOption noteOpt("note", "label: note", "TEXT");
    QCommandLineOption verboseOpt("verbose", "Show debug logging");
    p.addOptions({cfgOpt, libOpt, offlineOpt, portOpt, formatOpt, recordOpt, dateOpt,
                  idOpt, nameOpt, dobOpt, sexOpt, noteOpt, verboseOpt});

    p.addPositionalArgument("command", "Command (see above)");
    p.addPositionalArgument("args", "Command arguments", "[args]");
    p.process(app);
    const auto pos = p.positionalArguments();
    if (pos.isEmpty()) p.showHelp(kExitUsage);

    if (!p.isSet(verboseOpt)) QLoggingCategory::setFilterRules("nhilabel.*.debug=false\nnhilabel.*.info=false");

    const QString cmd = pos.at(0).toLower();
    const QString appDir = QCoreApplication::applicationDirPath();
    AppConfig cfg = AppConfig::load(p.isSet(cfgOpt) ? p.value(cfgOpt) : QDir(appDir).filePath("config.ini"));
    if (p.isSet(offlineOpt)) cfg.reader.standalone = true;
    if (p.isSet(portOpt)){
        bool ok=false;
        cfg.reader.comPort = p.value(portOpt).toInt(&ok);
        if (!ok){ std::cerr << "Error: invalid --port value\n"; return kExitUsage; }
    }
    const QString lib = p.value(libOpt);
    const auto sources = CandidateSources::defaults(cfg.reader.dllPath, appDir);

    try {
        if (cmd=="info") return cmdInfo(cfg, sources, lib);
        if (cmd=="read") return cmdRead(cfg, sources, lib, p.isSet(recordOpt));
        if (cmd=="decode"){
            if (pos.size()<2){ std::cerr << "Usage: decode <hex> [--format basic|text]\n"; return kExitUsage; }
            return cmdDecode(cfg, pos.mid(1).join(' '), p.value(formatOpt).toLower());
        }
        if (cmd=="label"){
            if (pos.size()<2){ std::cerr << "Usage: label <file> --id ID --name NAME [--dob --sex --note]\n"; return kExitUsage; }
            LabelFields f;
            f.id = p.value(idOpt).trimmed().toUpper();
            f.name = p.value(nameOpt).trimmed();
            f.dob = normalizeBirthDate(p.value(dobOpt)).text;
            f.sex = p.isSet(sexOpt) ? sexLabel(parseSex(p.value(sexOpt))) : QString();
            f.note = p.value(noteOpt);
            return cmdLabel(cfg, pos.at(1), f);
        }
        if (cmd=="stats") return cmdStats(cfg, p.value(dateOpt));
        if (cmd=="backup"){
            if (pos.size()<2){ std::cerr << "Usage: backup <dir>\n"; return kExitUsage; }
            return cmdBackup(cfg, pos.at(1));
        }
        std::cerr << "Unknown command: " << out(cmd) << "\n";
        return kExitUsage;
    } catch (const UsageError& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return kExitUsage;
    } catch (const std::exception& ex){
        std::cerr << "Error: " << ex.what() << "\n";
        return kExitFailure;
    }
}
