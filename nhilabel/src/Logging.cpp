#include "Logging.hpp"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <QMutex>
#include <QMutexLocker>
#include <cstdio>

Q_LOGGING_CATEGORY(lcBinder,      "nhilabel.binder")
Q_LOGGING_CATEGORY(lcStrategy,    "nhilabel.strategy")
Q_LOGGING_CATEGORY(lcDecoder,     "nhilabel.decoder")
Q_LOGGING_CATEGORY(lcAcquisition, "nhilabel.acquisition")
Q_LOGGING_CATEGORY(lcRecords,     "nhilabel.records")
Q_LOGGING_CATEGORY(lcLabel,       "nhilabel.label")
Q_LOGGING_CATEGORY(lcSerial,      "nhilabel.serial")
Q_LOGGING_CATEGORY(lcApp,         "nhilabel.app")

namespace nhilabel {
namespace {

QFile g_logFile;
QMutex g_logMutex;

const char* levelName(QtMsgType t){
    switch (t){
    case QtDebugMsg:    return "DEBUG";
    case QtInfoMsg:     return "INFO";
    case QtWarningMsg:  return "WARNING";
    case QtCriticalMsg: return "ERROR";
    case QtFatalMsg:    return "FATAL";
    }
    return "INFO";
}

void fileMessageHandler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg){
    const QString line = QString("%1 - %2 - %3 - %4\n")
        .arg(QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz"),
             QString::fromLatin1(ctx.category ? ctx.category : "default"),
             QString::fromLatin1(levelName(type)),
             msg);
    const QByteArray utf8 = line.toUtf8();

    QMutexLocker lock(&g_logMutex);
    std::fwrite(utf8.constData(), 1, static_cast<size_t>(utf8.size()), stderr);
    if (g_logFile.isOpen()){
        g_logFile.write(utf8);
        g_logFile.flush();
    }
}

} // namespace

bool installFileLog(const QString& path){
    qInstallMessageHandler(fileMessageHandler);

    QMutexLocker lock(&g_logMutex);
    if (g_logFile.isOpen()) g_logFile.close();
    QFileInfo fi(path);
    QDir().mkpath(fi.absolutePath());
    g_logFile.setFileName(fi.absoluteFilePath());
    return g_logFile.open(QIODevice::Append | QIODevice::Text);
}

} // namespace nhilabel
