#include <QApplication>
#include <QDir>
#include <QFileInfo>
#include "AppConfig.hpp"
#include "Logging.hpp"
#include "SerialPortProbe.hpp"
#include "mainwindow.hpp"

using namespace nhilabel;

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    QApplication::setApplicationName("labelgui");
    QApplication::setApplicationVersion("1.0");

    const QString appDir = QCoreApplication::applicationDirPath();
    AppConfig cfg = AppConfig::load(QDir(appDir).filePath("config.ini"));

    const QString logFile = QFileInfo(cfg.logFile).isAbsolute() ? cfg.logFile : QDir(appDir).filePath(cfg.logFile);
    if (!installFileLog(logFile)) qCWarning(lcApp) << "Logging to stderr only";
    if (QFileInfo(cfg.recordDir).isRelative()) cfg.recordDir = QDir(appDir).filePath(cfg.recordDir);

    if (cfg.reader.autoDetectPort){
        if (const auto port = SerialPortProbe::detect(cfg.reader.comPort)){
            if (*port != cfg.reader.comPort) qCInfo(lcApp) << "Using detected reader port" << *port;
            cfg.reader.comPort = *port;
        }
    }

    MainWindow w(cfg);
    w.show();
    return app.exec();
}
