#include "ControlProgram.hpp"
#include "Logging.hpp"
#include <QFileInfo>
#include <QProcess>

namespace nhilabel {

bool launchControlProgram(const QString& path){
    if (path.isEmpty()) return false;
    const QFileInfo fi(path);
    if (!fi.exists() || !fi.isFile()){
        qCInfo(lcApp) << "Control program not found:" << path;
        return false;
    }
    qint64 pid = 0;
    if (!QProcess::startDetached(fi.absoluteFilePath(), {}, fi.absolutePath(), &pid)){
        qCWarning(lcApp) << "Failed to start control program" << path;
        return false;
    }
    qCInfo(lcApp) << "Started control program" << path << "pid" << pid;
    return true;
}

} // namespace nhilabel
