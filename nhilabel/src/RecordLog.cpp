#include "RecordLog.hpp"
#include "Logging.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

namespace nhilabel {

const QStringList& RecordLog::header(){
    static const QStringList h = {
        "timestamp", "id_number", "name", "birth_date", "print_count", "operation", "note", "card_no"
    };
    return h;
}

RecordLog::RecordLog(QString dir) : dir_(std::move(dir)) {
    if (!QDir().mkpath(dir_))
        throw RecordLogError(("Cannot create record directory: " + dir_).toStdString());
    qCInfo(lcRecords) << "Record directory" << QFileInfo(dir_).absoluteFilePath();
}

QString RecordLog::fileFor(const QDate& day) const {
    return QDir(dir_).filePath(QString("record_%1.csv").arg(day.toString("yyyyMMdd")));
}

QString RecordLog::csvEscape(const QString& field){
    if (!field.contains(',') && !field.contains('"') && !field.contains('\n') && !field.contains('\r'))
        return field;
    QString q = field;
    q.replace("\"", "\"\"");
    return "\"" + q + "\"";
}

QStringList RecordLog::csvSplit(const QString& line){
    QStringList out;
    QString cur;
    bool quoted = false;
    for (int i=0;i<line.size();++i){
        const QChar c = line[i];
        if (quoted){
            if (c=='"'){
                if (i+1<line.size() && line[i+1]=='"') { cur += '"'; ++i; }
                else quoted = false;
            } else cur += c;
        } else if (c=='"') quoted = true;
        else if (c==',') { out << cur; cur.clear(); }
        else cur += c;
    }
    out << cur;
    return out;
}

void RecordLog::logOperation(const LabelFields& f, const QString& timestamp, int printCount,
                             const QString& operationType, const QDate& day){
    QFile file(fileFor(day));
    const bool fresh = !file.exists() || file.size()==0;
    if (!file.open(QIODevice::Append | QIODevice::Text))
        throw RecordLogError(("Cannot write record file: " + file.fileName()).toStdString());

    QTextStream out(&file);
    out.setCodec("UTF-8");
    if (fresh){
        out.setGenerateByteOrderMark(true);
        QStringList h;
        for (const auto& c : header()) h << csvEscape(c);
        out << h.join(',') << '\n';
        qCInfo(lcRecords) << "Created record file" << file.fileName();
    }

    const QStringList row = {
        timestamp,
        f.id.isEmpty() ? "N/A" : f.id,
        f.name.isEmpty() ? "N/A" : f.name,
        f.dob.isEmpty() ? "N/A" : f.dob,
        QString::number(printCount),
        operationType,
        f.note,
        f.cardNo
    };
    QStringList escaped;
    for (const auto& c : row) escaped << csvEscape(c);
    out << escaped.join(',') << '\n';
    out.flush();
    if (out.status()!=QTextStream::Ok)
        throw RecordLogError(("Write to record file failed: " + file.fileName()).toStdString());

    qCInfo(lcRecords) << "Logged" << operationType << f.id << printCount << "label(s)";
}

QVector<QMap<QString, QString>> RecordLog::records(const QDate& day) const {
    QVector<QMap<QString, QString>> out;
    QFile file(fileFor(day));
    if (!file.exists()) return out;
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
        throw RecordLogError(("Cannot read record file: " + file.fileName()).toStdString());

    QTextStream in(&file);
    in.setCodec("UTF-8");
    in.setAutoDetectUnicode(true);
    QStringList cols;
    while (!in.atEnd()){
        const QString line = in.readLine();
        if (line.trimmed().isEmpty()) continue;
        const QStringList cells = csvSplit(line);
        if (cols.isEmpty()) { cols = cells; continue; }
        QMap<QString, QString> row;
        for (int i=0;i<cols.size();++i) row.insert(cols[i], cells.value(i));
        out.push_back(row);
    }
    return out;
}

RecordStats RecordLog::statistics(const QDate& day) const {
    RecordStats s;
    const auto rows = records(day);
    for (const auto& r : rows){
        const QString op = r.value("operation");
        if (op.startsWith("read")) ++s.reads;
        else if (op.startsWith("print")){
            ++s.prints;
            s.labels += r.value("print_count").toInt();
        }
    }
    s.total = rows.size();
    return s;
}

int RecordLog::backup(const QString& backupDir) const {
    if (!QDir().mkpath(backupDir))
        throw RecordLogError(("Cannot create backup directory: " + backupDir).toStdString());
    const QStringList files = QDir(dir_).entryList({"record_*.csv"}, QDir::Files, QDir::Name);
    int n = 0;
    for (const auto& name : files){
        const QString dst = QDir(backupDir).filePath("backup_" + name);
        if (QFile::exists(dst)) QFile::remove(dst);
        if (QFile::copy(QDir(dir_).filePath(name), dst)) ++n;
        else qCWarning(lcRecords) << "Backup of" << name << "failed";
    }
    qCInfo(lcRecords) << "Backed up" << n << "record file(s) to" << backupDir;
    return n;
}

} // namespace nhilabel
