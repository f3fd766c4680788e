#pragma once
#include "PatientRecord.hpp"
#include <QDate>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>
#include <stdexcept>

namespace nhilabel {

struct RecordLogError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct RecordStats {
    int reads = 0;
    int prints = 0;
    int labels = 0;
    int total = 0;
};

// Daily CSV audit trail: records/record_YYYYMMDD.csv, UTF-8 with BOM.
class RecordLog {
public:
    static const QStringList& header();

    explicit RecordLog(QString dir);

    QString fileFor(const QDate& day) const;

    // operationType: "read", "print", "manual-entry", optionally suffixed by the caller.
    void logOperation(const LabelFields& f, const QString& timestamp, int printCount,
                      const QString& operationType, const QDate& day = QDate::currentDate());

    QVector<QMap<QString, QString>> records(const QDate& day = QDate::currentDate()) const;
    RecordStats statistics(const QDate& day = QDate::currentDate()) const;

    // Copies every record file to backupDir/backup_<name>; returns how many were copied.
    int backup(const QString& backupDir) const;

    static QString csvEscape(const QString& field);
    static QStringList csvSplit(const QString& line);

private:
    QString dir_;
};

} // namespace nhilabel
