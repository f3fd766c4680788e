#pragma once
#include <QByteArray>
#include <QString>

namespace nhilabel {

// Field map produced by a strategy or the decoder, before validation.
struct CardFields {
    QString idNumber;
    QString fullName;
    QString birthDate;
    QString sex;
    QString cardNumber;
};

enum class Sex { Unspecified, Male, Female, Unknown };

Sex parseSex(const QString& code);
QString sexLabel(Sex s);

struct NormalizedDate {
    QString text;
    bool recognized = false;
};

// YYYYMMDD or local-calendar YYYMMDD (year + 1911) to YYYY/MM/DD. Never throws.
NormalizedDate normalizeBirthDate(const QString& raw);

// One letter followed by nine digits.
bool isNationalId(const QString& id);

class PatientRecord {
public:
    // Throws ValidationError when the ID or the name is missing.
    static PatientRecord fromFields(const CardFields& f, const QByteArray& rawBlob = {},
                                    const QString& source = {});

    const QString& idNumber() const { return id_; }
    const QString& fullName() const { return name_; }
    const QString& birthDate() const { return birth_; }
    const QString& sexCode() const { return sex_; }
    Sex sex() const { return parseSex(sex_); }
    const QString& cardNumber() const { return cardNo_; }
    const QByteArray& rawBlob() const { return raw_; }
    const QString& source() const { return source_; }

private:
    PatientRecord() = default;

    QString id_;
    QString name_;
    QString birth_;
    QString sex_;
    QString cardNo_;
    QByteArray raw_;
    QString source_;
};

// Flattened record handed to the label renderer and the audit log.
struct LabelFields {
    QString id;
    QString name;
    QString dob;
    QString sex;
    QString note;
    QString cardNo;
};

LabelFields toLabelFields(const PatientRecord& r, const QString& note = {});

} // namespace nhilabel
