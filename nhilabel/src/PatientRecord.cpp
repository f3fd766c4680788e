#include "PatientRecord.hpp"
#include "Errors.hpp"
#include <QDate>
#include <QRegularExpression>

namespace nhilabel {

Sex parseSex(const QString& code){
    const QString c = code.trimmed().toUpper();
    if (c.isEmpty()) return Sex::Unspecified;
    if (c=="M" || c=="1" || c=="MALE" || c==QString::fromUtf8("男")) return Sex::Male;
    if (c=="F" || c=="2" || c=="FEMALE" || c==QString::fromUtf8("女")) return Sex::Female;
    return Sex::Unknown;
}

QString sexLabel(Sex s){
    switch (s){
    case Sex::Male:    return QString::fromUtf8("男");
    case Sex::Female:  return QString::fromUtf8("女");
    case Sex::Unknown: return QString::fromUtf8("未知");
    case Sex::Unspecified: break;
    }
    return {};
}

NormalizedDate normalizeBirthDate(const QString& raw){
    QString s = raw.trimmed();
    s.remove('-').remove('/');

    bool allDigits = !s.isEmpty();
    for (QChar ch : s) if (!ch.isDigit()) { allDigits = false; break; }

    if (allDigits && (s.size()==8 || s.size()==7)){
        const int yLen = s.size()==8 ? 4 : 3;
        int year  = s.left(yLen).toInt();
        int month = s.mid(yLen, 2).toInt();
        int day   = s.mid(yLen+2, 2).toInt();
        if (yLen==3) year += 1911;
        QDate d(year, month, day);
        if (d.isValid()) return { d.toString("yyyy/MM/dd"), true };
    }
    return { raw.trimmed(), false };
}

bool isNationalId(const QString& id){
    static const QRegularExpression re("^[A-Z][0-9]{9}$");
    return re.match(id).hasMatch();
}

PatientRecord PatientRecord::fromFields(const CardFields& f, const QByteArray& rawBlob, const QString& source){
    const QString id = f.idNumber.trimmed();
    const QString name = f.fullName.trimmed();
    if (id.isEmpty()) throw ValidationError("Card data is missing the ID number");
    if (name.isEmpty()) throw ValidationError("Card data is missing the name");
    if (id.size()!=10) throw ValidationError(QString("ID number has unexpected length: %1").arg(id));

    PatientRecord r;
    r.id_ = id;
    r.name_ = name;
    r.birth_ = f.birthDate.trimmed();
    r.sex_ = f.sex.trimmed();
    r.cardNo_ = f.cardNumber.trimmed();
    r.raw_ = rawBlob;
    r.source_ = source;
    return r;
}

LabelFields toLabelFields(const PatientRecord& r, const QString& note){
    LabelFields l;
    l.id = r.idNumber();
    l.name = r.fullName();
    l.dob = normalizeBirthDate(r.birthDate()).text;
    l.sex = sexLabel(r.sex());
    l.note = note;
    l.cardNo = r.cardNumber();
    return l;
}

} // namespace nhilabel
