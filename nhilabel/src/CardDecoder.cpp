#include "CardDecoder.hpp"
#include "Errors.hpp"
#include "Logging.hpp"
#include <QRegularExpression>
#include <QTextCodec>

namespace nhilabel {
namespace {

const QRegularExpression& idPattern(){
    static const QRegularExpression re("[A-Z][0-9]{9}");
    return re;
}

bool complete(const CardFields& f){ return !f.idNumber.isEmpty() && !f.fullName.isEmpty(); }

QString snippet(const QString& s){ return s.size() > 120 ? s.left(120) + "..." : s; }

} // namespace

CardDataDecoder::CardDataDecoder(const QString& encoding, BasicDataLayout layout)
    : codec_(QTextCodec::codecForName(encoding.toLatin1())), layout_(layout) {
    if (!codec_){
        qCWarning(lcDecoder) << "Text encoding" << encoding << "is not available, using the locale codec";
        codec_ = QTextCodec::codecForLocale();
    }
}

QString CardDataDecoder::toUnicode(const QByteArray& blob) const {
    QByteArray b = blob;
    b.replace('\0', ' ');
    return codec_->toUnicode(b);
}

std::optional<CardFields> CardDataDecoder::parsePositional(const QString& text, const QByteArray& blob,
                                                           const BasicDataLayout& layout){
    static const QRegularExpression nameRe(QStringLiteral("[\\x{4e00}-\\x{9fff}]{2,5}"));
    static const QRegularExpression birthRe("[0-9]{7}");

    CardFields f;
    f.cardNumber = text.left(layout.serialLength).trimmed();

    int from = 0;
    const auto nm = nameRe.match(text);
    if (nm.hasMatch()){
        f.fullName = nm.captured();
        from = nm.capturedEnd();
    }

    int idEnd = -1;
    const auto im = idPattern().match(text, from);
    if (im.hasMatch()){
        f.idNumber = im.captured();
        idEnd = im.capturedEnd();
    } else if (blob.size() >= layout.idOffset + layout.idLength){
        QByteArray raw = blob.mid(layout.idOffset, layout.idLength);
        raw.replace('\0', ' ');
        f.idNumber = QString::fromLatin1(raw).trimmed();
        qCWarning(lcDecoder) << "ID pattern not found, using fixed offset" << layout.idOffset << "->" << f.idNumber;
        if (!f.idNumber.isEmpty()){
            const int at = text.indexOf(f.idNumber, from);
            if (at >= 0) idEnd = at + f.idNumber.size();
        }
    }

    if (idEnd >= 0){
        const auto bm = birthRe.match(text, idEnd);
        if (bm.hasMatch()){
            f.birthDate = bm.captured();
            f.sex = text.mid(bm.capturedEnd(), 1).trimmed();
        }
    }

    if (!complete(f)) return std::nullopt;
    return f;
}

std::optional<CardFields> CardDataDecoder::parseDelimited(const QString& text){
    const QString t = text.trimmed();
    for (QChar d : {QChar('|'), QChar(','), QChar('\t'), QChar(';')}){
        if (!t.contains(d)) continue;
        const QStringList parts = t.split(d);
        if (parts.size() < 3) continue;

        CardFields f;
        f.idNumber   = parts.value(0).trimmed();
        f.fullName   = parts.value(1).trimmed();
        f.birthDate  = parts.value(2).trimmed();
        f.sex        = parts.value(3).trimmed();
        f.cardNumber = parts.value(4).trimmed();
        if (complete(f)){
            qCDebug(lcDecoder) << "Parsed with delimiter" << d;
            return f;
        }
    }
    return std::nullopt;
}

std::optional<CardFields> CardDataDecoder::parseFixedLength(const QString& text){
    const QString t = text.trimmed();
    if (t.size() < 38) return std::nullopt;

    CardFields f;
    f.idNumber   = t.mid(0, 10).trimmed();
    f.fullName   = t.mid(10, 20).trimmed();
    f.birthDate  = t.mid(30, 8).trimmed();
    f.sex        = t.size() > 38 ? t.mid(38, 1).trimmed() : QString();
    f.cardNumber = t.size() > 50 ? t.mid(39, 12).trimmed() : QString();
    // Only a real ID column makes this layout believable.
    if (!isNationalId(f.idNumber) || f.fullName.isEmpty()) return std::nullopt;
    return f;
}

std::optional<CardFields> CardDataDecoder::parseRegex(const QString& text){
    static const QRegularExpression birthRe("(?<![0-9])[0-9]{7,8}(?![0-9])");
    static const QRegularExpression nameRe(QStringLiteral("[\\x{4e00}-\\x{9fff}]+"));

    const auto im = idPattern().match(text);
    const auto nm = nameRe.match(text);
    if (!im.hasMatch() || !nm.hasMatch()) return std::nullopt;

    CardFields f;
    f.idNumber = im.captured();
    f.fullName = nm.captured();
    const auto bm = birthRe.match(text);
    if (bm.hasMatch()) f.birthDate = bm.captured();
    return f;
}

CardFields CardDataDecoder::decodeText(const QString& text) const {
    const QString t = text.trimmed();
    if (t.isEmpty()) throw DecodeError("Card reader returned empty data");

    if (auto f = parseDelimited(t)) return *f;
    if (auto f = parseFixedLength(t)) { qCDebug(lcDecoder) << "Parsed as fixed-length record"; return *f; }
    if (auto f = parseRegex(t)) { qCDebug(lcDecoder) << "Parsed with pattern search"; return *f; }

    qCWarning(lcDecoder) << "Unrecognized card data:" << snippet(t);
    throw DecodeError("Unrecognized card data format");
}

CardFields CardDataDecoder::decode(const QByteArray& blob, BlobFormat format) const {
    switch (format){
    case BlobFormat::BasicData: {
        const QString text = toUnicode(blob);
        if (auto f = parsePositional(text, blob, layout_)) return *f;
        qCWarning(lcDecoder) << "Basic-data layout did not match, trying text formats";
        return decodeText(text);
    }
    case BlobFormat::Text:
        return decodeText(toUnicode(blob));
    case BlobFormat::None:
        break;
    }
    throw DecodeError("No raw card data to decode");
}

} // namespace nhilabel
