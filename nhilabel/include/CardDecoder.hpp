#pragma once
#include "AppConfig.hpp"
#include "CardStrategies.hpp"
#include "PatientRecord.hpp"
#include <QByteArray>
#include <QString>
#include <optional>

class QTextCodec;

namespace nhilabel {

class CardDataDecoder {
public:
    explicit CardDataDecoder(const QString& encoding = "Big5", BasicDataLayout layout = {});

    // Throws DecodeError when no step yields both an ID and a name.
    CardFields decode(const QByteArray& blob, BlobFormat format) const;

    // The generic steps on already decoded text, in cascade order.
    CardFields decodeText(const QString& text) const;

    QString toUnicode(const QByteArray& blob) const;

    static std::optional<CardFields> parsePositional(const QString& text, const QByteArray& blob,
                                                     const BasicDataLayout& layout);
    static std::optional<CardFields> parseDelimited(const QString& text);
    static std::optional<CardFields> parseFixedLength(const QString& text);
    static std::optional<CardFields> parseRegex(const QString& text);

private:
    QTextCodec* codec_;
    BasicDataLayout layout_;
};

} // namespace nhilabel
