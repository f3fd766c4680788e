#pragma once
#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QString>
#include <QTextCodec>
#include <gtest/gtest.h>

namespace nhilabel::test {

inline QByteArray big5(const QString& s){
    QTextCodec* codec = QTextCodec::codecForName("Big5");
    EXPECT_NE(codec, nullptr);
    return codec ? codec->fromUnicode(s) : s.toUtf8();
}

inline QByteArray padded(QByteArray b, int size, char fill = ' '){
    if (b.size() < size) b.append(QByteArray(size - b.size(), fill));
    return b.left(size);
}

// 72-byte basic-data record as the vendor call returns it.
inline QByteArray basicDataBlob(const QString& cardNo, const QString& name, const QString& id,
                                const QString& birth, const QString& sex){
    QByteArray b;
    b += padded(cardNo.toLatin1(), 12);
    b += padded(big5(name), 20);
    b += padded(id.toLatin1(), 10);
    b += padded(birth.toLatin1(), 7);
    b += padded(sex.toLatin1(), 1);
    b += "1050101";
    return padded(b, 72, '\0');
}

inline void writeFile(const QString& path, const QByteArray& data){
    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Truncate)) << path.toStdString();
    ASSERT_EQ(f.write(data), data.size());
}

} // namespace nhilabel::test
