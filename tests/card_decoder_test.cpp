#include "CardDecoder.hpp"
#include "Errors.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

using namespace nhilabel;
using nhilabel::test::basicDataBlob;
using nhilabel::test::big5;

namespace {

QString u(const char* s){ return QString::fromUtf8(s); }

} // anonymous namespace

TEST(CardDecoderTest, DecodeText_PipeDelimited_SplitsIdNameBirthSex)
{
    const CardDataDecoder d;
    const CardFields f = d.decodeText(u("A123456789|許小明|0750101|M"));
    EXPECT_EQ(f.idNumber, "A123456789");
    EXPECT_EQ(f.fullName, u("許小明"));
    EXPECT_EQ(f.birthDate, "0750101");
    EXPECT_EQ(f.sex, "M");
}

TEST(CardDecoderTest, DecodeText_CommaDelimitedWithCardNumber_ReadsFifthField)
{
    const CardFields f = CardDataDecoder().decodeText(u("B223456789, 林美華 ,19900203,F,000011112222"));
    EXPECT_EQ(f.idNumber, "B223456789");
    EXPECT_EQ(f.fullName, u("林美華"));
    EXPECT_EQ(f.sex, "F");
    EXPECT_EQ(f.cardNumber, "000011112222");
}

TEST(CardDecoderTest, DecodeText_FixedLength_TrimsPadding)
{
    const QString name = u("王小明").leftJustified(20, ' ');
    const QString text = "A123456789" + name + "19860101" + "M";
    const CardFields f = CardDataDecoder().decodeText(text);
    EXPECT_EQ(f.idNumber, "A123456789");
    EXPECT_EQ(f.fullName, u("王小明"));
    EXPECT_EQ(f.birthDate, "19860101");
    EXPECT_EQ(f.sex, "M");
}

TEST(CardDecoderTest, ParseFixedLength_NoNationalIdColumn_DoesNotMatch)
{
    const QString text = QString("x").repeated(45);
    EXPECT_FALSE(CardDataDecoder::parseFixedLength(text).has_value());
}

TEST(CardDecoderTest, DecodeText_FreeForm_FallsBackToPatternSearch)
{
    const CardFields f = CardDataDecoder().decodeText(u("ID:A123456789 NAME:陳大文 DOB:0750101"));
    EXPECT_EQ(f.idNumber, "A123456789");
    EXPECT_EQ(f.fullName, u("陳大文"));
    EXPECT_EQ(f.birthDate, "0750101");
}

TEST(CardDecoderTest, DecodeText_NoNameAnywhere_Throws)
{
    EXPECT_THROW(CardDataDecoder().decodeText("A123456789 0750101"), DecodeError);
}

TEST(CardDecoderTest, DecodeText_DelimitedWithEmptyName_IsNotAMatch)
{
    EXPECT_FALSE(CardDataDecoder::parseDelimited("A123456789||0750101|M").has_value());
    EXPECT_THROW(CardDataDecoder().decodeText("A123456789||0750101|M"), DecodeError);
}

TEST(CardDecoderTest, DecodeText_Empty_ThrowsDecodeError)
{
    try {
        CardDataDecoder().decodeText("   ");
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& ex) {
        EXPECT_EQ(ex.category(), ErrorCategory::DecodeFailed);
        EXPECT_EQ(ex.message(), "Card reader returned empty data");
    }
}

TEST(CardDecoderTest, DecodeText_Garbage_ThrowsUnrecognized)
{
    try {
        CardDataDecoder().decodeText("hello world");
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& ex) {
        EXPECT_EQ(ex.message(), "Unrecognized card data format");
    }
}

TEST(CardDecoderTest, Decode_BasicDataBlob_ReadsPositionalFields)
{
    const QByteArray blob = basicDataBlob("000012345678", u("王小明"), "A123456789", "0750101", "M");
    const CardFields f = CardDataDecoder("Big5").decode(blob, BlobFormat::BasicData);
    EXPECT_EQ(f.cardNumber, "000012345678");
    EXPECT_EQ(f.fullName, u("王小明"));
    EXPECT_EQ(f.idNumber, "A123456789");
    EXPECT_EQ(f.birthDate, "0750101");
    EXPECT_EQ(f.sex, "M");
}

TEST(CardDecoderTest, Decode_BasicDataBlob_PositionalWinsOverDelimiters)
{
    // The serial contains commas, which the delimited parser would happily split on.
    const QByteArray blob = basicDataBlob("12,34,56,789", u("李四"), "C123456789", "0800505", "F");
    const CardFields f = CardDataDecoder("Big5").decode(blob, BlobFormat::BasicData);
    EXPECT_EQ(f.idNumber, "C123456789");
    EXPECT_EQ(f.fullName, u("李四"));
    EXPECT_EQ(f.cardNumber, "12,34,56,789");
}

TEST(CardDecoderTest, Decode_IdNotMatchingPattern_UsesFixedOffset)
{
    const QByteArray blob = basicDataBlob("000012345678", u("王小明"), "a123456789", "0750101", "M");
    const CardFields f = CardDataDecoder("Big5").decode(blob, BlobFormat::BasicData);
    EXPECT_EQ(f.idNumber, "a123456789");
    EXPECT_EQ(f.birthDate, "0750101");
}

TEST(CardDecoderTest, Decode_CustomLayout_HonorsOffsets)
{
    BasicDataLayout layout;
    layout.serialLength = 8;
    QByteArray blob = "ABCD1234" + big5(u("張三")) + "    " + "x987654321";
    blob = nhilabel::test::padded(blob, 72, '\0');
    layout.idOffset = 16;
    const auto f = CardDataDecoder::parsePositional(CardDataDecoder("Big5", layout).toUnicode(blob), blob, layout);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->cardNumber, "ABCD1234");
    EXPECT_EQ(f->idNumber, "x987654321");
}

TEST(CardDecoderTest, Decode_TextBlob_DecodesBig5)
{
    const QByteArray blob = big5(u("A123456789|許小明|0750101|M"));
    const CardFields f = CardDataDecoder("Big5").decode(blob, BlobFormat::Text);
    EXPECT_EQ(f.fullName, u("許小明"));
}

TEST(CardDecoderTest, Decode_NoneFormat_Throws)
{
    EXPECT_THROW(CardDataDecoder().decode(QByteArray(), BlobFormat::None), DecodeError);
}
