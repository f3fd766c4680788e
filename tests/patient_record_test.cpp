#include "Errors.hpp"
#include "PatientRecord.hpp"

#include <gtest/gtest.h>

using namespace nhilabel;

namespace {

QString u(const char* s){ return QString::fromUtf8(s); }

CardFields fields(const QString& id, const QString& name, const QString& birth = {}, const QString& sex = {}){
    CardFields f;
    f.idNumber = id;
    f.fullName = name;
    f.birthDate = birth;
    f.sex = sex;
    return f;
}

} // anonymous namespace

// --- birth dates ---

TEST(PatientRecordTest, NormalizeBirthDate_LocalCalendar_AddsOffset)
{
    const auto d = normalizeBirthDate("1050615");
    EXPECT_TRUE(d.recognized);
    EXPECT_EQ(d.text, "2016/06/15");
}

TEST(PatientRecordTest, NormalizeBirthDate_Gregorian_Reformats)
{
    const auto d = normalizeBirthDate("20160615");
    EXPECT_TRUE(d.recognized);
    EXPECT_EQ(d.text, "2016/06/15");
}

TEST(PatientRecordTest, NormalizeBirthDate_WithSeparators_Reformats)
{
    EXPECT_EQ(normalizeBirthDate("2016-06-15").text, "2016/06/15");
    EXPECT_EQ(normalizeBirthDate("075/01/01").text, "1986/01/01");
}

TEST(PatientRecordTest, NormalizeBirthDate_Unparseable_PassesThroughFlagged)
{
    const auto d = normalizeBirthDate("abc");
    EXPECT_FALSE(d.recognized);
    EXPECT_EQ(d.text, "abc");
}

TEST(PatientRecordTest, NormalizeBirthDate_ImpossibleDate_NotRecognized)
{
    const auto d = normalizeBirthDate("1051345");
    EXPECT_FALSE(d.recognized);
    EXPECT_EQ(d.text, "1051345");
}

// --- sex ---

TEST(PatientRecordTest, ParseSex_AcceptsCodesAndLabels)
{
    EXPECT_EQ(parseSex("M"), Sex::Male);
    EXPECT_EQ(parseSex("1"), Sex::Male);
    EXPECT_EQ(parseSex(u("男")), Sex::Male);
    EXPECT_EQ(parseSex("f"), Sex::Female);
    EXPECT_EQ(parseSex("2"), Sex::Female);
    EXPECT_EQ(parseSex(""), Sex::Unspecified);
    EXPECT_EQ(parseSex("X"), Sex::Unknown);
    EXPECT_EQ(sexLabel(Sex::Female), u("女"));
    EXPECT_TRUE(sexLabel(Sex::Unspecified).isEmpty());
}

TEST(PatientRecordTest, IsNationalId_RequiresLetterAndNineDigits)
{
    EXPECT_TRUE(isNationalId("A123456789"));
    EXPECT_FALSE(isNationalId("a123456789"));
    EXPECT_FALSE(isNationalId("A12345678"));
    EXPECT_FALSE(isNationalId("AB23456789"));
}

// --- validation ---

TEST(PatientRecordTest, FromFields_Complete_TrimsAndKeepsSource)
{
    const auto r = PatientRecord::fromFields(fields(" A123456789 ", u(" 王小明 "), "0750101", "M"), "raw", "basic-data");
    EXPECT_EQ(r.idNumber(), "A123456789");
    EXPECT_EQ(r.fullName(), u("王小明"));
    EXPECT_EQ(r.sex(), Sex::Male);
    EXPECT_EQ(r.rawBlob(), QByteArray("raw"));
    EXPECT_EQ(r.source(), "basic-data");
}

TEST(PatientRecordTest, FromFields_MissingId_Throws)
{
    EXPECT_THROW(PatientRecord::fromFields(fields("", u("王小明"))), ValidationError);
}

TEST(PatientRecordTest, FromFields_MissingName_Throws)
{
    EXPECT_THROW(PatientRecord::fromFields(fields("A123456789", "  ")), ValidationError);
}

TEST(PatientRecordTest, FromFields_ShortId_Throws)
{
    EXPECT_THROW(PatientRecord::fromFields(fields("A1234", u("王小明"))), ValidationError);
}

TEST(PatientRecordTest, ToLabelFields_NormalizesDateAndSex)
{
    CardFields f = fields("A123456789", u("王小明"), "0750101", "F");
    f.cardNumber = "000012345678";
    const LabelFields l = toLabelFields(PatientRecord::fromFields(f), "room 3");
    EXPECT_EQ(l.dob, "1986/01/01");
    EXPECT_EQ(l.sex, u("女"));
    EXPECT_EQ(l.note, "room 3");
    EXPECT_EQ(l.cardNo, "000012345678");
}
