#include "LabelRenderer.hpp"

#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

using namespace nhilabel;

namespace {

const QDateTime kPrinted(QDate(2024, 3, 15), QTime(14, 30));

LabelFields patient(){
    LabelFields f;
    f.id = "A123456789";
    f.name = QString::fromUtf8("王小明");
    f.dob = "1986/01/01";
    f.sex = QString::fromUtf8("男");
    f.cardNo = "000012345678";
    return f;
}

LabelOptions options(bool barcode){
    LabelOptions o;
    o.barcode = barcode;
    return o;
}

} // anonymous namespace

TEST(LabelRendererTest, RenderText_ShowsFieldsAndPrintTime)
{
    const QString text = LabelRenderer(options(true)).renderText(patient(), kPrinted);
    EXPECT_TRUE(text.contains("A123456789"));
    EXPECT_TRUE(text.contains(QString::fromUtf8("王小明")));
    EXPECT_TRUE(text.contains("1986/01/01"));
    EXPECT_TRUE(text.contains("2024/03/15 14:30"));
    EXPECT_TRUE(text.contains("*A123456789*"));
}

TEST(LabelRendererTest, RenderText_BarcodeDisabled_NoBarcodeLine)
{
    const QString text = LabelRenderer(options(false)).renderText(patient(), kPrinted);
    EXPECT_FALSE(text.contains("*A123456789*"));
}

TEST(LabelRendererTest, RenderText_MissingFields_ShowNA)
{
    const QString text = LabelRenderer(options(false)).renderText(LabelFields(), kPrinted);
    EXPECT_EQ(text.count("N/A"), 3);
}

TEST(LabelRendererTest, RenderZpl_SizedInDotsWithCode39)
{
    const QByteArray zpl = LabelRenderer(options(true)).renderZpl(patient(), kPrinted);
    EXPECT_TRUE(zpl.startsWith("^XA"));
    EXPECT_TRUE(zpl.trimmed().endsWith("^XZ"));
    EXPECT_TRUE(zpl.contains("^PW400"));
    EXPECT_TRUE(zpl.contains("^LL280"));
    EXPECT_TRUE(zpl.contains("^B3N,N,"));
    EXPECT_TRUE(zpl.contains("^FDA123456789^FS"));
    EXPECT_TRUE(zpl.contains(QString::fromUtf8("王小明").toUtf8()));
}

TEST(LabelRendererTest, BarcodeValue_FallsBackToCardNumber)
{
    LabelFields f = patient();
    EXPECT_EQ(LabelRenderer::barcodeValue(f), "A123456789");
    f.id = "a123456789";
    EXPECT_EQ(LabelRenderer::barcodeValue(f), "000012345678");
    f.cardNo.clear();
    EXPECT_TRUE(LabelRenderer::barcodeValue(f).isEmpty());
}

TEST(LabelRendererTest, Code39Runs_FramedByStartStopWithThreeWideElements)
{
    const QVector<int> runs = LabelRenderer::code39Runs("A1");
    // 4 symbols of 9 elements plus 3 gaps
    ASSERT_EQ(runs.size(), 4 * 9 + 3);
    int wide = 0;
    for (int i=0;i<9;++i) if (runs[i]==3) ++wide;
    EXPECT_EQ(wide, 3);
    EXPECT_EQ(runs.mid(0, 9), runs.mid(runs.size() - 9));
}

TEST(LabelRendererTest, Code39Runs_UnsupportedCharacter_Throws)
{
    EXPECT_FALSE(LabelRenderer::isCode39Encodable("a1"));
    EXPECT_THROW(LabelRenderer::code39Runs("a1"), LabelError);
}

TEST(LabelRendererTest, RenderPdf_WritesPdfDocument)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("label.pdf");

    LabelRenderer(options(true)).renderPdf(patient(), kPrinted, path);

    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::ReadOnly));
    const QByteArray pdf = f.readAll();
    EXPECT_TRUE(pdf.startsWith("%PDF-"));
    EXPECT_TRUE(pdf.contains("/Type /Page"));
}
