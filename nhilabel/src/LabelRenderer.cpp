#include "LabelRenderer.hpp"
#include "Logging.hpp"
#include <QFont>
#include <QHash>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <QRectF>
#include <QStringList>
#include <algorithm>
#include <cmath>

namespace nhilabel {
namespace {

// Wide-element masks, 5 bars interleaved with 4 spaces.
const QHash<QChar, const char*>& code39Table(){
    static const QHash<QChar, const char*> t = {
        {'0',"000110100"},{'1',"100100001"},{'2',"001100001"},{'3',"101100000"},
        {'4',"000110001"},{'5',"100110000"},{'6',"001110000"},{'7',"000100101"},
        {'8',"100100100"},{'9',"001100100"},{'A',"100001001"},{'B',"001001001"},
        {'C',"101001000"},{'D',"000011001"},{'E',"100011000"},{'F',"001011000"},
        {'G',"000001101"},{'H',"100001100"},{'I',"001001100"},{'J',"000011100"},
        {'K',"100000011"},{'L',"001000011"},{'M',"101000010"},{'N',"000010011"},
        {'O',"100010010"},{'P',"001010010"},{'Q',"000000111"},{'R',"100000110"},
        {'S',"001000110"},{'T',"000010110"},{'U',"110000001"},{'V',"011000001"},
        {'W',"111000000"},{'X',"010010001"},{'Y',"110010000"},{'Z',"011010000"},
        {'-',"010000101"},{'.',"110000100"},{' ',"011000100"},{'$',"010101000"},
        {'/',"010100010"},{'+',"010001010"},{'%',"000101010"},{'*',"010010100"},
    };
    return t;
}

constexpr int kZplDpmm = 8;   // 203 dpi print heads

QString line(const char* label, const QString& value){
    return QString::fromUtf8(label) + value;
}

} // namespace

bool LabelRenderer::isCode39Encodable(const QString& value){
    if (value.isEmpty()) return false;
    for (QChar c : value) if (c=='*' || !code39Table().contains(c)) return false;
    return true;
}

QString LabelRenderer::barcodeValue(const LabelFields& f){
    if (isCode39Encodable(f.id)) return f.id;
    if (isCode39Encodable(f.cardNo)) return f.cardNo;
    return {};
}

QVector<int> LabelRenderer::code39Runs(const QString& value){
    QVector<int> runs;
    const QString full = "*" + value + "*";
    for (int i=0;i<full.size();++i){
        const char* mask = code39Table().value(full[i], nullptr);
        if (!mask) throw LabelError(("Character not encodable in Code 39: " + QString(full[i])).toStdString());
        for (int k=0;k<9;++k) runs.push_back(mask[k]=='1' ? 3 : 1);
        if (i+1<full.size()) runs.push_back(1);   // inter-character gap
    }
    return runs;
}

QString LabelRenderer::renderText(const LabelFields& f, const QDateTime& printed) const {
    const QString rule(42, '=');
    QStringList lines;
    lines << rule
          << QString::fromUtf8("          健保卡資料標籤")
          << rule
          << line("身分證字號: ", f.id.isEmpty() ? "N/A" : f.id)
          << line("姓名: ", f.name.isEmpty() ? "N/A" : f.name)
          << line("出生年月日: ", f.dob.isEmpty() ? "N/A" : f.dob);
    if (!f.sex.isEmpty()) lines << line("性別: ", f.sex);
    if (!f.note.isEmpty()) lines << line("備註: ", f.note);
    lines << line("列印時間: ", printed.toString("yyyy/MM/dd hh:mm"));
    if (opt_.barcode){
        const QString code = barcodeValue(f);
        if (!code.isEmpty()) lines << "*" + code + "*";
    }
    lines << rule;
    return lines.join('\n') + '\n';
}

QByteArray LabelRenderer::renderZpl(const LabelFields& f, const QDateTime& printed) const {
    const int w = static_cast<int>(std::lround(opt_.widthMm * kZplDpmm));
    const int h = static_cast<int>(std::lround(opt_.heightMm * kZplDpmm));
    const int x = 2 * kZplDpmm;
    int y = 2 * kZplDpmm;

    QString z;
    z += "^XA\n^CI28\n";
    z += QString("^PW%1\n^LL%2\n").arg(w).arg(h);
    auto text = [&](const QString& s, int size){
        z += QString("^FO%1,%2^A0N,%3,%3^FD%4^FS\n").arg(x).arg(y).arg(size).arg(s);
        y += size + 6;
    };
    text("ID: " + f.id, 30);
    text(line("姓名: ", f.name), 30);
    text(line("生日: ", f.dob) + (f.sex.isEmpty() ? QString() : "  " + f.sex), 24);
    if (!f.note.isEmpty()) text(line("備註: ", f.note), 22);
    text(line("列印: ", printed.toString("yyyy/MM/dd hh:mm")), 20);

    if (opt_.barcode){
        const QString code = barcodeValue(f);
        const int barH = std::max(h - y - kZplDpmm * 2, 24);
        if (!code.isEmpty() && y + barH <= h)
            z += QString("^FO%1,%2^BY2^B3N,N,%3,N,N^FD%4^FS\n").arg(x).arg(y).arg(barH).arg(code);
    }
    z += "^XZ\n";
    return z.toUtf8();
}

void LabelRenderer::paint(QPainter& p, const QRectF& page, int dpi, const LabelFields& f,
                          const QDateTime& printed) const {
    const double mm = dpi / 25.4;
    const double x = page.left() + 2 * mm;
    double y = page.top() + 2 * mm;

    auto draw = [&](const QString& s, int pt, bool bold){
        QFont font;
        font.setPointSize(pt);
        font.setBold(bold);
        p.setFont(font);
        const double lineH = pt / 72.0 * dpi * 1.25;
        p.drawText(QRectF(x, y, page.width() - 4 * mm, lineH), Qt::AlignLeft | Qt::AlignVCenter, s);
        y += lineH;
    };
    draw("ID: " + f.id, 9, true);
    draw(line("姓名: ", f.name), 9, true);
    draw(line("生日: ", f.dob) + (f.sex.isEmpty() ? QString() : "  " + f.sex), 8, false);
    if (!f.note.isEmpty()) draw(line("備註: ", f.note), 7, false);
    draw(line("列印: ", printed.toString("yyyy/MM/dd hh:mm")), 7, false);

    if (!opt_.barcode) return;
    const QString code = barcodeValue(f);
    if (code.isEmpty()) return;

    const QVector<int> runs = code39Runs(code);
    int modules = 0;
    for (int r : runs) modules += r;
    const double avail = page.width() - 4 * mm;
    const double unit = avail / modules;
    const double barH = page.bottom() - 2 * mm - y;
    if (barH < 3 * mm){
        qCWarning(lcLabel) << "Label too small for a barcode, skipped";
        return;
    }
    double bx = x;
    for (int i=0;i<runs.size();++i){
        const double wdt = runs[i] * unit;
        if (i % 2 == 0) p.fillRect(QRectF(bx, y, wdt, barH), Qt::black);
        bx += wdt;
    }
}

void LabelRenderer::renderPdf(const LabelFields& f, const QDateTime& printed, const QString& path) const {
    QPdfWriter writer(path);
    writer.setPageSize(QPageSize(QSizeF(opt_.widthMm, opt_.heightMm), QPageSize::Millimeter));
    writer.setPageMargins(QMarginsF(0, 0, 0, 0));
    writer.setResolution(300);

    QPainter painter(&writer);
    if (!painter.isActive())
        throw LabelError(("Failed to initialize PDF painter for " + path).toStdString());
    const QRectF page(0, 0, writer.width(), writer.height());
    paint(painter, page, writer.resolution(), f, printed);
    painter.end();
    qCInfo(lcLabel) << "PDF label written to" << path << opt_.widthMm << "x" << opt_.heightMm << "mm";
}

} // namespace nhilabel
