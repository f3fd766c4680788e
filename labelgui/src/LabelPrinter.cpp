#include "LabelPrinter.hpp"
#include "Logging.hpp"
#include <QDateTime>
#include <QPageLayout>
#include <QPainter>
#include <QPrintDialog>
#include <QPrinter>
#include <QProcess>

using namespace nhilabel;

bool LabelPrinter::print(const LabelFields& f, int copies){
    if (copies < 1) copies = 1;
    const LabelOptions& o = renderer_.options();
    switch (o.printMode){
    case PrintMode::Pdf:
        return printPainted(f, copies);
    case PrintMode::Zpl:
        printRaw(renderer_.renderZpl(f, QDateTime::currentDateTime()), copies, true);
        return true;
    case PrintMode::Text:
        printRaw(renderer_.renderText(f, QDateTime::currentDateTime()).toUtf8(), copies, false);
        return true;
    }
    return false;
}

bool LabelPrinter::printPainted(const LabelFields& f, int copies){
    const LabelOptions& o = renderer_.options();
    QPrinter printer(QPrinter::HighResolution);
    if (!o.printerName.isEmpty()) printer.setPrinterName(o.printerName);
    printer.setPageSize(QPageSize(QSizeF(o.widthMm, o.heightMm), QPageSize::Millimeter));
    printer.setPageMargins(QMarginsF(0, 0, 0, 0), QPageLayout::Millimeter);
    printer.setFullPage(true);

    if (o.showPrintDialog){
        QPrintDialog dlg(&printer, parent_);
        dlg.setWindowTitle(QObject::tr("Print labels"));
        if (dlg.exec() != QDialog::Accepted) return false;
    }

    QPainter painter(&printer);
    if (!painter.isActive())
        throw LabelError(("Cannot start printing on " + printer.printerName()).toStdString());
    const QRectF page = printer.pageLayout().fullRectPixels(printer.resolution());
    const QDateTime now = QDateTime::currentDateTime();
    for (int i=0;i<copies;++i){
        if (i>0 && !printer.newPage()) throw LabelError("Printer rejected a new page");
        renderer_.paint(painter, page, printer.resolution(), f, now);
    }
    painter.end();
    qCInfo(lcLabel) << "Printed" << copies << "label(s) on" << printer.printerName();
    return true;
}

void LabelPrinter::printRaw(const QByteArray& data, int copies, bool raw){
    const LabelOptions& o = renderer_.options();
    QStringList args;
    if (!o.printerName.isEmpty()) args << "-d" << o.printerName;
    args << "-n" << QString::number(copies);
    if (raw) args << "-o" << "raw";

    QProcess lp;
    lp.start("lp", args);
    if (!lp.waitForStarted(5000))
        throw LabelError(("Cannot start lp: " + lp.errorString()).toStdString());
    lp.write(data);
    lp.closeWriteChannel();
    if (!lp.waitForFinished(15000))
        throw LabelError("lp did not finish");
    if (lp.exitStatus()!=QProcess::NormalExit || lp.exitCode()!=0)
        throw LabelError(("lp failed: " + QString::fromLocal8Bit(lp.readAllStandardError()).trimmed()).toStdString());
    qCInfo(lcLabel) << "Sent" << copies << (raw ? "ZPL" : "text") << "label(s) to lp"
                    << QString::fromLocal8Bit(lp.readAllStandardOutput()).trimmed();
}
