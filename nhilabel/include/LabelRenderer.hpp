#pragma once
#include "AppConfig.hpp"
#include "PatientRecord.hpp"
#include <QByteArray>
#include <QDateTime>
#include <QString>
#include <QVector>
#include <stdexcept>

class QPainter;
class QRectF;

namespace nhilabel {

struct LabelError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

class LabelRenderer {
public:
    explicit LabelRenderer(LabelOptions opt) : opt_(std::move(opt)) {}

    const LabelOptions& options() const { return opt_; }

    QString renderText(const LabelFields& f, const QDateTime& printed) const;
    QByteArray renderZpl(const LabelFields& f, const QDateTime& printed) const;
    void renderPdf(const LabelFields& f, const QDateTime& printed, const QString& path) const;

    // Draws one label into `page` (device pixels at `dpi`). Shared by PDF output and QPrinter.
    void paint(QPainter& p, const QRectF& page, int dpi, const LabelFields& f, const QDateTime& printed) const;

    // ID when Code 39 can carry it, otherwise the card number; empty when neither fits.
    static QString barcodeValue(const LabelFields& f);
    static bool isCode39Encodable(const QString& value);
    // Bar/space runs of `*value*` in narrow-module units (1 or 3), starting with a bar.
    static QVector<int> code39Runs(const QString& value);

private:
    LabelOptions opt_;
};

} // namespace nhilabel
