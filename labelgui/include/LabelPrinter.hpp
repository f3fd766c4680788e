#pragma once
#include "LabelRenderer.hpp"

class QWidget;

// Sends labels to the printer chosen in the configuration.
class LabelPrinter {
public:
    LabelPrinter(const nhilabel::LabelRenderer& renderer, QWidget* parent)
        : renderer_(renderer), parent_(parent) {}

    // One label per copy. False when the operator cancelled the print dialog. Throws LabelError.
    bool print(const nhilabel::LabelFields& f, int copies);

private:
    bool printPainted(const nhilabel::LabelFields& f, int copies);
    void printRaw(const QByteArray& data, int copies, bool raw);

    const nhilabel::LabelRenderer& renderer_;
    QWidget* parent_;
};
