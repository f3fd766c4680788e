#pragma once
#include <QString>
#include <QVector>
#include <optional>

namespace nhilabel {

struct PortCandidate {
    QString name;          // COM3, ttyUSB0
    int number = -1;       // trailing digits of the name, -1 if none
    QString description;
    QString manufacturer;
    int score = 0;
};

// Guesses which serial port the card reader sits on.
class SerialPortProbe {
public:
    static QVector<PortCandidate> enumerate();

    static int portNumber(const QString& portName);
    static int score(const QString& description, const QString& manufacturer);

    // Configured port wins when it is present; otherwise the best score, lowest number on ties.
    static std::optional<PortCandidate> choose(const QVector<PortCandidate>& ports, int preferred);

    static std::optional<int> detect(int preferred);
};

} // namespace nhilabel
