#include "SerialPortProbe.hpp"
#include "Logging.hpp"
#include <QRegularExpression>
#include <QSerialPortInfo>

namespace nhilabel {

QVector<PortCandidate> SerialPortProbe::enumerate(){
    QVector<PortCandidate> out;
    const auto ports = QSerialPortInfo::availablePorts();
    for (const QSerialPortInfo& info : ports){
        PortCandidate c;
        c.name = info.portName();
        c.number = portNumber(c.name);
        c.description = info.description();
        c.manufacturer = info.manufacturer();
        c.score = score(c.description, c.manufacturer);
        qCDebug(lcSerial) << "Found port" << c.name << c.description << c.manufacturer << "score" << c.score;
        out.push_back(c);
    }
    return out;
}

int SerialPortProbe::portNumber(const QString& portName){
    static const QRegularExpression re("([0-9]+)$");
    const auto m = re.match(portName);
    return m.hasMatch() ? m.captured(1).toInt() : -1;
}

int SerialPortProbe::score(const QString& description, const QString& manufacturer){
    struct Keyword { const char* word; int weight; };
    static const Keyword keywords[] = {
        {"smart card", 10}, {"card reader", 10}, {"nhi", 8}, {"castles", 8}, {"ezcon", 6},
        {"prolific", 4}, {"pl2303", 4}, {"ch340", 3}, {"cp210", 3}, {"ftdi", 3},
        {"usb", 2}, {"serial", 1},
    };
    const QString text = (description + ' ' + manufacturer).toLower();
    int s = 0;
    for (const auto& k : keywords) if (text.contains(QLatin1String(k.word))) s += k.weight;
    if (text.contains(QLatin1String("bluetooth"))) s -= 5;
    return s;
}

std::optional<PortCandidate> SerialPortProbe::choose(const QVector<PortCandidate>& ports, int preferred){
    const PortCandidate* best = nullptr;
    for (const auto& p : ports){
        if (p.number < 0) continue;
        if (p.number == preferred) return p;
        if (!best || p.score > best->score || (p.score == best->score && p.number < best->number)) best = &p;
    }
    if (!best) return std::nullopt;
    return *best;
}

std::optional<int> SerialPortProbe::detect(int preferred){
    const auto chosen = choose(enumerate(), preferred);
    if (!chosen){
        qCWarning(lcSerial) << "No serial port found";
        return std::nullopt;
    }
    qCInfo(lcSerial) << "Selected port" << chosen->name << "(" << chosen->description << ")";
    return chosen->number;
}

} // namespace nhilabel
