#include "SerialPortProbe.hpp"

#include <gtest/gtest.h>

using namespace nhilabel;

namespace {

PortCandidate port(const QString& name, const QString& description){
    PortCandidate p;
    p.name = name;
    p.number = SerialPortProbe::portNumber(name);
    p.description = description;
    p.score = SerialPortProbe::score(description, QString());
    return p;
}

} // anonymous namespace

TEST(SerialPortProbeTest, PortNumber_TrailingDigits)
{
    EXPECT_EQ(SerialPortProbe::portNumber("COM3"), 3);
    EXPECT_EQ(SerialPortProbe::portNumber("ttyUSB12"), 12);
    EXPECT_EQ(SerialPortProbe::portNumber("cu.usbserial"), -1);
}

TEST(SerialPortProbeTest, Score_ReaderKeywordsBeatGenericSerial)
{
    const int reader = SerialPortProbe::score("Castles EZ100PU Smart Card Reader", "Castles");
    const int usbSerial = SerialPortProbe::score("USB Serial Port", "FTDI");
    const int bluetooth = SerialPortProbe::score("Standard Serial over Bluetooth link", "Microsoft");
    EXPECT_GT(reader, usbSerial);
    EXPECT_GT(usbSerial, bluetooth);
    EXPECT_LT(bluetooth, 0);
}

TEST(SerialPortProbeTest, Choose_PreferredPortPresent_Wins)
{
    const QVector<PortCandidate> ports = {
        port("COM1", "Communications Port"),
        port("COM4", "Smart Card Reader"),
        port("COM3", "Communications Port"),
    };
    const auto c = SerialPortProbe::choose(ports, 3);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->number, 3);
}

TEST(SerialPortProbeTest, Choose_PreferredMissing_HighestScore)
{
    const QVector<PortCandidate> ports = {
        port("COM1", "Communications Port"),
        port("COM4", "Smart Card Reader"),
    };
    const auto c = SerialPortProbe::choose(ports, 3);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->name, "COM4");
}

TEST(SerialPortProbeTest, Choose_TiedScores_LowestNumber)
{
    const QVector<PortCandidate> ports = {
        port("COM9", "Communications Port"),
        port("COM2", "Communications Port"),
    };
    EXPECT_EQ(SerialPortProbe::choose(ports, 3)->number, 2);
}

TEST(SerialPortProbeTest, Choose_NoNumberedPorts_Nothing)
{
    EXPECT_FALSE(SerialPortProbe::choose({}, 3).has_value());
    EXPECT_FALSE(SerialPortProbe::choose({port("cu.usbserial", "USB Serial")}, 3).has_value());
}
