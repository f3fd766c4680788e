#include <QGuiApplication>
#include <gtest/gtest.h>

int main(int argc, char** argv)
{
    // PDF labels need the font database, which only a GUI application provides.
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) qputenv("QT_QPA_PLATFORM", "offscreen");
    QGuiApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
