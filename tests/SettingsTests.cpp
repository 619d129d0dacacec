#include <gtest/gtest.h>

#include "common/Settings.h"

#include <QSettings>
#include <QTemporaryDir>
#include <QtGlobal>

using namespace CartLink;
using namespace CartLink::Common;

namespace {

class SettingsTest : public ::testing::Test {
protected:
    QTemporaryDir dir;

    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        QSettings::setPath(QSettings::NativeFormat, QSettings::UserScope, dir.path());
        ClearEnv();
    }

    void TearDown() override { ClearEnv(); }

    static void ClearEnv() {
        for (const char *name : {"CARTLINK_PORT", "CARTLINK_BAUD", "CARTLINK_FLASH_CHIP",
                                 "CARTLINK_TRACE_COMMANDS", "CARTLINK_TRACE_PROGRESS"}) {
            qunsetenv(name);
        }
    }
};

} // namespace

TEST_F(SettingsTest, DefaultsWithoutStoredValues) {
    const ReaderSettings s = ReaderSettings::Load();
    EXPECT_TRUE(s.portName.empty());
    EXPECT_EQ(s.baudRate, 1000000);
    EXPECT_EQ(s.flashChip, Cart::FlashChip::None);
    EXPECT_FALSE(s.traceCommands);
    EXPECT_FALSE(s.traceProgress);
}

TEST_F(SettingsTest, SaveThenLoad) {
    ReaderSettings s;
    s.portName = "/dev/ttyUSB1";
    s.baudRate = 460800;
    s.flashChip = Cart::FlashChip::AM29F016B;
    s.traceCommands = true;
    s.Save();

    const ReaderSettings loaded = ReaderSettings::Load();
    EXPECT_EQ(loaded.portName, "/dev/ttyUSB1");
    EXPECT_EQ(loaded.baudRate, 460800);
    EXPECT_EQ(loaded.flashChip, Cart::FlashChip::AM29F016B);
    EXPECT_TRUE(loaded.traceCommands);
    EXPECT_FALSE(loaded.traceProgress);
}

TEST_F(SettingsTest, EnvironmentOverridesStoredValues) {
    ReaderSettings stored;
    stored.portName = "/dev/ttyUSB0";
    stored.Save();

    qputenv("CARTLINK_PORT", "/dev/ttyACM3");
    qputenv("CARTLINK_BAUD", "115200");
    qputenv("CARTLINK_FLASH_CHIP", "am29f016b");
    qputenv("CARTLINK_TRACE_PROGRESS", "1");

    const ReaderSettings s = ReaderSettings::Load();
    EXPECT_EQ(s.portName, "/dev/ttyACM3");
    EXPECT_EQ(s.baudRate, 115200);
    EXPECT_EQ(s.flashChip, Cart::FlashChip::AM29F016B);
    EXPECT_TRUE(s.traceProgress);
}

TEST_F(SettingsTest, InvalidEnvironmentValuesAreIgnored) {
    qputenv("CARTLINK_BAUD", "fast");
    qputenv("CARTLINK_FLASH_CHIP", "MX29LV320");

    const ReaderSettings s = ReaderSettings::Load();
    EXPECT_EQ(s.baudRate, 1000000);
    EXPECT_EQ(s.flashChip, Cart::FlashChip::None);
}
