#include <gtest/gtest.h>

#include "reader/ReaderCommand.h"

#include <algorithm>
#include <string>

using namespace CartLink::Reader;

namespace {

ByteBuffer Bytes(const std::string &s) { return ByteBuffer(s.begin(), s.end()); }

} // namespace

TEST(ReaderCommandTest, SingleByteCommands) {
    EXPECT_EQ(Encode(Cmd::Start()), Bytes("R"));
    EXPECT_EQ(Encode(Cmd::Stop()), Bytes("0"));
    EXPECT_EQ(Encode(Cmd::Continue()), Bytes("1"));
    EXPECT_EQ(Encode(Cmd::Mode('G')), Bytes("G"));
    EXPECT_EQ(Encode(Cmd::Mode('5')), Bytes("5"));
}

TEST(ReaderCommandTest, SetAddressIsRegisterDigitsAndTerminator) {
    EXPECT_EQ(Encode(Cmd::Address("A", 16, 0x150)), Bytes(std::string("A150\0", 5)));
    EXPECT_EQ(Encode(Cmd::Address("B", 16, 0x2100)), Bytes(std::string("B2100\0", 6)));
    EXPECT_EQ(Encode(Cmd::Address("B", 10, 10)), Bytes(std::string("B10\0", 4)));
    EXPECT_EQ(Encode(Cmd::Address("B", 10, 0)), Bytes(std::string("B0\0", 3)));
}

TEST(ReaderCommandTest, ReadAddressRegisterKeepsLeadingNul) {
    const std::string reg("\0A", 2);
    EXPECT_EQ(Encode(Cmd::Address(reg, 16, 0x4000)), Bytes(std::string("\0A4000\0", 7)));
}

TEST(ReaderCommandTest, HexDigitsAreUppercase) {
    EXPECT_EQ(FormatRadix(0xA000, 16), "A000");
    EXPECT_EQ(FormatRadix(0x2aa, 16), "2AA");
    EXPECT_EQ(FormatRadix(255, 10), "255");
    EXPECT_EQ(FormatRadix(8, 8), "10");
    EXPECT_EQ(FormatRadix(0, 16), "0");
}

TEST(ReaderCommandTest, SleepHasNoWireForm) {
    EXPECT_TRUE(Encode(Cmd::Sleep(250)).empty());
}

TEST(ReaderCommandTest, WriteBytesPrefixesPayload) {
    ByteBuffer page(64);
    for (size_t i = 0; i < page.size(); ++i) page[i] = static_cast<uint8_t>(i);

    const ByteBuffer encoded = Encode(Cmd::Write(page));
    ASSERT_EQ(encoded.size(), 65u);
    EXPECT_EQ(encoded[0], 'W');
    EXPECT_TRUE(std::equal(page.begin(), page.end(), encoded.begin() + 1));

    const ByteBuffer flash = Encode(Cmd::FlashWrite(page));
    ASSERT_EQ(flash.size(), 65u);
    EXPECT_EQ(flash[0], 'T');
}

TEST(ReaderCommandTest, FlashByteWrite) {
    EXPECT_EQ(Encode(Cmd::FlashWrite(0x555, 0xAA)), Bytes(std::string("F555\0AA\0", 8)));
    EXPECT_EQ(Encode(Cmd::FlashWrite(0x000, 0xF0)), Bytes(std::string("F0\0F0\0", 6)));
}

TEST(ReaderCommandTest, FlashProgramMethodListsThreeCycles) {
    FlashProgramMethodCommand method;
    method.cycles = {{{0x555, 0xAA}, {0x2AA, 0x55}, {0x555, 0xA0}}};

    EXPECT_EQ(Encode(method), Bytes(std::string("E555\0AA\0" "2AA\0" "55\0" "555\0A0\0", 22)));
}

TEST(ReaderCommandTest, DescribeShowsRegisterAndBytes) {
    EXPECT_EQ(Describe(Cmd::Address("B", 16, 0x4000)), ">>>: ADDR: B;16;4000 [42|34|30|30|30|00]");
    EXPECT_EQ(Describe(Cmd::Address(std::string("\0A", 2), 16, 0x100)),
              ">>>: ADDR: \\0A;16;100 [00|41|31|30|30|00]");
    EXPECT_EQ(Describe(Cmd::Sleep(3000)), ">>>: SLEEP: 3000u");
    EXPECT_EQ(Describe(Cmd::Start()), ">>>: START: [52]");
    EXPECT_EQ(Describe(Cmd::Write(ByteBuffer(64))), ">>>: WRT: 64");
}
