#include <gtest/gtest.h>

#include "cart/CartridgeHeader.h"
#include "support/CartridgeImage.h"

using namespace CartLink;
using namespace CartLink::Cart;

TEST(CartridgeHeaderTest, ParsesTitleTypeAndSizes) {
    const auto rom = CartLink::Test::MakeRomImage("POKEMON RED", 0x13, 1024 * 1024, 32768);
    const auto header = CartridgeHeader::FromImage(rom);

    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->Title(), "POKEMON RED");
    EXPECT_EQ(header->CartType(), 0x13);
    EXPECT_EQ(header->Configuration(), MBCKind::Other);
    EXPECT_EQ(header->RomSize(), 1024u * 1024u);
    EXPECT_EQ(header->RomBankCount(), 64u);
    EXPECT_EQ(header->RamSize(), 32768u);
    EXPECT_EQ(header->RamBankSize(), 0x2000u);
    EXPECT_EQ(header->RamBankCount(), 4u);
    EXPECT_TRUE(header->HasSaveRam());
    EXPECT_TRUE(header->IsChecksumValid());
}

TEST(CartridgeHeaderTest, FromBytesTakesHeaderRange) {
    const auto rom = CartLink::Test::MakeRomImage("TETRIS", 0x00, 0x8000);
    std::vector<uint8_t> range(rom.begin() + HeaderLayout::START, rom.begin() + HeaderLayout::END);

    const auto header = CartridgeHeader::FromBytes(range);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->Title(), "TETRIS");
    EXPECT_EQ(header->Bytes(), range);
    EXPECT_EQ(header->Configuration(), MBCKind::None);
    EXPECT_FALSE(header->HasSaveRam());
    EXPECT_EQ(header->RamBankCount(), 0u);
}

TEST(CartridgeHeaderTest, ShortInputIsRejected) {
    EXPECT_FALSE(CartridgeHeader::FromBytes(std::vector<uint8_t>(HeaderLayout::SIZE - 1)).has_value());
    EXPECT_FALSE(CartridgeHeader::FromImage(std::vector<uint8_t>(0x14F)).has_value());
}

TEST(CartridgeHeaderTest, ConfigurationFromCartType) {
    EXPECT_EQ(MBCKindFromCartType(0x00), MBCKind::None);
    EXPECT_EQ(MBCKindFromCartType(0x09), MBCKind::None);
    EXPECT_EQ(MBCKindFromCartType(0x01), MBCKind::One);
    EXPECT_EQ(MBCKindFromCartType(0x03), MBCKind::One);
    EXPECT_EQ(MBCKindFromCartType(0x05), MBCKind::Two);
    EXPECT_EQ(MBCKindFromCartType(0x06), MBCKind::Two);
    EXPECT_EQ(MBCKindFromCartType(0x13), MBCKind::Other);
    EXPECT_EQ(MBCKindFromCartType(0x1B), MBCKind::Other);
}

TEST(CartridgeHeaderTest, MBC2HasBuiltInRam) {
    const auto header = CartLink::Test::HeaderOf(CartLink::Test::MakeRomImage("MBC2 GAME", 0x06, 0x40000));

    EXPECT_EQ(header.Configuration(), MBCKind::Two);
    EXPECT_EQ(header.RamSize(), MBC2_RAM_SIZE);
    EXPECT_EQ(header.RamBankSize(), MBC2_RAM_SIZE);
    EXPECT_EQ(header.RamBankCount(), 1u);
}

TEST(CartridgeHeaderTest, SmallRamIsOneBank) {
    const auto header = CartLink::Test::HeaderOf(CartLink::Test::MakeRomImage("SMALL", 0x03, 0x10000, 2048));
    EXPECT_EQ(header.RamBankSize(), 2048u);
    EXPECT_EQ(header.RamBankCount(), 1u);
}

TEST(CartridgeHeaderTest, DetectsBadChecksum) {
    auto rom = CartLink::Test::MakeRomImage("CORRUPT", 0x01, 0x10000);
    rom[HeaderLayout::HEADER_CHECKSUM] ^= 0xFF;

    EXPECT_FALSE(CartLink::Test::HeaderOf(rom).IsChecksumValid());
}

TEST(CartridgeHeaderTest, TitleStopsAtCgbFlag) {
    auto rom = CartLink::Test::MakeRomImage("ZELDA", 0x1B, 0x10000);
    for (uint32_t i = 0; i < HeaderLayout::TITLE_LENGTH; ++i) rom[HeaderLayout::TITLE + i] = 'Z';
    rom[HeaderLayout::TITLE + 15] = 0x80;
    CartLink::Test::FixHeaderChecksum(rom);

    EXPECT_EQ(CartLink::Test::HeaderOf(rom).Title(), std::string(15, 'Z'));
}
