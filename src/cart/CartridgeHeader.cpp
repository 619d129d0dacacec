#include "cart/CartridgeHeader.h"

#include <algorithm>

namespace CartLink::Cart {

    const char* ToString(MBCKind kind) {
        switch (kind) {
            case MBCKind::None: return "none";
            case MBCKind::One: return "MBC1";
            case MBCKind::Two: return "MBC2";
            case MBCKind::Other: return "other";
        }
        return "other";
    }

    MBCKind MBCKindFromCartType(uint8_t cartType) {
        switch (cartType) {
            case 0x00: // ROM ONLY
            case 0x08: // ROM+RAM
            case 0x09: // ROM+RAM+BATTERY
                return MBCKind::None;
            case 0x01: // MBC1
            case 0x02: // MBC1+RAM
            case 0x03: // MBC1+RAM+BATTERY
                return MBCKind::One;
            case 0x05: // MBC2
            case 0x06: // MBC2+BATTERY
                return MBCKind::Two;
            default:
                return MBCKind::Other;
        }
    }

    static uint32_t RomSizeFromCode(uint8_t code) {
        if (code <= 0x08) {
            return 0x8000u << code;
        }
        // Odd-sized 0x52-0x54 carts are read as the smallest image
        return 0x8000u;
    }

    static uint32_t RamSizeFromCode(uint8_t code) {
        switch (code) {
            case 0x01: return 2048;
            case 0x02: return 8192;
            case 0x03: return 32768;
            case 0x04: return 131072;
            case 0x05: return 65536;
            default: return 0;
        }
    }

    std::optional<CartridgeHeader> CartridgeHeader::FromBytes(const std::vector<uint8_t>& bytes) {
        if (bytes.size() < HeaderLayout::SIZE) {
            return std::nullopt;
        }

        auto at = [&bytes](uint32_t address) { return bytes[address - HeaderLayout::START]; };

        CartridgeHeader header;
        header.raw.assign(bytes.begin(), bytes.begin() + HeaderLayout::SIZE);

        // Title is null padded; CGB titles reuse the last bytes for flags.
        for (uint32_t i = 0; i < HeaderLayout::TITLE_LENGTH; ++i) {
            const uint8_t c = at(HeaderLayout::TITLE + i);
            if (c == 0x00 || c >= 0x80) break;
            header.title.push_back(static_cast<char>(c));
        }

        header.cartType = at(HeaderLayout::CART_TYPE);
        header.configuration = MBCKindFromCartType(header.cartType);
        header.romSize = RomSizeFromCode(at(HeaderLayout::ROM_SIZE));

        if (header.configuration == MBCKind::Two) {
            header.ramSize = MBC2_RAM_SIZE;
            header.ramBankSize = MBC2_RAM_SIZE;
        } else {
            header.ramSize = RamSizeFromCode(at(HeaderLayout::RAM_SIZE));
            header.ramBankSize = std::min(header.ramSize, RAM_BANK_MAX_SIZE);
        }

        uint8_t checksum = 0;
        for (uint32_t address = HeaderLayout::TITLE; address < HeaderLayout::HEADER_CHECKSUM; ++address) {
            checksum = static_cast<uint8_t>(checksum - at(address) - 1);
        }
        header.checksumValid = (checksum == at(HeaderLayout::HEADER_CHECKSUM));

        return header;
    }

    std::optional<CartridgeHeader> CartridgeHeader::FromImage(const std::vector<uint8_t>& image) {
        if (image.size() < HeaderLayout::END) {
            return std::nullopt;
        }
        return FromBytes(std::vector<uint8_t>(image.begin() + HeaderLayout::START,
                                              image.begin() + HeaderLayout::END));
    }

}
