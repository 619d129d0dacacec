#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace CartLink::Cart {

    // Memory-bank controller family; selects the bank-switch and RAM unlock sequences.
    enum class MBCKind {
        None,
        One,
        Two,
        Other
    };

    const char* ToString(MBCKind kind);

    // Resolved once from the cartridge-type byte at 0x147.
    MBCKind MBCKindFromCartType(uint8_t cartType);

    struct HeaderLayout {
        static constexpr uint32_t START = 0x100;       // Header range start (entry point)
        static constexpr uint32_t END = 0x150;         // One past the global checksum
        static constexpr uint32_t SIZE = END - START;
        static constexpr uint32_t TITLE = 0x134;
        static constexpr uint32_t TITLE_LENGTH = 16;
        static constexpr uint32_t CART_TYPE = 0x147;
        static constexpr uint32_t ROM_SIZE = 0x148;
        static constexpr uint32_t RAM_SIZE = 0x149;
        static constexpr uint32_t HEADER_CHECKSUM = 0x14D;
    };

    static constexpr uint32_t ROM_BANK_SIZE = 0x4000;
    static constexpr uint32_t RAM_BANK_MAX_SIZE = 0x2000;
    static constexpr uint32_t MBC2_RAM_SIZE = 512;

    /**
     * Read-only view of a Game Boy cartridge header.
     *
     * Only the fields the reader needs are decoded; everything else stays in
     * the raw bytes.
     */
    class CartridgeHeader {
    public:
        CartridgeHeader() = default;

        /**
         * Parse the header range.
         * @param bytes Bytes starting at HeaderLayout::START (at least SIZE bytes)
         * @return The header, or nullopt when too few bytes are given
         */
        static std::optional<CartridgeHeader> FromBytes(const std::vector<uint8_t>& bytes);

        // Parse the header embedded in a full ROM image.
        static std::optional<CartridgeHeader> FromImage(const std::vector<uint8_t>& image);

        const std::string& Title() const { return title; }
        uint8_t CartType() const { return cartType; }
        MBCKind Configuration() const { return configuration; }

        uint32_t RomSize() const { return romSize; }
        uint32_t RomBankCount() const { return romSize / ROM_BANK_SIZE; }

        uint32_t RamSize() const { return ramSize; }
        uint32_t RamBankSize() const { return ramBankSize; }
        uint32_t RamBankCount() const { return ramBankSize == 0 ? 0 : ramSize / ramBankSize; }
        bool HasSaveRam() const { return ramSize > 0; }

        bool IsChecksumValid() const { return checksumValid; }
        const std::vector<uint8_t>& Bytes() const { return raw; }

    private:
        std::vector<uint8_t> raw;
        std::string title;
        uint8_t cartType = 0;
        MBCKind configuration = MBCKind::None;
        uint32_t romSize = 2 * ROM_BANK_SIZE;
        uint32_t ramSize = 0;
        uint32_t ramBankSize = 0;
        bool checksumValid = false;
    };

}
