#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace CartLink::Reader {

using ByteBuffer = std::vector<uint8_t>;

// Adapter protocol constants (timings are hardware requirements, not tunables)
struct ProtocolConsts {
    static constexpr uint32_t PAGE_SIZE = 64;                // Bytes per read page / write chunk
    static constexpr uint32_t BANK_SETTLE_US = 250;          // After a bank/address register select
    static constexpr uint32_t RAM_TOGGLE_SETTLE_US = 500;    // Before the RAM enable/disable value
    static constexpr uint32_t SRAM_BUS_TIMING_US = 3000;     // Before addressing SRAM after a RAM bank switch
    static constexpr char ACK = '1';                         // Adapter reply to each written chunk
};

struct StartCommand {};
struct StopCommand {};
struct ContinueCommand {};

struct SetAddressCommand {
    std::string reg;    // Register selector, e.g. "A", "B" or "\0A"
    int radix = 16;     // 8, 10 or 16
    uint32_t value = 0;
};

// Blocks the sending thread; nothing goes on the wire.
struct SleepCommand {
    uint32_t microseconds = 0;
};

struct WriteBytesCommand {
    ByteBuffer bytes;
};

// Single raw byte, e.g. 'G' (Game Boy mode) or '5' (5V)
struct ModeCommand {
    char mode = 'G';
};

// Address/value cycles the adapter replays before every programmed flash byte
struct FlashProgramMethodCommand {
    std::array<std::pair<uint32_t, uint8_t>, 3> cycles;
};

struct FlashWriteByteCommand {
    uint32_t address = 0;
    uint8_t value = 0;
};

struct FlashWriteBytesCommand {
    ByteBuffer bytes;
};

using ReaderCommand = std::variant<StartCommand,
                                   StopCommand,
                                   ContinueCommand,
                                   SetAddressCommand,
                                   SleepCommand,
                                   WriteBytesCommand,
                                   ModeCommand,
                                   FlashProgramMethodCommand,
                                   FlashWriteByteCommand,
                                   FlashWriteBytesCommand>;

using CommandList = std::vector<ReaderCommand>;

namespace Cmd {
    inline ReaderCommand Start() { return StartCommand{}; }
    inline ReaderCommand Stop() { return StopCommand{}; }
    inline ReaderCommand Continue() { return ContinueCommand{}; }
    inline ReaderCommand Address(std::string reg, int radix, uint32_t value) {
        return SetAddressCommand{std::move(reg), radix, value};
    }
    inline ReaderCommand Sleep(uint32_t microseconds) { return SleepCommand{microseconds}; }
    inline ReaderCommand Write(ByteBuffer bytes) { return WriteBytesCommand{std::move(bytes)}; }
    inline ReaderCommand Mode(char mode) { return ModeCommand{mode}; }
    inline ReaderCommand FlashWrite(uint32_t address, uint8_t value) {
        return FlashWriteByteCommand{address, value};
    }
    inline ReaderCommand FlashWrite(ByteBuffer bytes) { return FlashWriteBytesCommand{std::move(bytes)}; }
}

// Digits of value in radix (2..16), uppercase.
std::string FormatRadix(uint32_t value, int radix);

/**
 * Wire encoding of a command.
 * Sleep encodes to an empty buffer; the channel performs the delay.
 */
ByteBuffer Encode(const ReaderCommand& command);

// One-line trace form, e.g. ">>>: ADDR: B;16;4000 [42|34|30|30|30|00]"
std::string Describe(const ReaderCommand& command);

} // namespace CartLink::Reader
