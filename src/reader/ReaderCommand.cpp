#include "reader/ReaderCommand.h"

#include "reader/Overloaded.h"

#include <cstdio>

namespace CartLink::Reader {

namespace {

void AppendString(ByteBuffer& out, const std::string& s) {
    out.insert(out.end(), s.begin(), s.end());
}

// Address and value strings are terminated by '\0' on the wire.
void AppendField(ByteBuffer& out, const std::string& s) {
    AppendString(out, s);
    out.push_back(0x00);
}

std::string HexBytes(const ByteBuffer& data) {
    std::string out;
    char buf[4];
    for (size_t i = 0; i < data.size(); ++i) {
        std::snprintf(buf, sizeof(buf), "%02X", data[i]);
        if (i != 0) out.push_back('|');
        out += buf;
    }
    return out;
}

} // namespace

std::string FormatRadix(uint32_t value, int radix) {
    static const char digits[] = "0123456789ABCDEF";
    if (radix < 2 || radix > 16) radix = 16;

    if (value == 0) return "0";

    std::string out;
    while (value != 0) {
        out.insert(out.begin(), digits[value % static_cast<uint32_t>(radix)]);
        value /= static_cast<uint32_t>(radix);
    }
    return out;
}

ByteBuffer Encode(const ReaderCommand& command) {
    ByteBuffer out;
    std::visit(Overloaded{
        [&](const StartCommand&) { out.push_back('R'); },
        [&](const StopCommand&) { out.push_back('0'); },
        [&](const ContinueCommand&) { out.push_back('1'); },
        [&](const SetAddressCommand& c) {
            AppendString(out, c.reg);
            AppendField(out, FormatRadix(c.value, c.radix));
        },
        [&](const SleepCommand&) {},
        [&](const WriteBytesCommand& c) {
            out.push_back('W');
            out.insert(out.end(), c.bytes.begin(), c.bytes.end());
        },
        [&](const ModeCommand& c) { out.push_back(static_cast<uint8_t>(c.mode)); },
        [&](const FlashProgramMethodCommand& c) {
            out.push_back('E');
            for (const auto& cycle : c.cycles) {
                AppendField(out, FormatRadix(cycle.first, 16));
                AppendField(out, FormatRadix(cycle.second, 16));
            }
        },
        [&](const FlashWriteByteCommand& c) {
            out.push_back('F');
            AppendField(out, FormatRadix(c.address, 16));
            AppendField(out, FormatRadix(c.value, 16));
        },
        [&](const FlashWriteBytesCommand& c) {
            out.push_back('T');
            out.insert(out.end(), c.bytes.begin(), c.bytes.end());
        },
    }, command);
    return out;
}

std::string Describe(const ReaderCommand& command) {
    std::string desc = ">>>: ";
    bool appendData = true;

    std::visit(Overloaded{
        [&](const StartCommand&) { desc += "START:"; },
        [&](const StopCommand&) { desc += "STOP:"; },
        [&](const ContinueCommand&) { desc += "CONT:"; },
        [&](const SetAddressCommand& c) {
            // Leading NULs in the selector are shown as '\0'
            std::string reg;
            for (char ch : c.reg) reg += (ch == '\0') ? std::string("\\0") : std::string(1, ch);
            desc += "ADDR: " + reg + ";" + std::to_string(c.radix) + ";" + FormatRadix(c.value, c.radix);
        },
        [&](const SleepCommand& c) {
            desc += "SLEEP: " + std::to_string(c.microseconds) + "u";
            appendData = false;
        },
        [&](const WriteBytesCommand& c) { desc += "WRT: " + std::to_string(c.bytes.size()); appendData = false; },
        [&](const ModeCommand& c) { desc += std::string("MODE: ") + c.mode; },
        [&](const FlashProgramMethodCommand&) { desc += "FLASH METHOD:"; },
        [&](const FlashWriteByteCommand& c) {
            desc += "FLASH: " + FormatRadix(c.address, 16) + "=" + FormatRadix(c.value, 16);
        },
        [&](const FlashWriteBytesCommand& c) { desc += "FLASH WRT: " + std::to_string(c.bytes.size()); appendData = false; },
    }, command);

    if (appendData) {
        desc += " [" + HexBytes(Encode(command)) + "]";
    }
    return desc;
}

} // namespace CartLink::Reader
