#include "cart/FlashCartridge.h"

#include "common/Loggable.h"

#include <algorithm>
#include <cctype>

namespace CartLink::Cart {

    using Common::Logger;
    using Common::LogLevel;
    namespace LogCategory = Common::LogCategory;
    using Reader::Cmd::FlashWrite;

    const char* ToString(FlashChip chip) {
        switch (chip) {
            case FlashChip::None: return "none";
            case FlashChip::AM29F016B: return "AM29F016B";
        }
        return "none";
    }

    std::optional<FlashChip> ParseFlashChip(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower.empty() || lower == "none") return FlashChip::None;
        if (lower == "am29f016b") return FlashChip::AM29F016B;
        return std::nullopt;
    }

    bool FlashCartridge::PrepareForWrite(Reader::CommandChannel& channel) const {
        if (GetVoltage() != Voltage::High) {
            Logger::Instance().LogFmt(LogLevel::Error, LogCategory::Flash,
                                      "%s is a 3.3V part; refusing to program it", Name().c_str());
            return false;
        }

        Logger::Instance().LogFmt(LogLevel::Info, LogCategory::Flash, "Preparing %s for writing", Name().c_str());
        if (!IssueWriteSequence(channel)) {
            return false;
        }
        return !channel.Failed();
    }

    bool AM29F016B::IssueWriteSequence(Reader::CommandChannel& channel) const {
        Reader::FlashProgramMethodCommand method;
        method.cycles = {{{0x555, 0xAA}, {0x2AA, 0x55}, {0x555, 0xA0}}};

        return channel.SendAll({
            Reader::Cmd::Mode('5'),
            method,
            // Back to read-array mode
            FlashWrite(0x000, 0xF0),
            // Chip erase
            FlashWrite(0x555, 0xAA),
            FlashWrite(0x2AA, 0x55),
            FlashWrite(0x555, 0x80),
            FlashWrite(0x555, 0xAA),
            FlashWrite(0x2AA, 0x55),
            FlashWrite(0x555, 0x10),
            // Erase completion is not polled
            Reader::Cmd::Sleep(CHIP_ERASE_US),
        });
    }

    std::unique_ptr<FlashCartridge> MakeFlashCartridge(FlashChip chip) {
        switch (chip) {
            case FlashChip::AM29F016B: return std::make_unique<AM29F016B>();
            case FlashChip::None: break;
        }
        return nullptr;
    }

}
