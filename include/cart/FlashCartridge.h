#pragma once

#include "cart/FlashChip.h"
#include "reader/CommandChannel.h"

#include <cstdint>
#include <memory>
#include <string>

namespace CartLink::Cart {

    enum class Voltage {
        Low,    // 3.3V
        High    // 5V
    };

    /**
     * A flash cartridge the adapter can reprogram.
     *
     * PrepareForWrite() checks the voltage class, then issues the chip's
     * unlock/erase sequence. It returns false, with nothing sent, for parts
     * the Game Boy slot cannot drive.
     */
    class FlashCartridge {
    public:
        virtual ~FlashCartridge() = default;

        virtual std::string Name() const = 0;
        virtual Voltage GetVoltage() const = 0;
        virtual uint32_t Capacity() const = 0;

        bool PrepareForWrite(Reader::CommandChannel& channel) const;

    protected:
        virtual bool IssueWriteSequence(Reader::CommandChannel& channel) const = 0;
    };

    // AMD 16 Mbit (2 MiB) 5V NOR flash.
    class AM29F016B final : public FlashCartridge {
    public:
        static constexpr uint32_t CAPACITY = 2 * 1024 * 1024;
        static constexpr uint32_t CHIP_ERASE_US = 32'000'000;

        std::string Name() const override { return "AM29F016B"; }
        Voltage GetVoltage() const override { return Voltage::High; }
        uint32_t Capacity() const override { return CAPACITY; }

    protected:
        bool IssueWriteSequence(Reader::CommandChannel& channel) const override;
    };

    // nullptr for FlashChip::None.
    std::unique_ptr<FlashCartridge> MakeFlashCartridge(FlashChip chip);

}
