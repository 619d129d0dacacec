#include "reader/ClassicStateMachine.h"

#include "reader/BankSwitch.h"
#include "reader/Overloaded.h"

#include <algorithm>

namespace CartLink::Reader {

const std::string ClassicStateMachine::kReadAddressRegister("\0A", 2);

const char* ToString(LifecycleEvent event) {
    switch (event) {
        case LifecycleEvent::WillBegin: return "willBegin";
        case LifecycleEvent::DidBegin: return "didBegin";
        case LifecycleEvent::Progress: return "progress";
        case LifecycleEvent::DidComplete: return "didComplete";
    }
    return "unknown";
}

ClassicStateMachine::ClassicStateMachine(CommandChannel& channel, const Cart::FlashCartridge* flash)
    : Loggable(Common::LogCategory::Reader), m_channel(channel), m_flash(flash) {}

ReaderError ClassicStateMachine::Handle(const LifecycleUpdate& update,
                                        const OperationContext& context,
                                        OperationControl& control) {
    if (update.event != LifecycleEvent::Progress) {
        LogDebug("%s %s", ToString(update.event), Describe(context).c_str());
    }

    switch (update.event) {
        case LifecycleEvent::WillBegin: return WillBegin(context, control);
        case LifecycleEvent::DidBegin: return DidBegin(context);
        case LifecycleEvent::Progress: return DidUpdateProgress(context, update.completedUnitCount);
        case LifecycleEvent::DidComplete: return DidComplete(context);
    }
    return ReaderError::None;
}

ReaderError ClassicStateMachine::ChannelStatus() const {
    return m_channel.Failed() ? ReaderError::TransportWriteFailed : ReaderError::None;
}

void ClassicStateMachine::ToggleRamMode(bool on) {
    m_channel.SendAll(RamModeCommands(on));
}

ReaderError ClassicStateMachine::WillBegin(const OperationContext& context, OperationControl& control) {
    return std::visit(Overloaded{
        [&](const HeaderContext&) {
            ToggleRamMode(false);
            m_channel.SendAll({
                Cmd::Sleep(ProtocolConsts::BANK_SETTLE_US),
                Cmd::Address(kReadAddressRegister, 16, Cart::HeaderLayout::START),
            });
            return ChannelStatus();
        },
        [&](const BankContext& bank) {
            m_channel.Send(Cmd::Stop());
            m_channel.SendAll(BankSwitchCommands(bank.number, bank.cartridge.header));
            m_channel.Send(Cmd::Address(kReadAddressRegister, 16, BankReadAddress(bank.number)));
            return ChannelStatus();
        },
        [&](const SaveFileContext& save) {
            const Cart::MBCKind configuration = save.header.Configuration();

            // RAM reads back garbage on MBC1/MBC2 unless one ROM page is read
            // first. The page is dropped before the first RAM bank.
            if (configuration == Cart::MBCKind::One || configuration == Cart::MBCKind::Two) {
                m_channel.SendAll({
                    Cmd::Address(kReadAddressRegister, 16, 0x0000),
                    Cmd::Start(),
                    Cmd::Stop(),
                });
                control.DiscardIncoming(ProtocolConsts::PAGE_SIZE);
            }

            if (configuration == Cart::MBCKind::One) {
                m_channel.SendAll(RamBankingModeCommands());
            }

            ToggleRamMode(true);
            return ChannelStatus();
        },
        [&](const SramContext& sram) {
            if (sram.saveFile.header.RamBankSize() == 0) {
                LogError("sram(%u): cartridge has no save RAM", sram.bank);
                return ReaderError::UnsupportedContext;
            }
            m_channel.Send(Cmd::Stop());
            m_channel.SendAll(RamBankCommands(sram.bank));
            m_channel.SendAll({
                Cmd::Sleep(ProtocolConsts::SRAM_BUS_TIMING_US),
                Cmd::Address("A", 16, 0xA000),
            });
            return ChannelStatus();
        },
        [&](const CartridgeContext& cart) {
            if (cart.intent == Intent::Write) {
                return PrepareFlashWrite(cart);
            }
            return ReaderError::None;
        },
    }, context);
}

ReaderError ClassicStateMachine::PrepareFlashWrite(const CartridgeContext& cart) {
    // Checked before anything reaches the wire
    if (m_flash == nullptr) {
        LogError("No supported flash chip configured for '%s'", cart.header.Title().c_str());
        return ReaderError::UnsupportedFlashChip;
    }

    // Game Boy mode
    m_channel.Send(Cmd::Mode('G'));

    if (!m_flash->PrepareForWrite(m_channel)) {
        if (m_channel.Failed()) return ReaderError::TransportWriteFailed;
        return ReaderError::UnsupportedFlashChip;
    }
    return ChannelStatus();
}

ReaderError ClassicStateMachine::SendChunk(const std::shared_ptr<const ByteBuffer>& payload,
                                           uint64_t offset, bool flash) {
    if (!payload || offset >= payload->size()) {
        LogError("Write chunk at 0x%llx is outside the %zu byte payload",
                 static_cast<unsigned long long>(offset), payload ? payload->size() : size_t{0});
        return ReaderError::UnsupportedContext;
    }

    const auto first = payload->begin() + static_cast<std::ptrdiff_t>(offset);
    const auto count = std::min<uint64_t>(ProtocolConsts::PAGE_SIZE, payload->size() - offset);
    ByteBuffer chunk(first, first + static_cast<std::ptrdiff_t>(count));

    m_channel.Send(flash ? Cmd::FlashWrite(std::move(chunk)) : Cmd::Write(std::move(chunk)));
    return ChannelStatus();
}

ReaderError ClassicStateMachine::DidBegin(const OperationContext& context) {
    return std::visit(Overloaded{
        [&](const HeaderContext&) {
            m_channel.Send(Cmd::Start());
            return ChannelStatus();
        },
        [&](const BankContext& bank) {
            if (bank.cartridge.intent == Intent::Write) {
                return SendChunk(bank.cartridge.image, BankImageOffset(bank.number), true);
            }
            m_channel.Send(Cmd::Start());
            return ChannelStatus();
        },
        [&](const SramContext& sram) {
            const SaveFileContext& save = sram.saveFile;
            if (save.intent == Intent::Write) {
                const uint64_t startAddress = uint64_t{sram.bank} * save.header.RamBankSize();
                return SendChunk(save.data, startAddress, false);
            }
            m_channel.Send(Cmd::Start());
            return ChannelStatus();
        },
        [&](const CartridgeContext&) { return ReaderError::None; },
        [&](const SaveFileContext&) { return ReaderError::None; },
    }, context);
}

ReaderError ClassicStateMachine::DidUpdateProgress(const OperationContext& context, uint64_t completed) {
    if (completed % ProtocolConsts::PAGE_SIZE != 0) {
        return ReaderError::None;
    }

    return std::visit(Overloaded{
        [&](const SramContext& sram) {
            const SaveFileContext& save = sram.saveFile;
            if (save.intent == Intent::Write) {
                const uint64_t offset = uint64_t{sram.bank} * save.header.RamBankSize() + completed;
                return SendChunk(save.data, offset, false);
            }
            m_channel.Send(Cmd::Continue());
            return ChannelStatus();
        },
        [&](const BankContext& bank) {
            if (bank.cartridge.intent == Intent::Write) {
                return SendChunk(bank.cartridge.image, BankImageOffset(bank.number) + completed, true);
            }
            m_channel.Send(Cmd::Continue());
            return ChannelStatus();
        },
        [&](const SaveFileContext& save) {
            if (save.intent == Intent::Read) {
                m_channel.Send(Cmd::Continue());
            }
            return ChannelStatus();
        },
        [&](const CartridgeContext& cart) {
            if (cart.intent == Intent::Read) {
                m_channel.Send(Cmd::Continue());
            }
            return ChannelStatus();
        },
        [&](const HeaderContext&) {
            m_channel.Send(Cmd::Continue());
            return ChannelStatus();
        },
    }, context);
}

ReaderError ClassicStateMachine::DidComplete(const OperationContext& context) {
    return std::visit(Overloaded{
        [&](const CartridgeContext&) {
            m_channel.CloseConnection();
            return ChannelStatus();
        },
        [&](const SaveFileContext&) {
            ToggleRamMode(false);
            m_channel.Send(Cmd::Stop());
            m_channel.CloseConnection();
            return ChannelStatus();
        },
        [&](const HeaderContext&) {
            m_channel.Send(Cmd::Stop());
            m_channel.CloseConnection();
            return ChannelStatus();
        },
        // The enclosing cartridge or save-file transfer closes the connection
        [&](const BankContext&) { return ReaderError::None; },
        [&](const SramContext&) { return ReaderError::None; },
    }, context);
}

} // namespace CartLink::Reader
