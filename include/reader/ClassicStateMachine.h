#pragma once

#include "cart/FlashCartridge.h"
#include "common/Loggable.h"
#include "reader/CommandChannel.h"
#include "reader/OperationDelegate.h"

#include <string>

namespace CartLink::Reader {

/**
 * Lifecycle handlers for Game Boy (classic) cartridges.
 *
 * Turns each lifecycle event of the active context into adapter commands:
 * bank and RAM switching before a transfer, Start or the first write chunk
 * when it begins, Continue or the next chunk on every page, and Stop plus
 * closing the connection when a top-level transfer completes.
 */
class ClassicStateMachine final : public OperationDelegate, public Common::Loggable {
public:
    /**
     * @param channel Command sink shared with the operations.
     * @param flash   Flash chip of the attached cartridge, or nullptr when the
     *                cartridge cannot be written.
     */
    ClassicStateMachine(CommandChannel& channel, const Cart::FlashCartridge* flash);

    ReaderError Handle(const LifecycleUpdate& update,
                       const OperationContext& context,
                       OperationControl& control) override;

    // Register selector of the "set read address" command ('\0' then 'A').
    static const std::string kReadAddressRegister;

private:
    ReaderError WillBegin(const OperationContext& context, OperationControl& control);
    ReaderError DidBegin(const OperationContext& context);
    ReaderError DidUpdateProgress(const OperationContext& context, uint64_t completed);
    ReaderError DidComplete(const OperationContext& context);

    ReaderError PrepareFlashWrite(const CartridgeContext& cart);

    // Sends payload[offset, offset + PAGE_SIZE) as one chunk
    ReaderError SendChunk(const std::shared_ptr<const ByteBuffer>& payload, uint64_t offset, bool flash);

    void ToggleRamMode(bool on);

    // Maps a failed send to TransportWriteFailed.
    ReaderError ChannelStatus() const;

    CommandChannel& m_channel;
    const Cart::FlashCartridge* m_flash;
};

} // namespace CartLink::Reader
