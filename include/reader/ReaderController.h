#pragma once

#include "cart/CartridgeHeader.h"
#include "cart/FlashCartridge.h"
#include "common/Loggable.h"
#include "common/Settings.h"
#include "io/Transport.h"
#include "reader/ClassicStateMachine.h"
#include "reader/CommandChannel.h"
#include "reader/OperationQueue.h"
#include "reader/ReaderError.h"

#include <functional>
#include <memory>

namespace CartLink::Reader {

struct CartridgeDump {
    ByteBuffer rom;
    Cart::CartridgeHeader header;
};

/**
 * @brief Asynchronous front door to the adapter.
 *
 * Every call yields exactly once through its callback, on the thread that
 * delivers transport data (or the caller's thread when the request is
 * rejected up front). Calls queue behind each other.
 */
class ReaderController : public Common::Loggable {
public:
    template <typename T>
    using Callback = std::function<void(Result<T>)>;

    ReaderController(IO::Transport& transport, const Common::ReaderSettings& settings);
    ~ReaderController();

    ReaderController(const ReaderController&) = delete;
    ReaderController& operator=(const ReaderController&) = delete;

    void ReadHeader(Callback<Cart::CartridgeHeader> callback);
    void ReadCartridge(Callback<CartridgeDump> callback);
    void ReadSaveFile(Callback<ByteBuffer> callback);

    // Yields the number of bytes written.
    void WriteSaveFile(ByteBuffer data, Callback<uint64_t> callback);
    void WriteFlashImage(ByteBuffer image, Callback<uint64_t> callback);

    void SetProgressHandler(SerialOperation::ProgressHandler handler);
    void CancelAll();
    bool IsIdle() const;

    CommandChannel& Channel() { return m_channel; }
    const Cart::FlashCartridge* Flash() const { return m_flash.get(); }

private:
    // Reads the header, then hands it on; header failures go straight to `onError`.
    void WithHeader(std::function<void(const Cart::CartridgeHeader&)> next,
                    std::function<void(ReaderError)> onError);

    CommandChannel m_channel;
    std::unique_ptr<Cart::FlashCartridge> m_flash;
    ClassicStateMachine m_stateMachine;
    OperationQueue m_queue;
    bool m_traceProgress = false;
};

} // namespace CartLink::Reader
