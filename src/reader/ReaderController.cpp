#include "reader/ReaderController.h"

#include <utility>

namespace CartLink::Reader {

ReaderController::ReaderController(IO::Transport& transport, const Common::ReaderSettings& settings)
    : Loggable(Common::LogCategory::Reader),
      m_channel(transport),
      m_flash(Cart::MakeFlashCartridge(settings.flashChip)),
      m_stateMachine(m_channel, m_flash.get()),
      m_queue(m_channel, m_stateMachine),
      m_traceProgress(settings.traceProgress) {
    m_channel.SetTraceEnabled(settings.traceCommands);
    SetProgressHandler(nullptr);
}

ReaderController::~ReaderController() {
    m_queue.CancelAll();
}

void ReaderController::SetProgressHandler(SerialOperation::ProgressHandler handler) {
    m_queue.SetProgressHandler([this, handler = std::move(handler)](OperationId id, uint64_t completed, uint64_t total) {
        if (m_traceProgress) {
            LogDebug("#%llu: %llu / %llu", static_cast<unsigned long long>(id),
                     static_cast<unsigned long long>(completed), static_cast<unsigned long long>(total));
        }
        if (handler) handler(id, completed, total);
    });
}

void ReaderController::CancelAll() {
    m_queue.CancelAll();
}

bool ReaderController::IsIdle() const {
    return m_queue.IsIdle();
}

void ReaderController::ReadHeader(Callback<Cart::CartridgeHeader> callback) {
    m_queue.Enqueue(HeaderContext{}, [this, callback = std::move(callback)](SerialOperation& op) {
        if (op.Error() != ReaderError::None) {
            callback(Result<Cart::CartridgeHeader>::Failure(op.Error()));
            return;
        }

        auto header = Cart::CartridgeHeader::FromBytes(op.Data());
        if (!header) {
            LogError("Header read returned %zu bytes", op.Data().size());
            callback(Result<Cart::CartridgeHeader>::Failure(ReaderError::UnsupportedContext));
            return;
        }
        if (!header->IsChecksumValid()) {
            LogWarn("Header checksum mismatch for '%s'", header->Title().c_str());
        }
        LogInfo("'%s' %s, %u ROM banks, %u bytes RAM", header->Title().c_str(),
                Cart::ToString(header->Configuration()), header->RomBankCount(), header->RamSize());
        callback(Result<Cart::CartridgeHeader>::Success(*header));
    });
}

void ReaderController::WithHeader(std::function<void(const Cart::CartridgeHeader&)> next,
                                  std::function<void(ReaderError)> onError) {
    ReadHeader([next = std::move(next), onError = std::move(onError)](Result<Cart::CartridgeHeader> result) {
        if (!result) {
            onError(result.Error());
            return;
        }
        next(result.Value());
    });
}

void ReaderController::ReadCartridge(Callback<CartridgeDump> callback) {
    auto fail = [callback](ReaderError error) { callback(Result<CartridgeDump>::Failure(error)); };

    WithHeader([this, callback](const Cart::CartridgeHeader& header) {
        CartridgeContext context;
        context.header = header;
        context.intent = Intent::Read;

        m_queue.Enqueue(context, [callback, header](SerialOperation& op) {
            if (op.Error() != ReaderError::None) {
                callback(Result<CartridgeDump>::Failure(op.Error()));
                return;
            }
            CartridgeDump dump;
            dump.rom = op.TakeData();
            dump.header = header;
            callback(Result<CartridgeDump>::Success(std::move(dump)));
        });
    }, fail);
}

void ReaderController::ReadSaveFile(Callback<ByteBuffer> callback) {
    auto fail = [callback](ReaderError error) { callback(Result<ByteBuffer>::Failure(error)); };

    WithHeader([this, callback, fail](const Cart::CartridgeHeader& header) {
        if (!header.HasSaveRam() || header.RamBankSize() == 0) {
            LogError("'%s' has no save RAM", header.Title().c_str());
            fail(ReaderError::UnsupportedContext);
            return;
        }

        SaveFileContext context;
        context.header = header;
        context.intent = Intent::Read;

        m_queue.Enqueue(context, [callback](SerialOperation& op) {
            if (op.Error() != ReaderError::None) {
                callback(Result<ByteBuffer>::Failure(op.Error()));
                return;
            }
            callback(Result<ByteBuffer>::Success(op.TakeData()));
        });
    }, fail);
}

void ReaderController::WriteSaveFile(ByteBuffer data, Callback<uint64_t> callback) {
    auto fail = [callback](ReaderError error) { callback(Result<uint64_t>::Failure(error)); };
    auto payload = std::make_shared<const ByteBuffer>(std::move(data));

    WithHeader([this, callback, fail, payload](const Cart::CartridgeHeader& header) {
        if (!header.HasSaveRam() || header.RamBankSize() == 0) {
            LogError("'%s' has no save RAM", header.Title().c_str());
            fail(ReaderError::UnsupportedContext);
            return;
        }
        if (payload->size() != header.RamSize()) {
            LogError("Save file is %zu bytes; '%s' has %u bytes of RAM", payload->size(),
                     header.Title().c_str(), header.RamSize());
            fail(ReaderError::UnsupportedContext);
            return;
        }

        SaveFileContext context;
        context.header = header;
        context.intent = Intent::Write;
        context.data = payload;

        m_queue.Enqueue(context, [callback](SerialOperation& op) {
            if (op.Error() != ReaderError::None) {
                callback(Result<uint64_t>::Failure(op.Error()));
                return;
            }
            callback(Result<uint64_t>::Success(op.CompletedBytes()));
        });
    }, fail);
}

void ReaderController::WriteFlashImage(ByteBuffer image, Callback<uint64_t> callback) {
    if (image.size() < 2 * Cart::ROM_BANK_SIZE || image.size() % Cart::ROM_BANK_SIZE != 0) {
        LogError("Flash image of %zu bytes is not a whole number of ROM banks", image.size());
        callback(Result<uint64_t>::Failure(ReaderError::UnsupportedContext));
        return;
    }
    if (m_flash && image.size() > m_flash->Capacity()) {
        LogError("Flash image of %zu bytes does not fit %s (%u bytes)", image.size(),
                 m_flash->Name().c_str(), m_flash->Capacity());
        callback(Result<uint64_t>::Failure(ReaderError::UnsupportedContext));
        return;
    }

    auto header = Cart::CartridgeHeader::FromImage(image);
    if (!header) {
        callback(Result<uint64_t>::Failure(ReaderError::UnsupportedContext));
        return;
    }

    CartridgeContext context;
    context.header = *header;
    context.intent = Intent::Write;
    context.image = std::make_shared<const ByteBuffer>(std::move(image));

    m_queue.Enqueue(context, [callback = std::move(callback)](SerialOperation& op) {
        if (op.Error() != ReaderError::None) {
            callback(Result<uint64_t>::Failure(op.Error()));
            return;
        }
        callback(Result<uint64_t>::Success(op.CompletedBytes()));
    });
}

} // namespace CartLink::Reader
