#pragma once

#include "common/Loggable.h"
#include "io/Transport.h"
#include "reader/CommandChannel.h"
#include "reader/OperationDelegate.h"
#include "reader/PageTrigger.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace CartLink::Reader {

using OperationId = uint64_t;

/**
 * One top-level transfer (header, cartridge or save file) on the wire.
 *
 * Start() opens the connection, leases the transport and sends will-begin
 * and did-begin for the top-level context; each planned step then gets its
 * own will-begin, did-begin, progress per page and did-complete. The lease
 * is released before the final did-complete, and the completion callback
 * runs exactly once whether the transfer finished, failed or was cancelled.
 */
class SerialOperation final : public IO::TransportListener,
                              private OperationControl,
                              public Common::Loggable,
                              public std::enable_shared_from_this<SerialOperation> {
public:
    enum class Phase {
        Pending,
        Beginning,
        Transferring,
        Completing,
        Finished
    };

    using Completion = std::function<void(SerialOperation&)>;
    using ProgressHandler = std::function<void(OperationId id, uint64_t completed, uint64_t total)>;

    SerialOperation(OperationId id,
                    OperationContext context,
                    CommandChannel& channel,
                    OperationDelegate& delegate,
                    Completion completion);
    ~SerialOperation() override;

    void Start();

    // Stops issuing commands; an active transfer also drops the lease and closes the connection.
    void Cancel();

    void OnBytesReceived(const std::vector<uint8_t>& bytes) override;

    void SetProgressHandler(ProgressHandler handler) { m_progress = std::move(handler); }

    OperationId Id() const { return m_id; }
    const OperationContext& Context() const { return m_context; }
    Phase CurrentPhase() const { return m_phase; }
    bool IsFinished() const { return m_phase == Phase::Finished; }
    ReaderError Error() const { return m_error; }

    // Bytes read so far, in cartridge order.
    const ByteBuffer& Data() const { return m_data; }
    ByteBuffer TakeData() { return std::move(m_data); }

    uint64_t CompletedBytes() const { return m_totalCompleted; }
    uint64_t TotalBytes() const { return m_totalBytes; }

private:
    void DiscardIncoming(uint32_t count) override;

    // False once the operation has stopped.
    bool Dispatch(LifecycleEvent event, const OperationContext& context, uint64_t completed = 0);

    void BeginStep();
    void CompleteStep();
    void CompleteOperation();
    void Abort(ReaderError error);
    void Finish(ReaderError error);

    void ReportProgress();

    OperationId m_id;
    OperationContext m_context;
    CommandChannel& m_channel;
    OperationDelegate& m_delegate;
    Completion m_completion;
    ProgressHandler m_progress;

    std::vector<TransferStep> m_steps;
    std::size_t m_stepIndex = 0;
    bool m_stepActive = false;
    uint64_t m_stepCompleted = 0;
    PageTrigger m_trigger;

    uint32_t m_discardRemaining = 0;
    uint64_t m_totalCompleted = 0;
    uint64_t m_totalBytes = 0;

    std::optional<IO::TransportLease> m_lease;
    Phase m_phase = Phase::Pending;
    ReaderError m_error = ReaderError::None;
    ByteBuffer m_data;
};

} // namespace CartLink::Reader
