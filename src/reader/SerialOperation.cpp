#include "reader/SerialOperation.h"

#include <algorithm>

namespace CartLink::Reader {

SerialOperation::SerialOperation(OperationId id,
                                 OperationContext context,
                                 CommandChannel& channel,
                                 OperationDelegate& delegate,
                                 Completion completion)
    : Loggable(Common::LogCategory::Reader),
      m_id(id),
      m_context(std::move(context)),
      m_channel(channel),
      m_delegate(delegate),
      m_completion(std::move(completion)) {
    m_steps = PlanTransfer(m_context);
    m_totalBytes = Reader::TotalBytes(m_steps);

    if (IntentOf(m_context) == Intent::Read) {
        m_data.reserve(static_cast<std::size_t>(m_totalBytes));
    }
}

SerialOperation::~SerialOperation() = default;

void SerialOperation::Start() {
    if (m_phase != Phase::Pending) return;
    auto self = shared_from_this();

    m_channel.ResetFailure();
    IO::Transport& transport = m_channel.GetTransport();

    if (!transport.IsOpen() && !transport.Open()) {
        LogError("#%llu %s: could not open the connection",
                 static_cast<unsigned long long>(m_id), Describe(m_context).c_str());
        Finish(ReaderError::TransportOpenFailed);
        return;
    }

    m_lease.emplace(transport, *this);
    if (!m_lease->Valid()) {
        LogError("#%llu: transport is bound to another operation", static_cast<unsigned long long>(m_id));
        m_lease.reset();
        Finish(ReaderError::TransportOpenFailed);
        return;
    }

    LogInfo("#%llu %s: %llu bytes in %zu steps", static_cast<unsigned long long>(m_id),
            Describe(m_context).c_str(), static_cast<unsigned long long>(m_totalBytes), m_steps.size());

    m_phase = Phase::Beginning;
    if (!Dispatch(LifecycleEvent::WillBegin, m_context)) return;
    if (!Dispatch(LifecycleEvent::DidBegin, m_context)) return;

    m_phase = Phase::Transferring;
    if (m_discardRemaining == 0) {
        BeginStep();
    }
}

void SerialOperation::Cancel() {
    if (m_phase == Phase::Finished) return;
    auto self = shared_from_this();

    LogInfo("#%llu %s: cancelled", static_cast<unsigned long long>(m_id), Describe(m_context).c_str());
    if (m_phase == Phase::Pending) {
        Finish(ReaderError::Cancelled);
        return;
    }
    Abort(ReaderError::Cancelled);
}

void SerialOperation::DiscardIncoming(uint32_t count) {
    m_discardRemaining += count;
}

bool SerialOperation::Dispatch(LifecycleEvent event, const OperationContext& context, uint64_t completed) {
    if (m_phase == Phase::Finished) return false;

    LifecycleUpdate update;
    update.event = event;
    update.completedUnitCount = completed;

    ReaderError error = m_delegate.Handle(update, context, *this);
    if (error == ReaderError::None && m_channel.Failed()) {
        error = ReaderError::TransportWriteFailed;
    }

    if (error != ReaderError::None) {
        LogError("#%llu %s %s: %s", static_cast<unsigned long long>(m_id), ToString(event),
                 Describe(context).c_str(), ToString(error));
        Abort(error);
        return false;
    }
    return m_phase != Phase::Finished;
}

void SerialOperation::BeginStep() {
    if (m_phase != Phase::Transferring) return;
    if (m_stepIndex >= m_steps.size()) {
        CompleteOperation();
        return;
    }

    const TransferStep& step = m_steps[m_stepIndex];
    m_stepCompleted = 0;
    m_stepActive = true;

    // The first page is requested by did-begin
    m_trigger.Reset();
    m_trigger.Prime(0);

    // A header read is its own single step; the top-level events already covered it.
    if (!IsTopLevel(step.context)) {
        if (!Dispatch(LifecycleEvent::WillBegin, step.context)) return;
        if (!Dispatch(LifecycleEvent::DidBegin, step.context)) return;
    }

    if (step.byteCount == 0) {
        CompleteStep();
    }
}

void SerialOperation::CompleteStep() {
    m_stepActive = false;
    if (m_phase != Phase::Transferring) return;
    const TransferStep& step = m_steps[m_stepIndex];
    if (!IsTopLevel(step.context) && !Dispatch(LifecycleEvent::DidComplete, step.context)) return;

    ++m_stepIndex;
    BeginStep();
}

void SerialOperation::CompleteOperation() {
    if (m_phase != Phase::Transferring) return;
    m_phase = Phase::Completing;

    // Detach before the closing commands go out
    m_lease.reset();

    LifecycleUpdate update;
    update.event = LifecycleEvent::DidComplete;
    ReaderError error = m_delegate.Handle(update, m_context, *this);
    if (error == ReaderError::None && m_channel.Failed()) {
        error = ReaderError::TransportWriteFailed;
    }

    if (error != ReaderError::None) {
        m_channel.CloseConnection();
    }
    Finish(error);
}

void SerialOperation::Abort(ReaderError error) {
    if (m_phase == Phase::Finished) return;

    // A partial transfer cannot be resumed; drop the connection.
    m_lease.reset();
    m_stepActive = false;
    m_channel.CloseConnection();
    Finish(error);
}

void SerialOperation::Finish(ReaderError error) {
    if (m_phase == Phase::Finished) return;

    m_phase = Phase::Finished;
    m_error = error;

    if (error == ReaderError::None) {
        LogInfo("#%llu %s: done (%llu bytes)", static_cast<unsigned long long>(m_id),
                Describe(m_context).c_str(), static_cast<unsigned long long>(m_totalCompleted));
    }

    Completion completion = std::move(m_completion);
    m_completion = nullptr;
    if (completion) completion(*this);
}

void SerialOperation::ReportProgress() {
    if (m_progress) m_progress(m_id, m_totalCompleted, m_totalBytes);
}

void SerialOperation::OnBytesReceived(const std::vector<uint8_t>& bytes) {
    if (m_phase != Phase::Transferring) {
        LogDebug("#%llu: ignoring %zu bytes outside the transfer", static_cast<unsigned long long>(m_id),
                 bytes.size());
        return;
    }
    auto self = shared_from_this();

    std::size_t i = 0;

    if (m_discardRemaining > 0) {
        const auto skipped = static_cast<uint32_t>(std::min<std::size_t>(m_discardRemaining, bytes.size()));
        m_discardRemaining -= skipped;
        i += skipped;

        if (m_discardRemaining == 0 && !m_stepActive && m_stepIndex == 0) {
            BeginStep();
            // Anything after the discarded bytes predates the new step's commands.
            return;
        }
    }

    while (i < bytes.size() && m_phase == Phase::Transferring && m_stepActive) {
        const TransferStep& step = m_steps[m_stepIndex];
        uint64_t advanced = 0;

        if (step.intent == Intent::Read) {
            const std::size_t take = static_cast<std::size_t>(
                std::min<uint64_t>(bytes.size() - i, step.byteCount - m_stepCompleted));
            m_data.insert(m_data.end(), bytes.begin() + static_cast<std::ptrdiff_t>(i),
                          bytes.begin() + static_cast<std::ptrdiff_t>(i + take));
            i += take;
            advanced = take;
        } else {
            // One acknowledgement per written page
            const uint8_t reply = bytes[i++];
            if (reply != static_cast<uint8_t>(ProtocolConsts::ACK)) {
                LogWarn("#%llu: unexpected reply 0x%02X while writing", static_cast<unsigned long long>(m_id),
                        reply);
                continue;
            }
            advanced = std::min<uint64_t>(ProtocolConsts::PAGE_SIZE, step.byteCount - m_stepCompleted);
        }

        m_stepCompleted += advanced;
        m_totalCompleted += advanced;
        ReportProgress();
        // Cancelled from the progress handler
        if (m_phase != Phase::Transferring) return;

        if (m_stepCompleted >= step.byteCount) {
            // Whatever else is in this chunk is past the end of the step.
            CompleteStep();
            return;
        }

        const OperationContext& stepContext = step.context;
        m_trigger.Update(m_stepCompleted, [&](uint64_t boundary) {
            if (m_phase == Phase::Transferring) Dispatch(LifecycleEvent::Progress, stepContext, boundary);
        });
    }
}

} // namespace CartLink::Reader
