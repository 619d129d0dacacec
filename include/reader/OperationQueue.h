#pragma once

#include "common/Loggable.h"
#include "reader/SerialOperation.h"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace CartLink::Reader {

/**
 * @brief Strictly serial queue of reader operations.
 *
 * At most one operation is active; the next starts only after the active one
 * has run its completion. Operations run in the order they were enqueued.
 * Completions run without the queue lock held and may enqueue more work.
 */
class OperationQueue : public Common::Loggable {
public:
    OperationQueue(CommandChannel& channel, OperationDelegate& delegate);
    ~OperationQueue();

    OperationQueue(const OperationQueue&) = delete;
    OperationQueue& operator=(const OperationQueue&) = delete;

    OperationId Enqueue(OperationContext context, SerialOperation::Completion completion);

    // False if no pending or active operation has this id.
    bool Cancel(OperationId id);
    void CancelAll();

    bool IsIdle() const;
    std::size_t PendingCount() const;
    std::optional<OperationId> ActiveId() const;

    void SetProgressHandler(SerialOperation::ProgressHandler handler);

private:
    void StartNext();
    void OnFinished(SerialOperation& operation);

    CommandChannel& m_channel;
    OperationDelegate& m_delegate;

    mutable std::mutex m_mutex;
    std::deque<std::shared_ptr<SerialOperation>> m_pending;
    std::shared_ptr<SerialOperation> m_active;
    SerialOperation::ProgressHandler m_progress;
    OperationId m_nextId = 1;
    bool m_starting = false;
};

} // namespace CartLink::Reader
