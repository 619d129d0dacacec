#include "reader/OperationQueue.h"

#include <algorithm>
#include <utility>
#include <vector>

namespace CartLink::Reader {

OperationQueue::OperationQueue(CommandChannel& channel, OperationDelegate& delegate)
    : Loggable(Common::LogCategory::Queue), m_channel(channel), m_delegate(delegate) {}

OperationQueue::~OperationQueue() {
    CancelAll();
}

OperationId OperationQueue::Enqueue(OperationContext context, SerialOperation::Completion completion) {
    OperationId id = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        id = m_nextId++;

        auto operation = std::make_shared<SerialOperation>(
            id, std::move(context), m_channel, m_delegate,
            [this, completion = std::move(completion)](SerialOperation& finished) {
                if (completion) completion(finished);
                OnFinished(finished);
            });
        operation->SetProgressHandler(m_progress);

        LogDebug("#%llu %s queued behind %zu", static_cast<unsigned long long>(id),
                 Describe(operation->Context()).c_str(), m_pending.size() + (m_active ? 1 : 0));
        m_pending.push_back(std::move(operation));
    }

    StartNext();
    return id;
}

bool OperationQueue::Cancel(OperationId id) {
    std::shared_ptr<SerialOperation> target;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_active && m_active->Id() == id) {
            target = m_active;
        } else {
            auto it = std::find_if(m_pending.begin(), m_pending.end(),
                                   [id](const auto& op) { return op->Id() == id; });
            if (it != m_pending.end()) {
                target = *it;
                m_pending.erase(it);
            }
        }
    }

    if (!target) return false;
    target->Cancel();
    return true;
}

void OperationQueue::CancelAll() {
    std::vector<std::shared_ptr<SerialOperation>> pending;
    std::shared_ptr<SerialOperation> active;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        pending.assign(m_pending.begin(), m_pending.end());
        m_pending.clear();
        active = m_active;
    }

    // Pending ones first so the active one's completion has nothing left to start
    for (auto& op : pending) op->Cancel();
    if (active) active->Cancel();
}

bool OperationQueue::IsIdle() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_active && m_pending.empty();
}

std::size_t OperationQueue::PendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}

std::optional<OperationId> OperationQueue::ActiveId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_active) return std::nullopt;
    return m_active->Id();
}

void OperationQueue::SetProgressHandler(SerialOperation::ProgressHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_progress = std::move(handler);
    for (auto& op : m_pending) op->SetProgressHandler(m_progress);
}

void OperationQueue::StartNext() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // An operation that finishes inside Start() lands back here; the outer loop picks up the next one.
        if (m_starting) return;
        m_starting = true;
    }

    for (;;) {
        std::shared_ptr<SerialOperation> next;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_active || m_pending.empty()) {
                m_starting = false;
                return;
            }
            next = m_pending.front();
            m_pending.pop_front();
            m_active = next;
        }
        next->Start();
    }
}

void OperationQueue::OnFinished(SerialOperation& operation) {
    std::shared_ptr<SerialOperation> finished;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_active.get() == &operation) {
            finished = std::move(m_active);
            m_active.reset();
        }
    }

    if (finished && finished->Error() != ReaderError::None && finished->Error() != ReaderError::Cancelled) {
        LogWarn("#%llu failed: %s", static_cast<unsigned long long>(finished->Id()), ToString(finished->Error()));
    }

    StartNext();
}

} // namespace CartLink::Reader
