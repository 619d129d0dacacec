#include "reader/PageTrigger.h"

#include <algorithm>

namespace CartLink::Reader {

PageTrigger::PageTrigger(uint32_t pageSize)
    : m_pageSize(pageSize == 0 ? ProtocolConsts::PAGE_SIZE : pageSize) {}

void PageTrigger::Prime(uint64_t count) {
    m_lastIndex = std::max<int64_t>(m_lastIndex, static_cast<int64_t>(count / m_pageSize));
}

bool PageTrigger::Update(uint64_t completed, const Callback& callback) {
    const auto index = static_cast<int64_t>(completed / m_pageSize);
    if (index <= m_lastIndex) return false;

    while (m_lastIndex < index) {
        ++m_lastIndex;
        if (callback) callback(static_cast<uint64_t>(m_lastIndex) * m_pageSize);
    }
    return true;
}

void PageTrigger::Reset() {
    m_lastIndex = -1;
}

std::optional<uint64_t> PageTrigger::LastBoundary() const {
    if (m_lastIndex < 0) return std::nullopt;
    return static_cast<uint64_t>(m_lastIndex) * m_pageSize;
}

} // namespace CartLink::Reader
