#pragma once

#include "reader/ReaderCommand.h"

#include <cstdint>
#include <functional>
#include <optional>

namespace CartLink::Reader {

/**
 * Fires once per page boundary of a monotonically increasing byte counter.
 *
 * A boundary is any multiple of the page size (0 included). Repeated or
 * smaller counts never re-fire; a jump over several boundaries fires once
 * for each of them, lowest first.
 */
class PageTrigger {
public:
    using Callback = std::function<void(uint64_t boundary)>;

    explicit PageTrigger(uint32_t pageSize = ProtocolConsts::PAGE_SIZE);

    // Treat every boundary up to count as already handled.
    void Prime(uint64_t count);

    // Returns true if at least one boundary was crossed.
    bool Update(uint64_t completed, const Callback& callback);

    void Reset();

    uint32_t PageSize() const { return m_pageSize; }
    std::optional<uint64_t> LastBoundary() const;

private:
    uint32_t m_pageSize;
    int64_t m_lastIndex = -1;
};

} // namespace CartLink::Reader
