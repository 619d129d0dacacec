#pragma once

#include "reader/OperationContext.h"
#include "reader/ReaderError.h"

#include <cstdint>

namespace CartLink::Reader {

enum class LifecycleEvent {
    WillBegin,
    DidBegin,
    Progress,
    DidComplete
};

const char* ToString(LifecycleEvent event);

struct LifecycleUpdate {
    LifecycleEvent event = LifecycleEvent::WillBegin;
    // Page boundary reached, for Progress; 0 otherwise.
    uint64_t completedUnitCount = 0;
};

// Requests a handler may make of the operation delivering the event.
class OperationControl {
public:
    virtual ~OperationControl() = default;

    // Drop the next `count` received bytes before any step consumes data.
    virtual void DiscardIncoming(uint32_t count) = 0;
};

/**
 * Receives the lifecycle events of the active operation.
 *
 * Handlers run synchronously on the thread delivering the event. Returning
 * anything but ReaderError::None stops the operation with that error.
 */
class OperationDelegate {
public:
    virtual ~OperationDelegate() = default;

    virtual ReaderError Handle(const LifecycleUpdate& update,
                               const OperationContext& context,
                               OperationControl& control) = 0;
};

} // namespace CartLink::Reader
