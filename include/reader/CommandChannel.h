#pragma once

#include "common/Loggable.h"
#include "io/Transport.h"
#include "reader/ReaderCommand.h"

#include <cstdint>
#include <functional>

namespace CartLink::Reader {

/**
 * @brief Sends encoded commands to the transport in order.
 *
 * Sleep commands block the calling thread for their duration. The first
 * failed send latches: later sends are skipped until ResetFailure().
 */
class CommandChannel : public Common::Loggable {
public:
    using Sleeper = std::function<void(uint32_t microseconds)>;
    using Observer = std::function<void(const ReaderCommand&)>;

    explicit CommandChannel(IO::Transport& transport);

    bool Send(const ReaderCommand& command);
    bool SendAll(const CommandList& commands);

    void CloseConnection();

    [[nodiscard]] bool Failed() const { return m_failed; }
    void ResetFailure() { m_failed = false; }

    // Replaces the real-time sleep (tests record delays instead of waiting).
    void SetSleeper(Sleeper sleeper);
    // Sees every command, Sleep included, before it is performed.
    void SetObserver(Observer observer);
    void SetTraceEnabled(bool enabled) { m_trace = enabled; }

    IO::Transport& GetTransport() { return m_transport; }

private:
    IO::Transport& m_transport;
    Sleeper m_sleeper;
    Observer m_observer;
    bool m_failed = false;
    bool m_trace = false;
};

} // namespace CartLink::Reader
