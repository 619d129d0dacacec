#pragma once

#include <cstdint>
#include <vector>

namespace CartLink::IO {

class TransportListener {
public:
    virtual ~TransportListener() = default;
    virtual void OnBytesReceived(const std::vector<uint8_t>& bytes) = 0;
};

/**
 * @brief Raw byte connection to the adapter.
 *
 * Received bytes go to at most one listener, bound through a TransportLease.
 * Binding and delivery happen on the transport's thread.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual bool Open() = 0;
    virtual void Close() = 0;
    virtual bool IsOpen() const = 0;

    /** @return false if the bytes could not be handed to the connection. */
    virtual bool Send(const std::vector<uint8_t>& bytes) = 0;

    [[nodiscard]] bool IsLeased() const { return m_listener != nullptr; }

protected:
    // Forwards to the bound listener; dropped when nothing is bound.
    void DeliverBytes(const std::vector<uint8_t>& bytes) {
        if (m_listener) m_listener->OnBytesReceived(bytes);
    }

private:
    friend class TransportLease;
    TransportListener* m_listener = nullptr;
};

/**
 * @brief Exclusive, scoped binding of a listener to a transport.
 *
 * The lease unbinds on Release() or destruction. A transport that is already
 * leased refuses another lease; Valid() reports which case applies.
 */
class TransportLease {
public:
    TransportLease(Transport& transport, TransportListener& listener)
        : m_transport(&transport) {
        if (transport.m_listener != nullptr) {
            m_transport = nullptr;
            return;
        }
        transport.m_listener = &listener;
    }

    ~TransportLease() { Release(); }

    TransportLease(const TransportLease&) = delete;
    TransportLease& operator=(const TransportLease&) = delete;

    [[nodiscard]] bool Valid() const { return m_transport != nullptr; }

    void Release() {
        if (m_transport) {
            m_transport->m_listener = nullptr;
            m_transport = nullptr;
        }
    }

private:
    Transport* m_transport;
};

} // namespace CartLink::IO
