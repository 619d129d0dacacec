#pragma once

#include <optional>
#include <utility>

namespace CartLink::Reader {

enum class ReaderError {
    None,
    Cancelled,              // No result; not a failure
    TransportOpenFailed,    // Connection could not be established; nothing was sent
    UnsupportedContext,     // Request does not fit the attached cartridge
    UnsupportedFlashChip,   // Flash preparation declined; nothing was programmed
    TransportWriteFailed    // A send failed mid-operation
};

const char* ToString(ReaderError error);

/**
 * Outcome of an asynchronous reader call: a value, or a non-None error.
 */
template <typename T>
class Result {
public:
    static Result Success(T value) {
        Result r;
        r.m_value = std::move(value);
        return r;
    }

    static Result Failure(ReaderError error) {
        Result r;
        r.m_error = (error == ReaderError::None) ? ReaderError::UnsupportedContext : error;
        return r;
    }

    bool Ok() const { return m_value.has_value(); }
    explicit operator bool() const { return Ok(); }

    ReaderError Error() const { return m_error; }
    bool Cancelled() const { return m_error == ReaderError::Cancelled; }

    const T& Value() const { return *m_value; }
    T& Value() { return *m_value; }

private:
    Result() = default;

    std::optional<T> m_value;
    ReaderError m_error = ReaderError::None;
};

} // namespace CartLink::Reader
