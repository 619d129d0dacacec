#include "reader/ReaderError.h"

namespace CartLink::Reader {

const char* ToString(ReaderError error) {
    switch (error) {
        case ReaderError::None: return "none";
        case ReaderError::Cancelled: return "cancelled";
        case ReaderError::TransportOpenFailed: return "transport open failed";
        case ReaderError::UnsupportedContext: return "unsupported context";
        case ReaderError::UnsupportedFlashChip: return "unsupported flash chip";
        case ReaderError::TransportWriteFailed: return "transport write failed";
    }
    return "unknown";
}

} // namespace CartLink::Reader
