#pragma once

#include "cart/FlashChip.h"

#include <cstdint>
#include <string>

namespace CartLink::Common {

/**
 * @brief Runtime configuration of the reader.
 *
 * Values come from `QSettings("CartLink", "Reader")` and are then
 * overridden by environment variables:
 *
 * - `CARTLINK_PORT`            serial device; empty selects the adapter by USB id
 * - `CARTLINK_BAUD`            baud rate
 * - `CARTLINK_FLASH_CHIP`      `none` or `AM29F016B`
 * - `CARTLINK_TRACE_COMMANDS`  log every wire command except `Continue`
 * - `CARTLINK_TRACE_PROGRESS`  log transfer progress
 */
struct ReaderSettings {
    std::string portName;
    int32_t baudRate = 1000000;
    Cart::FlashChip flashChip = Cart::FlashChip::None;
    bool traceCommands = false;
    bool traceProgress = false;

    static ReaderSettings Load();
    void Save() const;
};

} // namespace CartLink::Common
