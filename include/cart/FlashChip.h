#pragma once

#include <optional>
#include <string>

namespace CartLink::Cart {

    // Flash chips the writer knows how to prepare.
    enum class FlashChip {
        None,
        AM29F016B
    };

    const char* ToString(FlashChip chip);

    // Case-insensitive; "" and "none" map to FlashChip::None.
    std::optional<FlashChip> ParseFlashChip(const std::string& name);

}
