#pragma once

#include "cart/CartridgeHeader.h"
#include "reader/ReaderCommand.h"

#include <cstdint>

namespace CartLink::Reader {

// Bank/address register writes, in wire order, for one controller family.
//
// Every register write is "B{register hex}", settle, "B{value decimal}".

/**
 * ROM bank switch.
 *
 * MBC1 splits the bank across the 0x6000 mode latch, the 0x4000 upper bits
 * and the 0x2000 lower five bits. Everything else takes the full number at
 * 0x2100, plus 0x3000 = 1 for banks from 0x100.
 */
CommandList BankSwitchCommands(uint32_t bank, Cart::MBCKind configuration);
CommandList BankSwitchCommands(uint32_t bank, const Cart::CartridgeHeader& header);

// RAM enable latch at 0x0000: 0x0A enables, 0x00 disables.
CommandList RamModeCommands(bool on);

// Save RAM bank select at 0x4000.
CommandList RamBankCommands(uint32_t bank);

// MBC1 mode latch at 0x6000 set to RAM banking.
CommandList RamBankingModeCommands();

} // namespace CartLink::Reader
