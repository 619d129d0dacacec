#include "reader/BankSwitch.h"

namespace CartLink::Reader {

namespace {

void AppendRegisterWrite(CommandList& out, uint32_t address, uint32_t value,
                         uint32_t settle = ProtocolConsts::BANK_SETTLE_US) {
    out.push_back(Cmd::Address("B", 16, address));
    out.push_back(Cmd::Sleep(settle));
    out.push_back(Cmd::Address("B", 10, value));
}

} // namespace

CommandList BankSwitchCommands(uint32_t bank, Cart::MBCKind configuration) {
    CommandList commands;
    if (configuration == Cart::MBCKind::One) {
        AppendRegisterWrite(commands, 0x6000, 0);
        AppendRegisterWrite(commands, 0x4000, bank >> 5);
        AppendRegisterWrite(commands, 0x2000, bank & 0x1F);
    } else {
        AppendRegisterWrite(commands, 0x2100, bank);
        if (bank >= 0x100) {
            AppendRegisterWrite(commands, 0x3000, 1);
        }
    }
    return commands;
}

CommandList BankSwitchCommands(uint32_t bank, const Cart::CartridgeHeader& header) {
    return BankSwitchCommands(bank, header.Configuration());
}

CommandList RamModeCommands(bool on) {
    CommandList commands;
    AppendRegisterWrite(commands, 0x0000, on ? 0x0A : 0x00, ProtocolConsts::RAM_TOGGLE_SETTLE_US);
    return commands;
}

CommandList RamBankCommands(uint32_t bank) {
    CommandList commands;
    AppendRegisterWrite(commands, 0x4000, bank);
    return commands;
}

CommandList RamBankingModeCommands() {
    CommandList commands;
    AppendRegisterWrite(commands, 0x6000, 1);
    return commands;
}

} // namespace CartLink::Reader
