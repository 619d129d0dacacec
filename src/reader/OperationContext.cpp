#include "reader/OperationContext.h"

#include "reader/Overloaded.h"

namespace CartLink::Reader {

const char* KindName(const OperationContext& context) {
    return std::visit(Overloaded{
        [](const HeaderContext&) { return "header"; },
        [](const CartridgeContext&) { return "cartridge"; },
        [](const BankContext&) { return "bank"; },
        [](const SaveFileContext&) { return "saveFile"; },
        [](const SramContext&) { return "sram"; },
    }, context);
}

static const char* IntentName(Intent intent) {
    return intent == Intent::Read ? "read" : "write";
}

std::string Describe(const OperationContext& context) {
    return std::visit(Overloaded{
        [](const HeaderContext&) { return std::string("header"); },
        [](const CartridgeContext& c) {
            return std::string("cartridge(") + c.header.Title() + ", " + IntentName(c.intent) + ")";
        },
        [](const BankContext& c) {
            return "bank(" + std::to_string(c.number) + ", " + IntentName(c.cartridge.intent) + ")";
        },
        [](const SaveFileContext& c) {
            return std::string("saveFile(") + c.header.Title() + ", " + IntentName(c.intent) + ")";
        },
        [](const SramContext& c) {
            return "sram(" + std::to_string(c.bank) + ", " + IntentName(c.saveFile.intent) + ")";
        },
    }, context);
}

Intent IntentOf(const OperationContext& context) {
    return std::visit(Overloaded{
        [](const HeaderContext&) { return Intent::Read; },
        [](const CartridgeContext& c) { return c.intent; },
        [](const BankContext& c) { return c.cartridge.intent; },
        [](const SaveFileContext& c) { return c.intent; },
        [](const SramContext& c) { return c.saveFile.intent; },
    }, context);
}

bool IsTopLevel(const OperationContext& context) {
    return std::holds_alternative<HeaderContext>(context) ||
           std::holds_alternative<CartridgeContext>(context) ||
           std::holds_alternative<SaveFileContext>(context);
}

uint32_t BankImageOffset(uint32_t bank) {
    return bank <= 1 ? 0 : bank * Cart::ROM_BANK_SIZE;
}

uint32_t BankByteCount(uint32_t bank) {
    return bank <= 1 ? 2 * Cart::ROM_BANK_SIZE : Cart::ROM_BANK_SIZE;
}

uint32_t BankReadAddress(uint32_t bank) {
    return bank > 1 ? 0x4000 : 0x0000;
}

std::vector<TransferStep> PlanTransfer(const OperationContext& context) {
    std::vector<TransferStep> steps;

    if (std::holds_alternative<HeaderContext>(context)) {
        steps.push_back({context, Cart::HeaderLayout::SIZE, Intent::Read});
    } else if (const auto* cart = std::get_if<CartridgeContext>(&context)) {
        uint32_t bankCount = cart->header.RomBankCount();
        if (cart->intent == Intent::Write && cart->image) {
            bankCount = static_cast<uint32_t>(cart->image->size() / Cart::ROM_BANK_SIZE);
        }
        for (uint32_t bank = 1; bank < bankCount; ++bank) {
            steps.push_back({BankContext{bank, *cart}, BankByteCount(bank), cart->intent});
        }
    } else if (const auto* save = std::get_if<SaveFileContext>(&context)) {
        for (uint32_t bank = 0; bank < save->header.RamBankCount(); ++bank) {
            steps.push_back({SramContext{bank, *save}, save->header.RamBankSize(), save->intent});
        }
    }
    return steps;
}

uint64_t TotalBytes(const std::vector<TransferStep>& steps) {
    uint64_t total = 0;
    for (const auto& step : steps) total += step.byteCount;
    return total;
}

} // namespace CartLink::Reader
