#pragma once

#include "cart/CartridgeHeader.h"
#include "reader/ReaderCommand.h"

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace CartLink::Reader {

enum class Intent {
    Read,
    Write
};

// Read the fixed header range.
struct HeaderContext {};

// Full ROM dump, or flash write of `image`.
struct CartridgeContext {
    Cart::CartridgeHeader header;
    Intent intent = Intent::Read;
    std::shared_ptr<const ByteBuffer> image;
};

// Full save RAM dump, or restore of `data`.
struct SaveFileContext {
    Cart::CartridgeHeader header;
    Intent intent = Intent::Read;
    std::shared_ptr<const ByteBuffer> data;
};

// One ROM bank within a cartridge transfer.
struct BankContext {
    uint32_t number = 0;
    CartridgeContext cartridge;
};

// One RAM bank within a save-file transfer.
struct SramContext {
    uint32_t bank = 0;
    SaveFileContext saveFile;
};

using OperationContext = std::variant<HeaderContext,
                                      CartridgeContext,
                                      BankContext,
                                      SaveFileContext,
                                      SramContext>;

// A step the operation runs between its own will-begin and did-complete.
struct TransferStep {
    OperationContext context;
    uint32_t byteCount = 0;
    Intent intent = Intent::Read;
};

const char* KindName(const OperationContext& context);
std::string Describe(const OperationContext& context);

// Intent of the transfer a context performs (Header reads).
Intent IntentOf(const OperationContext& context);

// True for Header, Cartridge and SaveFile; these own the connection.
bool IsTopLevel(const OperationContext& context);

/**
 * Bank 1 is read from 0x0000 and covers banks 0 and 1 (0x8000 bytes);
 * every later bank is read from 0x4000.
 */
uint32_t BankImageOffset(uint32_t bank);
uint32_t BankByteCount(uint32_t bank);
uint32_t BankReadAddress(uint32_t bank);

/**
 * Steps for a top-level context:
 *   Header    -> itself, HeaderLayout::SIZE bytes
 *   Cartridge -> Bank 1 .. bankCount-1
 *   SaveFile  -> Sram 0 .. ramBankCount-1
 */
std::vector<TransferStep> PlanTransfer(const OperationContext& context);

uint64_t TotalBytes(const std::vector<TransferStep>& steps);

} // namespace CartLink::Reader
