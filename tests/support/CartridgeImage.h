#pragma once

#include "cart/CartridgeHeader.h"

#include <cstdint>
#include <string>
#include <vector>

namespace CartLink::Test {

// Header ROM/RAM size codes
inline uint8_t RomSizeCode(uint32_t romSize) {
  uint8_t code = 0;
  while ((0x8000u << code) < romSize) ++code;
  return code;
}

inline uint8_t RamSizeCode(uint32_t ramSize) {
  switch (ramSize) {
    case 2048: return 0x01;
    case 8192: return 0x02;
    case 32768: return 0x03;
    case 131072: return 0x04;
    case 65536: return 0x05;
    default: return 0x00;
  }
}

inline void FixHeaderChecksum(std::vector<uint8_t> &rom) {
  uint8_t checksum = 0;
  for (uint32_t a = Cart::HeaderLayout::TITLE; a < Cart::HeaderLayout::HEADER_CHECKSUM; ++a) {
    checksum = static_cast<uint8_t>(checksum - rom[a] - 1);
  }
  rom[Cart::HeaderLayout::HEADER_CHECKSUM] = checksum;
}

/**
 * ROM image with a valid header. Every byte outside the header encodes its
 * bank and offset so misplaced pages show up in comparisons.
 */
inline std::vector<uint8_t> MakeRomImage(const std::string &title, uint8_t cartType,
                                         uint32_t romSize, uint32_t ramSize = 0) {
  std::vector<uint8_t> rom(romSize);
  for (uint32_t i = 0; i < romSize; ++i) {
    const uint32_t bank = i / Cart::ROM_BANK_SIZE;
    rom[i] = static_cast<uint8_t>((bank * 37) ^ (i & 0xFF) ^ ((i >> 8) & 0x3F));
  }

  for (uint32_t i = 0; i < Cart::HeaderLayout::TITLE_LENGTH; ++i) {
    rom[Cart::HeaderLayout::TITLE + i] = i < title.size() ? static_cast<uint8_t>(title[i]) : 0x00;
  }
  rom[Cart::HeaderLayout::CART_TYPE] = cartType;
  rom[Cart::HeaderLayout::ROM_SIZE] = RomSizeCode(romSize);
  rom[Cart::HeaderLayout::RAM_SIZE] = RamSizeCode(ramSize);
  FixHeaderChecksum(rom);
  return rom;
}

inline std::vector<uint8_t> MakeSaveData(uint32_t size, uint8_t seed = 0x5A) {
  std::vector<uint8_t> data(size);
  for (uint32_t i = 0; i < size; ++i) {
    data[i] = static_cast<uint8_t>(seed + i * 7 + (i >> 9));
  }
  return data;
}

inline Cart::CartridgeHeader HeaderOf(const std::vector<uint8_t> &rom) {
  return *Cart::CartridgeHeader::FromImage(rom);
}

} // namespace CartLink::Test
