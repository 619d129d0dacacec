#pragma once

#include "cart/CartridgeHeader.h"
#include "io/Transport.h"
#include "reader/ReaderCommand.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

namespace CartLink::Test {

/**
 * In-memory adapter with a cartridge plugged in.
 *
 * Each Send() carries exactly one encoded command. Replies are queued and only
 * delivered by Pump(), so tests control when the reader sees them. ROM, save
 * RAM and the MBC1/MBC2/MBC5 registers are emulated; flash programming ANDs
 * bytes into the ROM after a chip erase fills it with 0xFF.
 */
class FakeAdapter : public IO::Transport {
public:
  explicit FakeAdapter(std::vector<uint8_t> rom, std::vector<uint8_t> ram = {},
                       std::optional<Cart::MBCKind> kind = std::nullopt)
      : rom_(std::move(rom)), ram_(std::move(ram)) {
    if (kind) {
      kind_ = *kind;
    } else if (auto header = Cart::CartridgeHeader::FromImage(rom_)) {
      kind_ = header->Configuration();
    }
  }

  // --- Transport ---

  bool Open() override {
    ++openCount_;
    if (failOpen_) return false;
    open_ = true;
    return true;
  }

  void Close() override {
    open_ = false;
    reading_ = false;
    pending_.clear();
    ++closeCount_;
  }

  bool IsOpen() const override { return open_; }

  bool Send(const std::vector<uint8_t> &bytes) override {
    if (!open_) return false;
    if (failSendAfter_ && sent_.size() >= *failSendAfter_) return false;
    sent_.push_back(bytes);
    Execute(bytes);
    return true;
  }

  // --- Test controls ---

  void SetFailOpen(bool fail) { failOpen_ = fail; }
  // Sends after the first `count` fail.
  void FailSendAfter(std::size_t count) { failSendAfter_ = count; }

  // Delivers queued replies, `chunk` bytes at a time, until none are left.
  std::size_t Pump(std::size_t chunk = 64) {
    std::size_t delivered = 0;
    while (!pending_.empty()) {
      const std::size_t n = std::min(chunk, pending_.size());
      std::vector<uint8_t> bytes(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(n));
      pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(n));
      delivered += n;
      DeliverBytes(bytes);
    }
    return delivered;
  }

  // Queue bytes as if the adapter sent them unprompted.
  void Inject(const std::vector<uint8_t> &bytes) { pending_.insert(pending_.end(), bytes.begin(), bytes.end()); }

  const std::vector<std::vector<uint8_t>> &Sent() const { return sent_; }
  void ClearSent() { sent_.clear(); }

  std::vector<uint8_t> SentBytes() const {
    std::vector<uint8_t> all;
    for (const auto &s : sent_) all.insert(all.end(), s.begin(), s.end());
    return all;
  }

  std::size_t CountSent(const std::vector<uint8_t> &command) const {
    return static_cast<std::size_t>(std::count(sent_.begin(), sent_.end(), command));
  }

  const std::vector<uint8_t> &Rom() const { return rom_; }
  const std::vector<uint8_t> &Ram() const { return ram_; }
  std::size_t PendingBytes() const { return pending_.size(); }

  int OpenCount() const { return openCount_; }
  int CloseCount() const { return closeCount_; }
  bool RamEnabled() const { return ramEnabled_; }
  bool ChipErased() const { return erased_; }
  const std::string &Modes() const { return modes_; }
  uint32_t RomBank() const { return romBank_; }

private:
  static constexpr uint32_t kPage = Reader::ProtocolConsts::PAGE_SIZE;

  // NUL-terminated field starting at `pos`.
  static std::string Field(const std::vector<uint8_t> &bytes, std::size_t &pos) {
    std::string out;
    while (pos < bytes.size() && bytes[pos] != 0x00) out.push_back(static_cast<char>(bytes[pos++]));
    ++pos;
    return out;
  }

  static uint32_t Parse(const std::string &s, int radix) {
    return static_cast<uint32_t>(std::strtoul(s.c_str(), nullptr, radix));
  }

  void Execute(const std::vector<uint8_t> &bytes) {
    if (bytes.empty()) return;
    std::size_t pos = 1;

    switch (bytes[0]) {
      case 0x00:
        // "\0A<hex>\0": read address
        pos = 2;
        cursor_ = Parse(Field(bytes, pos), 16);
        break;
      case 'A':
        cursor_ = Parse(Field(bytes, pos), 16);
        break;
      case 'B': {
        const std::string field = Field(bytes, pos);
        if (!pendingRegister_) {
          pendingRegister_ = Parse(field, 16);
        } else {
          WriteRegister(*pendingRegister_, Parse(field, 10));
          pendingRegister_.reset();
        }
        break;
      }
      case 'R':
        reading_ = true;
        EmitPage();
        break;
      case '1':
        if (reading_) EmitPage();
        break;
      case '0':
        reading_ = false;
        break;
      case 'G':
      case '5':
        modes_.push_back(static_cast<char>(bytes[0]));
        break;
      case 'W':
        for (std::size_t i = 1; i < bytes.size(); ++i) StoreRam(cursor_++, bytes[i]);
        pending_.push_back('1');
        break;
      case 'T':
        if (programMethodSet_) {
          for (std::size_t i = 1; i < bytes.size(); ++i) {
            const uint32_t phys = RomOffset(cursor_++);
            if (phys < rom_.size()) rom_[phys] &= bytes[i];
          }
        }
        pending_.push_back('1');
        break;
      case 'E':
        for (int i = 0; i < 6; ++i) Field(bytes, pos);
        programMethodSet_ = true;
        break;
      case 'F': {
        const uint32_t address = Parse(Field(bytes, pos), 16);
        const uint32_t value = Parse(Field(bytes, pos), 16);
        FlashCycle(address, value);
        break;
      }
      default:
        break;
    }
  }

  void FlashCycle(uint32_t address, uint32_t value) {
    static const std::array<std::pair<uint32_t, uint32_t>, 6> kChipErase = {{
        {0x555, 0xAA}, {0x2AA, 0x55}, {0x555, 0x80}, {0x555, 0xAA}, {0x2AA, 0x55}, {0x555, 0x10}}};

    if (address == 0x000 && value == 0xF0) {
      eraseStep_ = 0;
      return;
    }
    if (kChipErase[eraseStep_] == std::make_pair(address, value)) {
      if (++eraseStep_ == kChipErase.size()) {
        std::fill(rom_.begin(), rom_.end(), 0xFF);
        erased_ = true;
        eraseStep_ = 0;
      }
    } else {
      eraseStep_ = 0;
    }
  }

  void WriteRegister(uint32_t address, uint32_t value) {
    switch (kind_) {
      case Cart::MBCKind::None:
        break;
      case Cart::MBCKind::One:
        if (address < 0x2000) {
          ramEnabled_ = (value & 0x0F) == 0x0A;
        } else if (address < 0x4000) {
          mbc1Low_ = value & 0x1F;
        } else if (address < 0x6000) {
          mbc1High_ = value & 0x03;
        } else if (address < 0x8000) {
          mbc1Mode_ = value & 0x01;
        }
        romBank_ = (mbc1High_ << 5) | (mbc1Low_ == 0 ? 1 : mbc1Low_);
        ramBank_ = mbc1Mode_ ? mbc1High_ : 0;
        break;
      case Cart::MBCKind::Two:
        if (address < 0x4000) {
          if (address & 0x100) {
            romBank_ = (value & 0x0F) == 0 ? 1 : (value & 0x0F);
          } else {
            ramEnabled_ = (value & 0x0F) == 0x0A;
          }
        }
        break;
      case Cart::MBCKind::Other:
        if (address < 0x2000) {
          ramEnabled_ = (value & 0x0F) == 0x0A;
        } else if (address < 0x3000) {
          romBank_ = (romBank_ & 0x100) | (value & 0xFF);
        } else if (address < 0x4000) {
          romBank_ = (romBank_ & 0xFF) | ((value & 0x01) << 8);
        } else if (address < 0x6000) {
          ramBank_ = value & 0x0F;
        }
        break;
    }
  }

  uint32_t RomOffset(uint32_t address) const {
    if (address < 0x4000) return address;
    return romBank_ * Cart::ROM_BANK_SIZE + (address - 0x4000);
  }

  uint32_t RamOffset(uint32_t address) const {
    const uint32_t offset = address - 0xA000;
    if (kind_ == Cart::MBCKind::Two) return offset % Cart::MBC2_RAM_SIZE;
    return ramBank_ * Cart::RAM_BANK_MAX_SIZE + offset;
  }

  uint8_t Load(uint32_t address) const {
    if (address < 0x8000) {
      const uint32_t phys = RomOffset(address);
      return phys < rom_.size() ? rom_[phys] : 0xFF;
    }
    if (address >= 0xA000 && address < 0xC000) {
      const uint32_t phys = RamOffset(address);
      return ramEnabled_ && phys < ram_.size() ? ram_[phys] : 0xFF;
    }
    return 0xFF;
  }

  void StoreRam(uint32_t address, uint8_t value) {
    if (!ramEnabled_ || address < 0xA000 || address >= 0xC000) return;
    const uint32_t phys = RamOffset(address);
    if (phys < ram_.size()) ram_[phys] = value;
  }

  void EmitPage() {
    for (uint32_t i = 0; i < kPage; ++i) pending_.push_back(Load(cursor_++));
  }

  std::vector<uint8_t> rom_;
  std::vector<uint8_t> ram_;
  Cart::MBCKind kind_ = Cart::MBCKind::None;

  bool open_ = false;
  bool failOpen_ = false;
  std::optional<std::size_t> failSendAfter_;
  int openCount_ = 0;
  int closeCount_ = 0;

  std::vector<std::vector<uint8_t>> sent_;
  std::vector<uint8_t> pending_;

  uint32_t cursor_ = 0;
  bool reading_ = false;
  std::optional<uint32_t> pendingRegister_;

  uint32_t romBank_ = 1;
  uint32_t ramBank_ = 0;
  bool ramEnabled_ = false;
  uint32_t mbc1Low_ = 1;
  uint32_t mbc1High_ = 0;
  uint32_t mbc1Mode_ = 0;

  std::string modes_;
  bool programMethodSet_ = false;
  std::size_t eraseStep_ = 0;
  bool erased_ = false;
};

} // namespace CartLink::Test
