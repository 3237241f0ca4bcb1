/**
 * @file types.cpp
 * @brief ROM code helpers
 */

#include "onewire/types.hpp"

#include <core/crc.hpp>

#include <cstdio>
#include <span>

namespace driver::onewire {

bool RomCode::crc_valid() const { return core::Crc8::check(bytes); }

std::string RomCode::to_string() const {
  std::array<char, ROM_SIZE * 2 + 1> text{};
  for (size_t i = 0; i < bytes.size(); ++i) {
    std::snprintf(&text[i * 2], 3, "%02x", bytes[i]);
  }
  return text.data();
}

} // namespace driver::onewire
