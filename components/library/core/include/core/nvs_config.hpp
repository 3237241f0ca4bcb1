/**
 * @file nvs_config.hpp
 * @brief Configuration read from NVS with compiled-in fallbacks
 *
 * @warning NVS has limited write endurance (~100k cycles). Values are
 *          provisioned once and only read here.
 */

#pragma once

#include "config.hpp"

#include <nvs.h>

#include <array>
#include <span>

namespace core {

/// Compile-time default for a key
struct ConfigDefault {
  std::string_view key;
  std::string_view value;
};

/// NVS namespace holding configuration
inline constexpr const char *CONFIG_NAMESPACE = "config";

class NvsConfigSource final : public IConfigSource {
public:
  /// @param defaults Fallback values, must outlive the source
  explicit NvsConfigSource(std::span<const ConfigDefault> defaults);
  ~NvsConfigSource() override;

  NvsConfigSource(const NvsConfigSource &) = delete;
  NvsConfigSource &operator=(const NvsConfigSource &) = delete;
  NvsConfigSource(NvsConfigSource &&) = delete;
  NvsConfigSource &operator=(NvsConfigSource &&) = delete;

  /// Initialize the NVS partition (erasing it if its layout is stale)
  [[nodiscard]] static Status init_partition();

  /// True when the NVS namespace exists; defaults still work otherwise
  [[nodiscard]] bool has_store() const { return handle_ != 0; }

  [[nodiscard]] std::optional<std::string>
  get(std::string_view key) const override;

private:
  [[nodiscard]] std::optional<std::string> read(std::string_view key) const;
  [[nodiscard]] std::optional<std::string>
  fallback(std::string_view key) const;

  static std::array<char, 16> make_key(std::string_view key);

  std::span<const ConfigDefault> defaults_;
  nvs_handle_t handle_ = 0;
};

} // namespace core
