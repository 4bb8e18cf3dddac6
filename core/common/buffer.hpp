/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lapphost::common {

  /// Host-owned byte storage
  using Buffer = std::vector<uint8_t>;

  /// Non-owning view on bytes, host or guest
  using BufferView = std::span<const uint8_t>;

  inline std::string_view asStringView(BufferView bytes) {
    return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
  }

  inline BufferView asBytes(std::string_view str) {
    return {reinterpret_cast<const uint8_t *>(str.data()), str.size()};
  }

  inline Buffer toBuffer(std::string_view str) {
    auto bytes = asBytes(str);
    return {bytes.begin(), bytes.end()};
  }

}  // namespace lapphost::common

namespace lapphost {
  using common::Buffer;
  using common::BufferView;
}  // namespace lapphost
