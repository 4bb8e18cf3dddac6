/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <bit>
#include <string>
#include <variant>
#include <vector>

#include <scale/scale.hpp>

#include "common/buffer.hpp"
#include "common/scale_result.hpp"

namespace lapphost::host_api {

  struct Null {
    bool operator==(const Null &) const = default;
  };

  /**
   * Column value of a database row
   */
  struct Value : std::variant<Null, int64_t, double, std::string, Buffer> {
    using Base = std::variant<Null, int64_t, double, std::string, Buffer>;
    using Base::Base;

    bool operator==(const Value &r) const {
      const Base &l = *this;
      return l == static_cast<const Base &>(r);
    }

    /// Real values cross the boundary as the bits of an f64
    friend ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const Value &value) {
      s << static_cast<uint8_t>(value.index());
      std::visit(
          [&s](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, double>) {
              s << std::bit_cast<uint64_t>(v);
            } else if constexpr (not std::is_same_v<T, Null>) {
              s << v;
            }
          },
          static_cast<const Base &>(value));
      return s;
    }

    friend ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, Value &value) {
      uint8_t index = 0;
      s >> index;
      switch (index) {
        case 0:
          value = Null{};
          break;
        case 1: {
          int64_t v = 0;
          s >> v;
          value = v;
        } break;
        case 2: {
          uint64_t bits = 0;
          s >> bits;
          value = std::bit_cast<double>(bits);
        } break;
        case 3: {
          std::string v;
          s >> v;
          value = std::move(v);
        } break;
        case 4: {
          Buffer v;
          s >> v;
          value = std::move(v);
        } break;
        default:
          ::scale::raise(::scale::DecodeError::WRONG_TYPE_INDEX);
      }
      return s;
    }
  };

  using Row = std::vector<Value>;

  using ExecuteResult = Result<uint64_t, std::string>;
  using QueryResult = Result<std::vector<Row>, std::string>;
  using QueryRowResult = Result<std::optional<Row>, std::string>;

}  // namespace lapphost::host_api
