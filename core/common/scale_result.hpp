/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>

#include <scale/scale.hpp>

namespace lapphost {

  /**
   * Success-or-failure payload exchanged with lapps, SCALE encoded as an enum
   * with Ok at index 0 and Err at index 1
   */
  template <typename Succ, typename Fail>
  struct Result final : std::variant<Succ, Fail> {
    using Base = std::variant<Succ, Fail>;
    using Base::Base;

    static Result ok(Succ value) {
      return Result{std::in_place_index<0>, std::move(value)};
    }

    static Result err(Fail error) {
      return Result{std::in_place_index<1>, std::move(error)};
    }

    bool operator==(const Result &r_) const {
      const Base &l = *this, &r = r_;
      return l == r;
    }

    bool isSuccess() const {
      return Base::index() == 0;
    }

    bool isFailure() const {
      return Base::index() == 1;
    }

    const Succ &value() const {
      return std::get<0>(*this);
    }

    const Fail &error() const {
      return std::get<1>(*this);
    }

    friend ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const Result &result) {
      s << static_cast<uint8_t>(result.index());
      std::visit([&s](const auto &v) { s << v; }, result.base());
      return s;
    }

    friend ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, Result &result) {
      uint8_t index = 0;
      s >> index;
      if (index == 0) {
        Succ value{};
        s >> value;
        result = ok(std::move(value));
      } else if (index == 1) {
        Fail error{};
        s >> error;
        result = err(std::move(error));
      } else {
        ::scale::raise(::scale::DecodeError::WRONG_TYPE_INDEX);
      }
      return s;
    }

   private:
    const Base &base() const {
      return *this;
    }
  };

}  // namespace lapphost
