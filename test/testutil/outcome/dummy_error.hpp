/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace testutil {
  /**
   * @name Dummy error
   * @brief Error to return from mocks and stub callbacks where the exact
   * error of a component does not matter
   */
  enum class DummyError { ERROR = 1 };
}  // namespace testutil

OUTCOME_HPP_DECLARE_ERROR(testutil, DummyError);
