/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/outcome/result.hpp>

namespace lapphost {
  /**
   * Result with a non std::error_code error type, used where the failure
   * must carry more than a code (e.g. a message coming from a lapp)
   */
  template <typename R, typename E>
  using CustomOutcome = boost::outcome_v2::
      basic_result<R, E, boost::outcome_v2::policy::default_policy<R, E, void>>;
}  // namespace lapphost
