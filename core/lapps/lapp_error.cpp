/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "lapps/lapp_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lapphost::lapps, LappError, e) {
  using E = lapphost::lapps::LappError;
  switch (e) {
    case E::NOT_FOUND:
      return "Lapp not found";
    case E::NOT_LOADED:
      return "Lapp is not loaded";
    case E::NOT_ENABLED:
      return "Lapp is not enabled";
    case E::PERMISSION_DENIED:
      return "Lapp has no permission for the operation";
    case E::LOCK_UNAVAILABLE:
      return "Lapp is busy, lock timeout expired";
    case E::ALREADY_LOADED:
      return "Lapp is already loaded";
  }
  return "Unknown lapp error";
}
