/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/module_factory.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lapphost::runtime, CompilationErrorCode, e) {
  using E = lapphost::runtime::CompilationErrorCode;
  switch (e) {
    case E::COMPILATION_FAILED:
      return "Lapp module compilation failed";
  }
  return "Unknown compilation error";
}
