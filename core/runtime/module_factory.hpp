/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "common/buffer.hpp"
#include "outcome/custom.hpp"
#include "outcome/outcome.hpp"

namespace lapphost::runtime {

  class Module;

  enum class CompilationErrorCode {
    COMPILATION_FAILED = 1,
  };

  struct CompilationError : std::runtime_error {
    CompilationError(const std::string &message)
        : std::runtime_error(message.c_str()) {}

    CompilationError(const std::error_code &ec)
        : CompilationError{ec.message()} {}

    std::string_view message() const {
      return what();
    }
  };

}  // namespace lapphost::runtime

OUTCOME_HPP_DECLARE_ERROR(lapphost::runtime, CompilationErrorCode);

namespace lapphost::runtime {

  inline std::error_code make_error_code(const CompilationError &) {
    return CompilationErrorCode::COMPILATION_FAILED;
  }

  template <typename R>
  using CompilationOutcome = CustomOutcome<R, CompilationError>;

  inline void outcome_throw_as_system_error_with_payload(
      const CompilationError &e) {
    throw e;
  }

  class ModuleFactory {
   public:
    virtual ~ModuleFactory() = default;

    /**
     * Parse and validate `code`
     */
    virtual CompilationOutcome<std::shared_ptr<Module>> make(
        BufferView code) const = 0;
  };

}  // namespace lapphost::runtime
