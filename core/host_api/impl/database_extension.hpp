/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "filesystem/common.hpp"
#include "host_api/database_types.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "runtime/types.hpp"

namespace sqlite {
  class database;
}

namespace lapphost::runtime {
  class MemoryProvider;
}

namespace lapphost::host_api {

  enum class DatabaseError {
    OPEN_FAILED = 1,
  };

  /**
   * Implements database functions of a lapp over its own sqlite database.
   * Failures of statements are returned to the lapp, boundary failures
   * trap it.
   */
  class DatabaseExtension final {
   public:
    DatabaseExtension(
        std::shared_ptr<sqlite::database> db,
        std::shared_ptr<const runtime::MemoryProvider> memory_provider);

    static outcome::result<std::shared_ptr<sqlite::database>> open(
        const filesystem::path &path);

    /// in: String sql, out: Result<u64, String>
    outcome::result<runtime::WasmSpan> db_execute(runtime::WasmSpan sql);

    /// in: String sql, out: Result<Vec<Row>, String>
    outcome::result<runtime::WasmSpan> db_query(runtime::WasmSpan sql);

    /// in: String sql, out: Result<Option<Row>, String>
    outcome::result<runtime::WasmSpan> db_query_row(runtime::WasmSpan sql);

    ExecuteResult execute(const std::string &sql);

    QueryResult query(const std::string &sql);

    QueryRowResult queryRow(const std::string &sql);

   private:
    std::shared_ptr<sqlite::database> db_;
    std::shared_ptr<const runtime::MemoryProvider> memory_provider_;
    log::Logger logger_;
  };

}  // namespace lapphost::host_api

OUTCOME_HPP_DECLARE_ERROR(lapphost::host_api, DatabaseError);
