/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host_api/impl/database_extension.hpp"

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include "runtime/memory_provider.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lapphost::host_api, DatabaseError, e) {
  using E = lapphost::host_api::DatabaseError;
  switch (e) {
    case E::OPEN_FAILED:
      return "Lapp database can not be opened";
  }
  return "Unknown database error";
}

namespace lapphost::host_api {
  namespace {
    using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

    Value readColumn(sqlite3_stmt *stmt, int column) {
      switch (sqlite3_column_type(stmt, column)) {
        case SQLITE_INTEGER:
          return Value{static_cast<int64_t>(sqlite3_column_int64(stmt, column))};
        case SQLITE_FLOAT:
          return Value{sqlite3_column_double(stmt, column)};
        case SQLITE_TEXT: {
          auto text = sqlite3_column_text(stmt, column);
          auto size = sqlite3_column_bytes(stmt, column);
          return Value{
              std::string(reinterpret_cast<const char *>(text), size)};
        }
        case SQLITE_BLOB: {
          auto data =
              static_cast<const uint8_t *>(sqlite3_column_blob(stmt, column));
          auto size = sqlite3_column_bytes(stmt, column);
          return Value{Buffer(data, data + size)};
        }
        default:
          return Value{Null{}};
      }
    }

    /**
     * Runs a single statement and collects at most `limit` rows
     */
    Result<std::vector<Row>, std::string> select(sqlite3 *db,
                                                 const std::string &sql,
                                                 size_t limit) {
      sqlite3_stmt *raw = nullptr;
      if (sqlite3_prepare_v2(db, sql.c_str(), sql.size(), &raw, nullptr)
          != SQLITE_OK) {
        return Result<std::vector<Row>, std::string>::err(sqlite3_errmsg(db));
      }
      Statement stmt{raw, &sqlite3_finalize};
      std::vector<Row> rows;
      while (rows.size() < limit) {
        auto rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
          break;
        }
        if (rc != SQLITE_ROW) {
          return Result<std::vector<Row>, std::string>::err(sqlite3_errmsg(db));
        }
        auto columns = sqlite3_column_count(stmt.get());
        Row row;
        row.reserve(columns);
        for (int i = 0; i < columns; ++i) {
          row.push_back(readColumn(stmt.get(), i));
        }
        rows.push_back(std::move(row));
      }
      return Result<std::vector<Row>, std::string>::ok(std::move(rows));
    }
  }  // namespace

  DatabaseExtension::DatabaseExtension(
      std::shared_ptr<sqlite::database> db,
      std::shared_ptr<const runtime::MemoryProvider> memory_provider)
      : db_{std::move(db)},
        memory_provider_{std::move(memory_provider)},
        logger_{log::createLogger("DatabaseExtension", "database_extension")} {
    BOOST_ASSERT(db_);
    BOOST_ASSERT(memory_provider_);
  }

  outcome::result<std::shared_ptr<sqlite::database>> DatabaseExtension::open(
      const filesystem::path &path) {
    static auto logger =
        log::createLogger("DatabaseExtension", "database_extension");
    try {
      return std::make_shared<sqlite::database>(path.string());
    } catch (const sqlite::sqlite_exception &e) {
      SL_ERROR(logger,
               "Failed to open database {}: {}",
               path.string(),
               e.what());
      return DatabaseError::OPEN_FAILED;
    }
  }

  ExecuteResult DatabaseExtension::execute(const std::string &sql) {
    SL_TRACE(logger_, "execute: {}", sql);
    try {
      *db_ << sql;
      return ExecuteResult::ok(sqlite3_changes(db_->connection().get()));
    } catch (const sqlite::sqlite_exception &e) {
      SL_DEBUG(logger_, "Statement '{}' failed: {}", sql, e.what());
      return ExecuteResult::err(e.what());
    }
  }

  QueryResult DatabaseExtension::query(const std::string &sql) {
    SL_TRACE(logger_, "query: {}", sql);
    return select(db_->connection().get(), sql, SIZE_MAX);
  }

  QueryRowResult DatabaseExtension::queryRow(const std::string &sql) {
    SL_TRACE(logger_, "query_row: {}", sql);
    auto rows = select(db_->connection().get(), sql, 1);
    if (rows.isFailure()) {
      return QueryRowResult::err(rows.error());
    }
    if (rows.value().empty()) {
      return QueryRowResult::ok(std::nullopt);
    }
    return QueryRowResult::ok(rows.value().front());
  }

  outcome::result<runtime::WasmSpan> DatabaseExtension::db_execute(
      runtime::WasmSpan sql) {
    OUTCOME_TRY(memory, memory_provider_->memory());
    OUTCOME_TRY(statement, memory.get().takeDecoded<std::string>(sql));
    return memory.get().storeEncoded(execute(statement));
  }

  outcome::result<runtime::WasmSpan> DatabaseExtension::db_query(
      runtime::WasmSpan sql) {
    OUTCOME_TRY(memory, memory_provider_->memory());
    OUTCOME_TRY(statement, memory.get().takeDecoded<std::string>(sql));
    return memory.get().storeEncoded(query(statement));
  }

  outcome::result<runtime::WasmSpan> DatabaseExtension::db_query_row(
      runtime::WasmSpan sql) {
    OUTCOME_TRY(memory, memory_provider_->memory());
    OUTCOME_TRY(statement, memory.get().takeDecoded<std::string>(sql));
    return memory.get().storeEncoded(queryRow(statement));
  }

}  // namespace lapphost::host_api
