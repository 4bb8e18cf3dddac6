/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host_api/host_imports_builder.hpp"

#include <fmt/ranges.h>

#include "host_api/impl/database_extension.hpp"
#include "host_api/impl/http_extension.hpp"
#include "host_api/impl/sleep_extension.hpp"
#include "runtime/memory_provider.hpp"

namespace lapphost::host_api {
  using lapps::Permission;
  using runtime::HostFunction;
  using runtime::WasmSpan;

  namespace {
    outcome::result<void> registerDatabase(const ImportsContext &ctx,
                                           runtime::HostImports &imports) {
      filesystem::path path{ctx.settings.database.path};
      if (path.is_relative()) {
        path = ctx.root_dir / path;
      }
      OUTCOME_TRY(db, DatabaseExtension::open(path));
      auto ext = std::make_shared<DatabaseExtension>(std::move(db),
                                                     ctx.memory_provider);

      imports.functions.push_back(HostFunction::make<WasmSpan, WasmSpan>(
          "db_execute",
          [ext](WasmSpan sql) { return ext->db_execute(sql); }));
      imports.functions.push_back(HostFunction::make<WasmSpan, WasmSpan>(
          "db_query", [ext](WasmSpan sql) { return ext->db_query(sql); }));
      imports.functions.push_back(HostFunction::make<WasmSpan, WasmSpan>(
          "db_query_row",
          [ext](WasmSpan sql) { return ext->db_query_row(sql); }));
      return outcome::success();
    }

    outcome::result<void> registerHttp(const ImportsContext &ctx,
                                       runtime::HostImports &imports) {
      auto ext = std::make_shared<HttpExtension>(ctx.http_client,
                                                 ctx.settings.network.http,
                                                 ctx.http_timeout,
                                                 ctx.memory_provider);
      imports.functions.push_back(HostFunction::make<WasmSpan, WasmSpan>(
          "invoke_http",
          [ext](WasmSpan request) { return ext->invoke_http(request); }));
      return outcome::success();
    }

    outcome::result<void> registerSleep(const ImportsContext &,
                                        runtime::HostImports &imports) {
      auto ext = std::make_shared<SleepExtension>();
      imports.functions.push_back(HostFunction::make<void, uint64_t>(
          "invoke_sleep",
          [ext](uint64_t millis) { return ext->invoke_sleep(millis); }));
      return outcome::success();
    }
  }  // namespace

  std::map<Permission, HostImportsBuilder::Registrar>
  HostImportsBuilder::defaultRegistrars() {
    return {
        {Permission::Database, &registerDatabase},
        {Permission::Http, &registerHttp},
        {Permission::Sleep, &registerSleep},
    };
  }

  HostImportsBuilder::HostImportsBuilder()
      : HostImportsBuilder{defaultRegistrars()} {}

  HostImportsBuilder::HostImportsBuilder(
      std::map<Permission, Registrar> registrars)
      : registrars_{std::move(registrars)},
        logger_{log::createLogger("HostImportsBuilder", "host_api")} {}

  outcome::result<std::optional<runtime::WasiConfig>>
  HostImportsBuilder::makeWasi(const ImportsContext &ctx) const {
    const auto &permissions = ctx.settings.permissions;
    if (not permissions.isRequired(Permission::FileRead)
        and not permissions.isRequired(Permission::FileWrite)) {
      return std::nullopt;
    }
    runtime::WasiConfig wasi;
    if (permissions.isAllowed(Permission::FileRead)
        or permissions.isAllowed(Permission::FileWrite)) {
      auto data_dir = ctx.root_dir / kDataDirName;
      std::error_code ec;
      filesystem::create_directories(data_dir, ec);
      if (ec) {
        SL_ERROR(logger_,
                 "Can't create data dir {}: {}",
                 data_dir.string(),
                 ec.message());
        return ec;
      }
      if (permissions.isAllowed(Permission::FileWrite)
          and not permissions.isAllowed(Permission::FileRead)) {
        // WASI preopens have no write-only mode
        SL_WARN(logger_,
                "{} is granted without {}, the data dir is readable too",
                Permission::FileWrite,
                Permission::FileRead);
      }
      wasi.preopen = runtime::WasiConfig::Preopen{
          .host_dir = data_dir.string(),
          .readonly = not permissions.isAllowed(Permission::FileWrite),
      };
    }
    return wasi;
  }

  outcome::result<runtime::HostImports> HostImportsBuilder::build(
      const ImportsContext &ctx) const {
    BOOST_ASSERT(ctx.memory_provider);
    runtime::HostImports imports;
    OUTCOME_TRY(wasi, makeWasi(ctx));
    imports.wasi = std::move(wasi);

    for (auto permission : ctx.settings.permissions.allowedPermissions()) {
      auto it = registrars_.find(permission);
      if (it == registrars_.end()) {
        continue;
      }
      OUTCOME_TRY(it->second(ctx, imports));
    }

    std::vector<std::string_view> names;
    for (auto &function : imports.functions) {
      names.emplace_back(function.name);
    }
    SL_DEBUG(logger_,
             "Imports of {}: wasi {}, functions [{}]",
             ctx.root_dir.string(),
             imports.wasi.has_value(),
             fmt::join(names, ", "));
    return imports;
  }

}  // namespace lapphost::host_api
