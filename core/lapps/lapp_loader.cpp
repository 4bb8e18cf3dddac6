/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "lapps/lapp_loader.hpp"

#include "host_api/host_imports_builder.hpp"
#include "host_api/impl/database_extension.hpp"
#include "runtime/common/export_allocator.hpp"
#include "runtime/memory_provider.hpp"
#include "runtime/module.hpp"
#include "runtime/module_factory.hpp"
#include "runtime/module_instance.hpp"
#include "utils/read_file.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lapphost::lapps, LoaderError, e) {
  using E = lapphost::lapps::LoaderError;
  switch (e) {
    case E::READ_MODULE_FAILED:
      return "Failed to read lapp module file";
    case E::COMPILATION_FAILED:
      return "Failed to compile lapp module";
    case E::DATABASE_OPEN_FAILED:
      return "Failed to open lapp database";
    case E::INSTANTIATION_FAILED:
      return "Failed to instantiate lapp module";
    case E::MEMORY_EXPORT_MISSING:
      return "Lapp module does not export memory and allocator";
    case E::STARTUP_FAILED:
      return "Lapp module start-up call failed";
    case E::INIT_RESULT_INVALID:
      return "Lapp init returned an invalid result";
    case E::APPLICATION_INIT_FAILED:
      return "Lapp init reported a failure";
  }
  return "Unknown lapp loader error";
}

namespace lapphost::lapps {

  LappLoader::LappLoader(
      std::shared_ptr<runtime::ModuleFactory> module_factory,
      std::shared_ptr<host_api::HostImportsBuilder> imports_builder,
      std::shared_ptr<const http::HttpClient> http_client,
      std::chrono::milliseconds http_timeout)
      : module_factory_{std::move(module_factory)},
        imports_builder_{std::move(imports_builder)},
        http_client_{std::move(http_client)},
        http_timeout_{http_timeout},
        log_{log::createLogger("LappLoader", "lapps")} {
    BOOST_ASSERT(module_factory_);
    BOOST_ASSERT(imports_builder_);
  }

  filesystem::path LappLoader::serverModuleFile(
      const filesystem::path &root_dir, std::string_view name) {
    return root_dir / fmt::format("{}_server.wasm", name);
  }

  LoadOutcome<std::shared_ptr<runtime::ModuleInstance>> LappLoader::load(
      const LoadRequest &request) const {
    auto path = serverModuleFile(request.root_dir, request.name);
    Buffer code;
    if (auto res = readFile(code, path); not res) {
      SL_ERROR(log_,
               "Can't read module of lapp {} from {}: {}",
               request.name,
               path.string(),
               res.error().message());
      return LoadError{LoaderError::READ_MODULE_FAILED,
                       fmt::format("{}: {}", path.string(),
                                   res.error().message())};
    }

    auto module_res = module_factory_->make(code);
    if (not module_res) {
      SL_ERROR(log_,
               "Can't compile module of lapp {}: {}",
               request.name,
               module_res.error().message());
      return LoadError{LoaderError::COMPILATION_FAILED,
                       std::string{module_res.error().message()}};
    }
    auto &module = module_res.value();

    auto memory_provider = std::make_shared<runtime::MemoryProvider>();
    host_api::ImportsContext ctx{
        .root_dir = request.root_dir,
        .settings = request.settings,
        .http_client = http_client_,
        .http_timeout = http_timeout_,
        .memory_provider = memory_provider,
    };
    auto imports_res = imports_builder_->build(ctx);
    if (not imports_res) {
      const auto &ec = imports_res.error();
      SL_ERROR(log_,
               "Can't build imports of lapp {}: {}",
               request.name,
               ec.message());
      if (ec == host_api::DatabaseError::OPEN_FAILED) {
        return LoadError{LoaderError::DATABASE_OPEN_FAILED, ec.message()};
      }
      return LoadError{LoaderError::INSTANTIATION_FAILED, ec.message()};
    }

    auto instance_res = module->instantiate(std::move(imports_res.value()),
                                            memory_provider);
    if (not instance_res) {
      SL_ERROR(log_,
               "Can't instantiate lapp {}: {}",
               request.name,
               instance_res.error().message());
      return LoadError{LoaderError::INSTANTIATION_FAILED,
                       instance_res.error().message()};
    }
    auto &instance = instance_res.value();

    if (not memory_provider->getCurrentMemory()
        or not instance->hasExport(runtime::kAllocExport)) {
      SL_ERROR(log_, "Lapp {} does not export memory or alloc", request.name);
      return LoadError{LoaderError::MEMORY_EXPORT_MISSING,
                       "module must export 'memory' and 'alloc'"};
    }

    if (auto res = startup(*instance); not res) {
      SL_ERROR(log_,
               "Start-up of lapp {} failed: {}",
               request.name,
               res.error().message());
      return res.as_failure();
    }

    SL_INFO(log_, "Lapp {} loaded from {}", request.name, path.string());
    return instance;
  }

  LoadOutcome<void> LappLoader::startup(
      runtime::ModuleInstance &instance) const {
    for (std::string_view name : kStartExports) {
      if (not instance.hasExport(name)) {
        continue;
      }
      if (auto res = instance.invoke(name, {}); not res) {
        return LoadError{
            LoaderError::STARTUP_FAILED,
            fmt::format("'{}' failed: {}", name, res.error().message())};
      }
    }

    if (not instance.hasExport(kInitExport)) {
      return outcome::success();
    }
    auto res = instance.invoke(kInitExport, {});
    if (not res) {
      return LoadError{
          LoaderError::STARTUP_FAILED,
          fmt::format("'{}' failed: {}", kInitExport, res.error().message())};
    }
    if (not res.value()) {
      return LoadError{LoaderError::INIT_RESULT_INVALID,
                       "init returned no value"};
    }

    auto memory = instance.memoryProvider()->memory();
    if (not memory) {
      return LoadError{LoaderError::INIT_RESULT_INVALID,
                       memory.error().message()};
    }
    auto init_error = memory.value().get().takeDecoded<std::optional<std::string>>(
        *res.value());
    if (not init_error) {
      return LoadError{LoaderError::INIT_RESULT_INVALID,
                       init_error.error().message()};
    }
    if (init_error.value()) {
      return LoadError{LoaderError::APPLICATION_INIT_FAILED,
                       std::move(*init_error.value())};
    }
    return outcome::success();
  }

}  // namespace lapphost::lapps
