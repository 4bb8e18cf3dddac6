/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "lapps/lapp.hpp"

#include "runtime/module_instance.hpp"

namespace lapphost::lapps {

  namespace {
    constexpr std::string_view kProcessHttpExport = "process_http";
    constexpr std::string_view kRouteMessageExport = "route_message";
  }  // namespace

  Lapp::Lapp(std::string name,
             filesystem::path root_dir,
             LappSettings settings,
             std::shared_ptr<const LappLoader> loader)
      : name_{std::move(name)},
        root_dir_{std::move(root_dir)},
        settings_{std::move(settings)},
        loader_{std::move(loader)},
        log_{log::createLogger(fmt::format("Lapp:{}", name_), "lapps")} {
    BOOST_ASSERT(loader_);
  }

  Lapp::Lapp(std::string name,
             filesystem::path root_dir,
             std::shared_ptr<const LappLoader> loader)
      : Lapp{std::move(name), std::move(root_dir), {}, std::move(loader)} {
    if (isMain()) {
      return;
    }
    if (auto res = reloadSettings(); not res) {
      SL_ERROR(log_,
               "Can't load settings from {}: {}",
               settingsFile().string(),
               res.error().message());
    }
  }

  filesystem::path Lapp::settingsFile() const {
    return root_dir_ / LappSettings::kFileName;
  }

  filesystem::path Lapp::serverModuleFile() const {
    return LappLoader::serverModuleFile(root_dir_, name_);
  }

  outcome::result<void> Lapp::reloadSettings() {
    auto path = settingsFile();
    if (not filesystem::exists(path)) {
      SL_DEBUG(log_, "No settings file, defaults are used");
      settings_ = {};
      return outcome::success();
    }
    OUTCOME_TRY(settings, LappSettings::load(path));
    settings_ = std::move(settings);
    return outcome::success();
  }

  outcome::result<void> Lapp::saveSettings() const {
    return settings_.save(settingsFile());
  }

  LoadOutcome<void> Lapp::load() {
    if (isLoaded()) {
      return LoadError{make_error_code(LappError::ALREADY_LOADED),
                       fmt::format("lapp '{}' is already loaded", name_)};
    }
    auto instance = loader_->load(LoadRequest{
        .name = name_,
        .root_dir = root_dir_,
        .settings = settings_,
    });
    if (not instance) {
      return instance.as_failure();
    }
    instance_ = std::move(instance.value());
    return outcome::success();
  }

  std::optional<ServiceSender> Lapp::unload() {
    if (instance_) {
      SL_INFO(log_, "Unloading");
    }
    instance_.reset();
    return takeServiceSender();
  }

  outcome::result<UpdateQuery> Lapp::update(const UpdateQuery &query) {
    // applied to a copy, the lapp keeps its settings if saving fails
    auto settings = settings_;
    UpdateQuery changed;
    if (query.enabled and *query.enabled != settings.application.enabled) {
      settings.application.enabled = *query.enabled;
      changed.enabled = query.enabled;
    }
    if (query.allow_permission
        and settings.permissions.allow(*query.allow_permission)) {
      changed.allow_permission = query.allow_permission;
    }
    if (query.deny_permission
        and settings.permissions.deny(*query.deny_permission)) {
      changed.deny_permission = query.deny_permission;
    }
    OUTCOME_TRY(settings.save(settingsFile()));
    settings_ = std::move(settings);

    if (changed.enabled) {
      SL_INFO(log_, "{}", *changed.enabled ? "Enabled" : "Disabled");
    }
    if (changed.allow_permission) {
      SL_INFO(log_, "Permission {} allowed", *changed.allow_permission);
    }
    if (changed.deny_permission) {
      SL_INFO(log_, "Permission {} denied", *changed.deny_permission);
    }
    return changed;
  }

  outcome::result<http::Response> Lapp::processHttp(
      const http::Request &request) const {
    if (not isLoaded()) {
      return LappError::NOT_LOADED;
    }
    if (not isEnabled()) {
      return LappError::NOT_ENABLED;
    }
    if (not isAllowed(Permission::ClientHttp)) {
      return LappError::PERMISSION_DENIED;
    }
    return instance_->callAndDecodeExportFunction<http::Response>(
        kProcessHttpExport, request);
  }

  outcome::result<std::optional<std::string>> Lapp::routeMessage(
      BufferView message) const {
    if (not isLoaded()) {
      return LappError::NOT_LOADED;
    }
    if (not isEnabled()) {
      return LappError::NOT_ENABLED;
    }
    if (not isAllowed(Permission::Websocket)) {
      return LappError::PERMISSION_DENIED;
    }
    OUTCOME_TRY(result,
                instance_->callExportFunction(kRouteMessageExport, message));
    auto error = ::scale::decode<std::optional<std::string>>(result);
    if (not error) {
      return runtime::ModuleInstance::Error::INVALID_CALL_RESULT;
    }
    return std::move(error.value());
  }

}  // namespace lapphost::lapps
