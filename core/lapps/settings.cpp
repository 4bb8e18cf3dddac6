/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "lapps/settings.hpp"

#include <algorithm>
#include <cctype>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include "log/logger.hpp"
#include "utils/read_file.hpp"
#include "utils/write_file.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lapphost::lapps, SettingsError, e) {
  using E = lapphost::lapps::SettingsError;
  switch (e) {
    case E::READ_FAILED:
      return "Lapp settings file can not be read";
    case E::PARSE_FAILED:
      return "Lapp settings file is not a valid json";
    case E::INVALID_VALUE:
      return "Lapp settings file contains an invalid value";
    case E::WRITE_FAILED:
      return "Lapp settings file can not be written";
  }
  return "Unknown lapp settings error";
}

namespace lapphost::lapps {
  namespace {
    constexpr std::string_view kAll = "all";

    log::Logger &logger() {
      static auto logger = log::createLogger("LappSettings", "lapps");
      return logger;
    }

    const rapidjson::Value *member(const rapidjson::Value &val,
                                   const char *name) {
      if (not val.IsObject()) {
        return nullptr;
      }
      auto m = val.FindMember(name);
      if (m == val.MemberEnd()) {
        return nullptr;
      }
      return &m->value;
    }

    outcome::result<void> load_str(const rapidjson::Value &val,
                                   const char *name,
                                   std::string &target) {
      if (auto m = member(val, name)) {
        if (not m->IsString()) {
          SL_WARN(logger(), "'{}' must be a string", name);
          return SettingsError::INVALID_VALUE;
        }
        target.assign(m->GetString(), m->GetStringLength());
      }
      return outcome::success();
    }

    outcome::result<void> load_bool(const rapidjson::Value &val,
                                    const char *name,
                                    bool &target) {
      if (auto m = member(val, name)) {
        if (not m->IsBool()) {
          SL_WARN(logger(), "'{}' must be a boolean", name);
          return SettingsError::INVALID_VALUE;
        }
        target = m->GetBool();
      }
      return outcome::success();
    }

    outcome::result<std::vector<std::string>> load_str_list(
        const rapidjson::Value &val, const char *name) {
      std::vector<std::string> result;
      if (auto m = member(val, name)) {
        if (not m->IsArray()) {
          SL_WARN(logger(), "'{}' must be a list", name);
          return SettingsError::INVALID_VALUE;
        }
        for (auto &item : m->GetArray()) {
          if (not item.IsString()) {
            SL_WARN(logger(), "'{}' must contain strings only", name);
            return SettingsError::INVALID_VALUE;
          }
          result.emplace_back(item.GetString(), item.GetStringLength());
        }
      }
      return result;
    }

    /// Either "all" or a list of strings
    outcome::result<std::optional<std::set<std::string>>> load_access_list(
        const rapidjson::Value &val, const char *name) {
      auto m = member(val, name);
      if (m == nullptr) {
        return std::nullopt;
      }
      if (m->IsString() and std::string_view{m->GetString()} == kAll) {
        return std::nullopt;
      }
      OUTCOME_TRY(list, load_str_list(val, name));
      return std::set<std::string>{list.begin(), list.end()};
    }

    outcome::result<std::set<Permission>> load_permissions(
        const rapidjson::Value &val, const char *name) {
      OUTCOME_TRY(names, load_str_list(val, name));
      std::set<Permission> result;
      for (auto &str : names) {
        if (auto permission = permissionFromString(str)) {
          result.insert(*permission);
        } else {
          SL_WARN(logger(), "Unknown permission '{}' is ignored", str);
        }
      }
      return result;
    }

    bool isListed(const std::optional<std::set<std::string>> &list,
                  std::string_view item) {
      return not list.has_value() or list->contains(std::string{item});
    }

    template <typename Writer>
    void writeAccessList(Writer &writer,
                         const char *name,
                         const std::optional<std::set<std::string>> &list) {
      writer.Key(name);
      if (not list) {
        writer.String(kAll.data(), kAll.size());
        return;
      }
      writer.StartArray();
      for (auto &item : *list) {
        writer.String(item.data(), item.size());
      }
      writer.EndArray();
    }

    template <typename Writer>
    void writePermissions(Writer &writer,
                          const char *name,
                          const std::set<Permission> &permissions) {
      writer.Key(name);
      writer.StartArray();
      for (auto permission : permissions) {
        auto str = toString(permission);
        writer.String(str.data(), str.size());
      }
      writer.EndArray();
    }
  }  // namespace

  bool HttpSettings::isMethodAllowed(std::string_view method) const {
    return isListed(methods, method);
  }

  bool HttpSettings::isHostAllowed(std::string_view host) const {
    return isListed(hosts, host);
  }

  outcome::result<LappSettings> LappSettings::parse(std::string_view json) {
    rapidjson::Document document;
    document.Parse(json.data(), json.size());
    if (document.HasParseError()) {
      SL_WARN(logger(),
              "Settings parse failed with error {} at offset {}",
              GetParseError_En(document.GetParseError()),
              document.GetErrorOffset());
      return SettingsError::PARSE_FAILED;
    }
    if (not document.IsObject()) {
      return SettingsError::PARSE_FAILED;
    }

    LappSettings settings;
    if (auto application = member(document, "application")) {
      OUTCOME_TRY(load_str(*application, "title", settings.application.title));
      OUTCOME_TRY(
          load_bool(*application, "enabled", settings.application.enabled));
    }

    if (auto permissions = member(document, "permissions")) {
      OUTCOME_TRY(required, load_permissions(*permissions, "required"));
      OUTCOME_TRY(allowed, load_permissions(*permissions, "allowed"));
      for (auto permission : allowed) {
        if (not required.contains(permission)) {
          SL_WARN(logger(),
                  "Permission '{}' is allowed but not required, dropped",
                  permission);
        }
      }
      settings.permissions = Capabilities{std::move(required), allowed};
    }

    if (auto database = member(document, "database")) {
      OUTCOME_TRY(load_str(*database, "path", settings.database.path));
    }

    if (auto network = member(document, "network")) {
      if (auto http = member(*network, "http")) {
        auto &target = settings.network.http;
        OUTCOME_TRY(methods, load_access_list(*http, "methods"));
        OUTCOME_TRY(hosts, load_access_list(*http, "hosts"));
        if (methods) {
          // methods are compared in upper case
          std::set<std::string> upper;
          for (auto method : *methods) {
            std::transform(method.begin(),
                           method.end(),
                           method.begin(),
                           [](unsigned char ch) { return std::toupper(ch); });
            upper.insert(std::move(method));
          }
          methods = std::move(upper);
        }
        target.methods = std::move(methods);
        target.hosts = std::move(hosts);
        if (auto timeout = member(*http, "timeout_ms")) {
          if (not timeout->IsUint64()) {
            SL_WARN(logger(), "'timeout_ms' must be a positive integer");
            return SettingsError::INVALID_VALUE;
          }
          target.timeout = std::chrono::milliseconds(timeout->GetUint64());
        }
      }
      if (auto gossipsub = member(*network, "gossipsub")) {
        auto &target = settings.network.gossipsub;
        OUTCOME_TRY(load_str(*gossipsub, "addr", target.addr));
        if (auto ports = member(*gossipsub, "dial_ports")) {
          if (not ports->IsArray()) {
            return SettingsError::INVALID_VALUE;
          }
          for (auto &port : ports->GetArray()) {
            if (not port.IsUint() or port.GetUint() > 0xFFFF) {
              SL_WARN(logger(), "'dial_ports' must contain port numbers");
              return SettingsError::INVALID_VALUE;
            }
            target.dial_ports.push_back(static_cast<uint16_t>(port.GetUint()));
          }
        }
      }
    }
    return settings;
  }

  outcome::result<LappSettings> LappSettings::load(
      const filesystem::path &path) {
    std::string json;
    if (not readFile(json, path)) {
      return SettingsError::READ_FAILED;
    }
    return parse(json);
  }

  std::string LappSettings::toJson() const {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();

    writer.Key("application");
    writer.StartObject();
    writer.Key("title");
    writer.String(application.title.data(), application.title.size());
    writer.Key("enabled");
    writer.Bool(application.enabled);
    writer.EndObject();

    writer.Key("permissions");
    writer.StartObject();
    writePermissions(writer, "required", permissions.requiredPermissions());
    writePermissions(writer, "allowed", permissions.allowedPermissions());
    writer.EndObject();

    writer.Key("database");
    writer.StartObject();
    writer.Key("path");
    writer.String(database.path.data(), database.path.size());
    writer.EndObject();

    writer.Key("network");
    writer.StartObject();
    writer.Key("http");
    writer.StartObject();
    writeAccessList(writer, "methods", network.http.methods);
    writeAccessList(writer, "hosts", network.http.hosts);
    if (network.http.timeout) {
      writer.Key("timeout_ms");
      writer.Uint64(network.http.timeout->count());
    }
    writer.EndObject();
    writer.Key("gossipsub");
    writer.StartObject();
    writer.Key("addr");
    writer.String(network.gossipsub.addr.data(), network.gossipsub.addr.size());
    writer.Key("dial_ports");
    writer.StartArray();
    for (auto port : network.gossipsub.dial_ports) {
      writer.Uint(port);
    }
    writer.EndArray();
    writer.EndObject();
    writer.EndObject();

    writer.EndObject();
    return std::string{buffer.GetString(), buffer.GetSize()};
  }

  outcome::result<void> LappSettings::save(const filesystem::path &path) const {
    if (auto res = writeFileTmp(path, toJson()); not res) {
      SL_ERROR(logger(),
               "Failed to write settings to {}: {}",
               path.string(),
               res.error().message());
      return SettingsError::WRITE_FAILED;
    }
    return outcome::success();
  }

}  // namespace lapphost::lapps
