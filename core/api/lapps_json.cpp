/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/lapps_json.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "log/logger.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lapphost::api, LappsJsonError, e) {
  using E = lapphost::api::LappsJsonError;
  switch (e) {
    case E::PARSE_FAILED:
      return "Request is not a valid json object";
    case E::MISSING_LAPP_NAME:
      return "Request has no lapp name";
    case E::INVALID_FIELD:
      return "Request contains an invalid field";
  }
  return "Unknown lapps json error";
}

namespace lapphost::api {
  using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

  namespace {
    log::Logger &logger() {
      static auto logger = log::createLogger("LappsJson", "lapps");
      return logger;
    }

    void writeKey(Writer &writer, std::string_view key) {
      writer.Key(key.data(), key.size());
    }

    void writeString(Writer &writer, std::string_view str) {
      writer.String(str.data(), str.size(), true);
    }

    void writePermissions(Writer &writer,
                          const std::set<lapps::Permission> &permissions) {
      writer.StartArray();
      for (auto permission : permissions) {
        writeString(writer, lapps::toString(permission));
      }
      writer.EndArray();
    }

    void writeQuery(Writer &writer, const UpdateRequest &request) {
      writer.StartObject();
      writeKey(writer, "lapp_name");
      writeString(writer, request.lapp_name);
      if (request.query.enabled) {
        writeKey(writer, "enabled");
        writer.Bool(*request.query.enabled);
      }
      if (request.query.allow_permission) {
        writeKey(writer, "allow_permission");
        writeString(writer, lapps::toString(*request.query.allow_permission));
      }
      if (request.query.deny_permission) {
        writeKey(writer, "deny_permission");
        writeString(writer, lapps::toString(*request.query.deny_permission));
      }
      writer.EndObject();
    }

    outcome::result<std::optional<lapps::Permission>> loadPermission(
        const rapidjson::Value &doc, const char *name) {
      auto m = doc.FindMember(name);
      if (m == doc.MemberEnd() or m->value.IsNull()) {
        return std::nullopt;
      }
      if (not m->value.IsString()) {
        SL_DEBUG(logger(), "'{}' must be a string", name);
        return LappsJsonError::INVALID_FIELD;
      }
      auto permission = lapps::permissionFromString(
          {m->value.GetString(), m->value.GetStringLength()});
      if (not permission) {
        SL_DEBUG(logger(),
                 "'{}' is not a permission: {}",
                 name,
                 m->value.GetString());
        return LappsJsonError::INVALID_FIELD;
      }
      return permission;
    }
  }  // namespace

  std::string lappsToJson(const std::vector<lapps::LappInfo> &lapps) {
    rapidjson::StringBuffer buffer;
    Writer writer{buffer};
    writer.StartObject();
    writeKey(writer, "lapps");
    writer.StartArray();
    for (const auto &lapp : lapps) {
      writer.StartObject();
      writeKey(writer, "name");
      writeString(writer, lapp.name);
      writeKey(writer, "title");
      writeString(writer, lapp.title);
      writeKey(writer, "enabled");
      writer.Bool(lapp.enabled);
      writeKey(writer, "permissions");
      writer.StartObject();
      writeKey(writer, "required");
      writePermissions(writer, lapp.required_permissions);
      writeKey(writer, "allowed");
      writePermissions(writer, lapp.allowed_permissions);
      writer.EndObject();
      writeKey(writer, "loaded");
      writer.Bool(lapp.loaded);
      writeKey(writer, "service_running");
      writer.Bool(lapp.service_running);
      writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();
    return {buffer.GetString(), buffer.GetSize()};
  }

  outcome::result<UpdateRequest> parseUpdateRequest(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError() or not doc.IsObject()) {
      SL_DEBUG(logger(),
               "Invalid update request: {}",
               rapidjson::GetParseError_En(doc.GetParseError()));
      return LappsJsonError::PARSE_FAILED;
    }

    UpdateRequest request;
    auto name = doc.FindMember("lapp_name");
    if (name == doc.MemberEnd() or not name->value.IsString()
        or name->value.GetStringLength() == 0) {
      return LappsJsonError::MISSING_LAPP_NAME;
    }
    request.lapp_name.assign(name->value.GetString(),
                             name->value.GetStringLength());

    if (auto enabled = doc.FindMember("enabled");
        enabled != doc.MemberEnd() and not enabled->value.IsNull()) {
      if (not enabled->value.IsBool()) {
        return LappsJsonError::INVALID_FIELD;
      }
      request.query.enabled = enabled->value.GetBool();
    }
    OUTCOME_TRY(allow, loadPermission(doc, "allow_permission"));
    request.query.allow_permission = allow;
    OUTCOME_TRY(deny, loadPermission(doc, "deny_permission"));
    request.query.deny_permission = deny;
    return request;
  }

  std::string updatedToJson(const UpdateRequest &updated) {
    rapidjson::StringBuffer buffer;
    Writer writer{buffer};
    writer.StartObject();
    writeKey(writer, "updated");
    writeQuery(writer, updated);
    writer.EndObject();
    return {buffer.GetString(), buffer.GetSize()};
  }

}  // namespace lapphost::api
