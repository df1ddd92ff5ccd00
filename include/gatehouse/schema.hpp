#pragma once

#include "error.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace gatehouse {

enum class param_type { any, string, number, integer, boolean, object, array };

inline const char *type_name(param_type type) {
  switch (type) {
  case param_type::any:
    return "any";
  case param_type::string:
    return "string";
  case param_type::number:
    return "number";
  case param_type::integer:
    return "integer";
  case param_type::boolean:
    return "boolean";
  case param_type::object:
    return "object";
  case param_type::array:
    return "array";
  }
  return "any";
}

struct param_spec {
  std::string name;
  param_type type = param_type::any;
  bool required = true;
  std::string description;
};

struct schema_issue {
  enum class kind { missing, unknown, mistyped } what;
  std::string field;
  std::string expected;
};

/// Flat object schema for method params. Unknown fields are rejected
/// unless `allow_unknown` is set.
struct object_schema {
  std::vector<param_spec> fields;
  bool allow_unknown = false;

  object_schema &required(std::string name, param_type type,
                          std::string description = {}) {
    fields.push_back({std::move(name), type, true, std::move(description)});
    return *this;
  }

  object_schema &optional(std::string name, param_type type,
                          std::string description = {}) {
    fields.push_back({std::move(name), type, false, std::move(description)});
    return *this;
  }
};

inline bool type_matches(const nlohmann::json &value, param_type type) {
  switch (type) {
  case param_type::any:
    return true;
  case param_type::string:
    return value.is_string();
  case param_type::number:
    return value.is_number();
  case param_type::integer:
    return value.is_number_integer();
  case param_type::boolean:
    return value.is_boolean();
  case param_type::object:
    return value.is_object();
  case param_type::array:
    return value.is_array();
  }
  return false;
}

inline std::vector<schema_issue> check(const object_schema &schema,
                                       const nlohmann::json &params) {
  std::vector<schema_issue> issues;
  const nlohmann::json empty = nlohmann::json::object();
  const nlohmann::json &obj = params.is_object() ? params : empty;

  for (const auto &field : schema.fields) {
    auto it = obj.find(field.name);
    if (it == obj.end() || it->is_null()) {
      if (field.required) {
        issues.push_back({schema_issue::kind::missing, field.name,
                          type_name(field.type)});
      }
      continue;
    }
    if (!type_matches(*it, field.type)) {
      issues.push_back({schema_issue::kind::mistyped, field.name,
                        type_name(field.type)});
    }
  }

  if (!schema.allow_unknown) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
      bool known = false;
      for (const auto &field : schema.fields) {
        if (field.name == it.key()) {
          known = true;
          break;
        }
      }
      if (!known) {
        issues.push_back({schema_issue::kind::unknown, it.key(), ""});
      }
    }
  }
  return issues;
}

/// Throws a validation_error that names every offending field.
inline void validate(const std::string &method, const object_schema &schema,
                     const nlohmann::json &params) {
  auto issues = check(schema, params);
  if (issues.empty()) {
    return;
  }

  std::string message = "Invalid params for " + method + ":";
  nlohmann::json details = nlohmann::json::array();
  for (size_t i = 0; i < issues.size(); ++i) {
    const auto &issue = issues[i];
    std::string line;
    const char *kind = "";
    switch (issue.what) {
    case schema_issue::kind::missing:
      kind = "missing";
      line = "missing required field '" + issue.field + "'";
      break;
    case schema_issue::kind::unknown:
      kind = "unknown";
      line = "unknown field '" + issue.field + "'";
      break;
    case schema_issue::kind::mistyped:
      kind = "mistyped";
      line = "field '" + issue.field + "' must be " + issue.expected;
      break;
    }
    message += (i == 0 ? " " : "; ") + line;
    details.push_back(
        {{"field", issue.field}, {"issue", kind}, {"expected", issue.expected}});
  }
  throw gateway_error(error_code::validation_error, message,
                      {{"issues", details}});
}

inline nlohmann::json to_json(const object_schema &schema) {
  nlohmann::json properties = nlohmann::json::object();
  nlohmann::json required = nlohmann::json::array();
  for (const auto &field : schema.fields) {
    nlohmann::json prop = nlohmann::json::object();
    if (field.type != param_type::any) {
      prop["type"] = type_name(field.type);
    }
    if (!field.description.empty()) {
      prop["description"] = field.description;
    }
    properties[field.name] = prop;
    if (field.required) {
      required.push_back(field.name);
    }
  }
  return {{"type", "object"},
          {"properties", properties},
          {"required", required},
          {"additionalProperties", schema.allow_unknown}};
}

/// Method declaration shared by local extensions and remote registrations.
/// Remote methods carry their schema as opaque json only.
struct method_definition {
  std::string name;
  std::string description;
  object_schema input_schema;
  nlohmann::json schema_json = nullptr;
};

inline nlohmann::json to_json(const method_definition &method) {
  return {{"name", method.name},
          {"description", method.description},
          {"inputSchema", method.schema_json.is_null()
                              ? to_json(method.input_schema)
                              : method.schema_json}};
}

} // namespace gatehouse
