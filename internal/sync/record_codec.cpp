#include "record_codec.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <vector>

#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"

namespace dedup::sync {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

void AppendEscaped(std::string& out, const std::string& s) {
  out.push_back('"');
  for (char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
  out.push_back('"');
}

std::string FormatNumber(double v) {
  if (!std::isfinite(v)) {
    // JSON has no representation; null keeps the output parseable
    return "null";
  }
  char buf[32];
  if (std::trunc(v) == v && std::fabs(v) < 1e15) {
    std::snprintf(buf, sizeof(buf), "%.0f", v);
  } else {
    std::snprintf(buf, sizeof(buf), "%.17g", v);
  }
  return buf;
}

void AppendValue(std::string& out, const Value& value);

void AppendStruct(std::string& out, const Struct& record) {
  std::vector<const std::string*> keys;
  keys.reserve(record.fields_size());
  for (const auto& field : record.fields()) keys.push_back(&field.first);
  std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

  out.push_back('{');
  bool first = true;
  for (const auto* key : keys) {
    if (!first) out.push_back(',');
    first = false;
    AppendEscaped(out, *key);
    out.push_back(':');
    AppendValue(out, record.fields().at(*key));
  }
  out.push_back('}');
}

void AppendValue(std::string& out, const Value& value) {
  switch (value.kind_case()) {
    case Value::kStringValue:
      AppendEscaped(out, value.string_value());
      break;
    case Value::kNumberValue:
      out += FormatNumber(value.number_value());
      break;
    case Value::kBoolValue:
      out += value.bool_value() ? "true" : "false";
      break;
    case Value::kStructValue:
      AppendStruct(out, value.struct_value());
      break;
    case Value::kListValue: {
      out.push_back('[');
      bool first = true;
      for (const auto& item : value.list_value().values()) {
        if (!first) out.push_back(',');
        first = false;
        AppendValue(out, item);
      }
      out.push_back(']');
      break;
    }
    case Value::kNullValue:
    case Value::KIND_NOT_SET:
      out += "null";
      break;
  }
}

// Text form of a scalar; null/missing/empty -> nullopt.
std::optional<std::string> ScalarText(const Value& value) {
  switch (value.kind_case()) {
    case Value::kStringValue:
      if (value.string_value().empty()) return std::nullopt;
      return value.string_value();
    case Value::kNumberValue:
    case Value::kBoolValue:
      return CanonicalJson(value);
    default:
      return std::nullopt;
  }
}

std::optional<std::string> Field(const Struct& record, const std::string& key) {
  auto it = record.fields().find(key);
  if (it == record.fields().end()) return std::nullopt;
  return ScalarText(it->second);
}

const google::protobuf::ListValue* ListField(const Struct& record, const std::string& key) {
  auto it = record.fields().find(key);
  if (it == record.fields().end() || it->second.kind_case() != Value::kListValue) return nullptr;
  return &it->second.list_value();
}

// Items are either {"<key>": ...} objects or bare scalars.
std::optional<std::string> ItemField(const Value& item, const std::string& key) {
  if (item.kind_case() == Value::kStructValue) return Field(item.struct_value(), key);
  return ScalarText(item);
}

} // namespace

std::string CanonicalJson(const Struct& record) {
  std::string out;
  AppendStruct(out, record);
  return out;
}

std::string CanonicalJson(const Value& value) {
  std::string out;
  AppendValue(out, value);
  return out;
}

std::string RecordHash(const Struct& record) {
  return util::Sha256Hex(CanonicalJson(record));
}

std::optional<std::string> RecordId(const Struct& record) {
  auto it = record.fields().find("id");
  if (it == record.fields().end()) return std::nullopt;

  const auto& value = it->second;
  if (value.kind_case() == Value::kStringValue && !value.string_value().empty()) {
    return value.string_value();
  }
  if (value.kind_case() == Value::kNumberValue && std::trunc(value.number_value()) == value.number_value()) {
    return FormatNumber(value.number_value());
  }
  return std::nullopt;
}

db::model::ContactRecord DecodeContact(const Struct& record, const std::string& synced_at) {
  auto id = RecordId(record);
  if (!id) {
    throw util::InvalidArgument("contact record has no id");
  }

  db::model::ContactRecord contact;
  contact.id         = *id;
  contact.first_name = Field(record, "first_name");
  contact.last_name  = Field(record, "last_name");
  contact.job_title  = Field(record, "job_title");
  contact.linkedin   = Field(record, "linkedin");
  contact.website    = Field(record, "website");
  contact.birthday   = Field(record, "birthday");

  if (const auto* emails = ListField(record, "emails")) {
    for (const auto& item : emails->values()) {
      if (auto email = ItemField(item, "email")) contact.emails.push_back({0, contact.id, *email});
    }
  }

  if (const auto* phones = ListField(record, "phones")) {
    for (const auto& item : phones->values()) {
      auto number = ItemField(item, "phone_number");
      if (!number) continue;
      std::string label;
      if (item.kind_case() == Value::kStructValue) label = Field(item.struct_value(), "label").value_or("");
      contact.phones.push_back({0, contact.id, *number, label});
    }
  }

  contact.full_data      = CanonicalJson(record);
  contact.record_hash    = util::Sha256Hex(contact.full_data);
  contact.last_synced_at = synced_at;
  return contact;
}

} // namespace dedup::sync
