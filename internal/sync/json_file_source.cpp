#include "json_file_source.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace dedup::sync {

namespace {

// largest integer a JSON number carries exactly
constexpr double kMaxDeclaredTotal = 9007199254740992.0;

std::vector<google::protobuf::Struct> FromList(const google::protobuf::ListValue& list) {
  std::vector<google::protobuf::Struct> out;
  out.reserve(list.values_size());
  for (int i = 0; i < list.values_size(); ++i) {
    const auto& item = list.values(i);
    if (item.kind_case() != google::protobuf::Value::kStructValue) {
      throw std::runtime_error("contact #" + std::to_string(i) + " is not a JSON object");
    }
    out.push_back(item.struct_value());
  }
  return out;
}

} // namespace

std::vector<google::protobuf::Struct> ParseContactDocument(const std::string& json, uint64_t* total) {
  google::protobuf::Value document;
  auto                    status = google::protobuf::util::JsonStringToMessage(json, &document);
  if (!status.ok()) {
    throw std::runtime_error("Invalid contact document: " + std::string(status.message()));
  }

  std::vector<google::protobuf::Struct> contacts;
  uint64_t                              declared_total = 0;
  bool                                  has_total      = false;

  if (document.kind_case() == google::protobuf::Value::kListValue) {
    contacts = FromList(document.list_value());
  } else if (document.kind_case() == google::protobuf::Value::kStructValue) {
    const auto& fields = document.struct_value().fields();
    auto        it     = fields.find("contacts");
    if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kListValue) {
      throw std::runtime_error("Invalid contact document: missing \"contacts\" array");
    }
    contacts = FromList(it->second.list_value());

    auto total_it = fields.find("total");
    if (total_it != fields.end() && total_it->second.kind_case() == google::protobuf::Value::kNumberValue) {
      const double value = total_it->second.number_value();
      if (!(value >= 0 && value <= kMaxDeclaredTotal) || std::trunc(value) != value) {
        throw std::runtime_error("Invalid contact document: \"total\" must be a non-negative integer");
      }
      // the document cannot hold more than it lists
      declared_total = std::min<uint64_t>(static_cast<uint64_t>(value), contacts.size());
      has_total      = true;
    }
  } else {
    throw std::runtime_error("Invalid contact document: expected an array or object");
  }

  if (total) *total = has_total ? declared_total : contacts.size();
  return contacts;
}

JsonFileSource::JsonFileSource(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open contact source: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  contacts_ = ParseContactDocument(buffer.str(), &total_);
}

ContactPage JsonFileSource::FetchPage(uint64_t offset, uint64_t limit) {
  ContactPage page;
  page.total = total_;
  if (offset >= contacts_.size()) return page;

  const auto end = std::min<uint64_t>(contacts_.size(), offset + limit);
  page.contacts.assign(contacts_.begin() + static_cast<std::ptrdiff_t>(offset), contacts_.begin() + static_cast<std::ptrdiff_t>(end));
  return page;
}

} // namespace dedup::sync
