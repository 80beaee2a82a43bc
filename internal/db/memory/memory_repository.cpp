#include "memory_repository.hpp"

#include <set>

#include "memory_tx.hpp"

namespace dedup::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

MemoryTransaction& MemoryRepository::TX(Transaction& t) {
  return static_cast<MemoryTransaction&>(t);
}

model::ContactRecord MemoryRepository::WithChildren(const State& state, const model::ContactRecord& contact) {
  model::ContactRecord out = contact;
  for (const auto& [_, email] : state.emails) {
    if (email.contact_id == contact.id) out.emails.push_back(email);
  }
  for (const auto& [_, phone] : state.phones) {
    if (phone.contact_id == contact.id) out.phones.push_back(phone);
  }
  return out;
}

// ------------------------------------------------------------------
// Contacts
// ------------------------------------------------------------------

Result MemoryRepository::UpsertContact(Transaction& t, const model::ContactRecord& r) {
  if (r.id.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "contact id must not be empty");
  }

  auto& stored = TX(t).Mutable().contacts[r.id];
  stored       = r;
  stored.emails.clear();
  stored.phones.clear();
  return Result::Ok();
}

std::optional<model::ContactRecord> MemoryRepository::GetContact(Transaction& t, const std::string& id) {
  const auto& state = TX(t).View();
  auto        it    = state.contacts.find(id);
  if (it == state.contacts.end()) return std::nullopt;
  return WithChildren(state, it->second);
}

std::vector<model::ContactRecord> MemoryRepository::ListContacts(Transaction& t) {
  const auto&                       state = TX(t).View();
  std::vector<model::ContactRecord> out;
  out.reserve(state.contacts.size());
  for (const auto& [_, contact] : state.contacts) {
    out.push_back(WithChildren(state, contact));
  }
  return out;
}

Result MemoryRepository::DeleteContact(Transaction& t, const std::string& id) {
  auto& state = TX(t).Mutable();
  if (state.contacts.erase(id) == 0) {
    return Result::Err(ErrorCode::NotFound, "contact not found: " + id);
  }

  std::erase_if(state.emails, [&](const auto& kv) { return kv.second.contact_id == id; });
  std::erase_if(state.phones, [&](const auto& kv) { return kv.second.contact_id == id; });
  return Result::Ok();
}

uint64_t MemoryRepository::CountContacts(Transaction& t) {
  return TX(t).View().contacts.size();
}

std::optional<model::SyncState> MemoryRepository::GetSyncState(Transaction& t, const std::string& id) {
  const auto& state = TX(t).View();
  auto        it    = state.contacts.find(id);
  if (it == state.contacts.end()) return std::nullopt;
  return model::SyncState{it->second.record_hash, it->second.duplicate};
}

// ------------------------------------------------------------------
// Child relations
// ------------------------------------------------------------------

Result MemoryRepository::ReplaceEmails(Transaction& t, const std::string& contact_id, const std::vector<std::string>& emails) {
  auto& state = TX(t).Mutable();
  if (!state.contacts.contains(contact_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed: " + contact_id);
  }

  std::erase_if(state.emails, [&](const auto& kv) { return kv.second.contact_id == contact_id; });
  for (const auto& email : emails) {
    const auto row_id    = state.next_email_id++;
    state.emails[row_id] = model::EmailRecord{row_id, contact_id, email};
  }
  return Result::Ok();
}

Result MemoryRepository::ReplacePhones(Transaction& t, const std::string& contact_id, const std::vector<model::PhoneRecord>& phones) {
  auto& state = TX(t).Mutable();
  if (!state.contacts.contains(contact_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed: " + contact_id);
  }

  std::erase_if(state.phones, [&](const auto& kv) { return kv.second.contact_id == contact_id; });
  for (const auto& phone : phones) {
    const auto row_id    = state.next_phone_id++;
    state.phones[row_id] = model::PhoneRecord{row_id, contact_id, phone.phone_number, phone.label};
  }
  return Result::Ok();
}

std::vector<model::EmailRecord> MemoryRepository::ListEmails(Transaction& t, const std::string& contact_id) {
  std::vector<model::EmailRecord> out;
  for (const auto& [_, email] : TX(t).View().emails) {
    if (email.contact_id == contact_id) out.push_back(email);
  }
  return out;
}

std::vector<model::PhoneRecord> MemoryRepository::ListPhones(Transaction& t, const std::string& contact_id) {
  std::vector<model::PhoneRecord> out;
  for (const auto& [_, phone] : TX(t).View().phones) {
    if (phone.contact_id == contact_id) out.push_back(phone);
  }
  return out;
}

Result MemoryRepository::ReassignEmails(Transaction& t, const std::string& from_contact_id, const std::string& to_contact_id) {
  auto& state = TX(t).Mutable();
  if (!state.contacts.contains(to_contact_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed: " + to_contact_id);
  }
  for (auto& [_, email] : state.emails) {
    if (email.contact_id == from_contact_id) email.contact_id = to_contact_id;
  }
  return Result::Ok();
}

Result MemoryRepository::ReassignPhones(Transaction& t, const std::string& from_contact_id, const std::string& to_contact_id) {
  auto& state = TX(t).Mutable();
  if (!state.contacts.contains(to_contact_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed: " + to_contact_id);
  }
  for (auto& [_, phone] : state.phones) {
    if (phone.contact_id == from_contact_id) phone.contact_id = to_contact_id;
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteEmail(Transaction& t, int64_t row_id) {
  if (TX(t).Mutable().emails.erase(row_id) == 0) {
    return Result::Err(ErrorCode::NotFound, "email row not found: " + std::to_string(row_id));
  }
  return Result::Ok();
}

Result MemoryRepository::DeletePhone(Transaction& t, int64_t row_id) {
  if (TX(t).Mutable().phones.erase(row_id) == 0) {
    return Result::Err(ErrorCode::NotFound, "phone row not found: " + std::to_string(row_id));
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Duplicate groups
// ------------------------------------------------------------------

Result MemoryRepository::ClearUnresolvedGroups(Transaction& t) {
  for (auto& [_, contact] : TX(t).Mutable().contacts) {
    if (contact.duplicate.resolution == model::DuplicateResolution::kUnset) {
      contact.duplicate.group_id.reset();
      contact.duplicate.primary_contact_id.reset();
    }
  }
  return Result::Ok();
}

Result MemoryRepository::SetDuplicateGroup(Transaction& t, const std::string& contact_id, const model::DuplicateGroup& group) {
  auto& contacts = TX(t).Mutable().contacts;
  auto  it       = contacts.find(contact_id);
  if (it == contacts.end()) {
    return Result::Err(ErrorCode::NotFound, "contact not found: " + contact_id);
  }
  it->second.duplicate = group;
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::ListGroupIds(Transaction& t, model::DuplicateResolution resolution) {
  std::set<std::string> ids;
  for (const auto& [_, contact] : TX(t).View().contacts) {
    if (contact.duplicate.group_id && !contact.duplicate.group_id->empty() && contact.duplicate.resolution == resolution) {
      ids.insert(*contact.duplicate.group_id);
    }
  }
  return {ids.begin(), ids.end()};
}

std::vector<model::ContactRecord> MemoryRepository::ListGroupMembers(Transaction& t, const std::string& group_id) {
  const auto&                       state = TX(t).View();
  std::vector<model::ContactRecord> out;
  for (const auto& [_, contact] : state.contacts) {
    if (contact.duplicate.group_id == group_id) out.push_back(WithChildren(state, contact));
  }
  return out;
}

} // namespace dedup::db::memory
