#include "core/wire_compare.h"

#include <algorithm>
#include <string>
#include <vector>

#include "core/localizations.h"

namespace appcmd {

namespace {

const nlohmann::json& FieldOr(const nlohmann::json& object, const char* key, const nlohmann::json& fallback) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) return fallback;
  return *it;
}

bool BoolField(const nlohmann::json& object, const char* key, bool fallback) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_boolean()) return fallback;
  return it->get<bool>();
}

std::string StringField(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) return "";
  return it->get<std::string>();
}

const nlohmann::json& Field(const nlohmann::json& object, const char* key) {
  static const nlohmann::json kNull;
  return FieldOr(object, key, kNull);
}

int IntField(const nlohmann::json& object, const char* key, int fallback) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_number_integer()) return fallback;
  return it->get<int>();
}

// Missing and null are equal; numbers compare by value so 5 == 5.0.
bool NumberFieldEquals(const nlohmann::json& a, const nlohmann::json& b, const char* key) {
  static const nlohmann::json kNull;
  const auto& va = FieldOr(a, key, kNull);
  const auto& vb = FieldOr(b, key, kNull);
  if (va.is_null() || vb.is_null()) return va.is_null() && vb.is_null();
  if (!va.is_number() || !vb.is_number()) return va == vb;
  return va.get<double>() == vb.get<double>();
}

std::vector<int> SortedChannelTypes(const nlohmann::json& option) {
  std::vector<int> types;
  auto it = option.find("channel_types");
  if (it != option.end() && it->is_array()) {
    for (const auto& t : *it) {
      if (t.is_number_integer()) types.push_back(t.get<int>());
    }
  }
  std::sort(types.begin(), types.end());
  return types;
}

const nlohmann::json& ArrayField(const nlohmann::json& object, const char* key) {
  static const nlohmann::json kEmpty = nlohmann::json::array();
  auto it = object.find(key);
  if (it == object.end() || !it->is_array()) return kEmpty;
  return *it;
}

bool ChoicesEqual(const nlohmann::json& a, const nlohmann::json& b) {
  const auto& ca = ArrayField(a, "choices");
  const auto& cb = ArrayField(b, "choices");
  if (ca.size() != cb.size()) return false;
  for (size_t i = 0; i < ca.size(); ++i) {
    if (StringField(ca[i], "name") != StringField(cb[i], "name")) return false;
    if (!NumberFieldEquals(ca[i], cb[i], "value")) return false;
    if (!LocalizationJsonEquals(Field(ca[i], "name_localizations"),
                                Field(cb[i], "name_localizations"))) {
      return false;
    }
  }
  return true;
}

bool IsContainer(int type) { return type == 1 || type == 2; }

// Index of the entry named `name`, or -1.
int IndexOfName(const nlohmann::json& list, const std::string& name) {
  for (size_t i = 0; i < list.size(); ++i) {
    if (StringField(list[i], "name") == name) return static_cast<int>(i);
  }
  return -1;
}

bool OptionFieldsEqual(const nlohmann::json& local, const nlohmann::json& remote) {
  if (StringField(local, "name") != StringField(remote, "name")) return false;
  if (IntField(local, "type", 0) != IntField(remote, "type", 0)) return false;
  if (StringField(local, "description") != StringField(remote, "description")) return false;
  if (BoolField(local, "required", false) != BoolField(remote, "required", false)) return false;
  if (BoolField(local, "autocomplete", false) != BoolField(remote, "autocomplete", false)) return false;
  if (!NumberFieldEquals(local, remote, "min_value")) return false;
  if (!NumberFieldEquals(local, remote, "max_value")) return false;
  if (SortedChannelTypes(local) != SortedChannelTypes(remote)) return false;
  if (!ChoicesEqual(local, remote)) return false;
  if (!LocalizationJsonEquals(Field(local, "name_localizations"),
                              Field(remote, "name_localizations"))) {
    return false;
  }
  return LocalizationJsonEquals(Field(local, "description_localizations"),
                                Field(remote, "description_localizations"));
}

}  // namespace

bool OptionListsEqual(const nlohmann::json& local, const nlohmann::json& remote) {
  static const nlohmann::json kEmpty = nlohmann::json::array();
  const auto& ours = local.is_array() ? local : kEmpty;
  const auto& theirs = remote.is_array() ? remote : kEmpty;
  if (ours.empty() && theirs.empty()) return true;
  if (ours.size() != theirs.size()) return false;

  for (size_t i = 0; i < theirs.size(); ++i) {
    int index = IndexOfName(ours, StringField(theirs[i], "name"));
    if (index < 0) return false;
    if (static_cast<size_t>(index) != i && !IsContainer(IntField(ours[index], "type", 0))) return false;
  }
  for (size_t i = 0; i < ours.size(); ++i) {
    const auto& option = ours[i];
    int index = IndexOfName(theirs, StringField(option, "name"));
    if (index < 0) return false;
    const auto& other = theirs[index];
    if (static_cast<size_t>(index) != i && !IsContainer(IntField(other, "type", 0))) return false;
    if (IsContainer(IntField(option, "type", 0)) &&
        !OptionListsEqual(ArrayField(option, "options"), ArrayField(other, "options"))) {
      return false;
    }
    if (!OptionFieldsEqual(option, other)) return false;
  }
  return true;
}

bool CommandWireEquals(const nlohmann::json& local, const nlohmann::json& remote, bool global_scope) {
  static const nlohmann::json kNull;
  if (IntField(local, "type", 1) != IntField(remote, "type", 1)) return false;
  if (StringField(local, "name") != StringField(remote, "name")) return false;
  if (StringField(local, "description") != StringField(remote, "description")) return false;
  if (!LocalizationJsonEquals(Field(local, "name_localizations"),
                              Field(remote, "name_localizations"))) {
    return false;
  }
  if (!LocalizationJsonEquals(Field(local, "description_localizations"),
                              Field(remote, "description_localizations"))) {
    return false;
  }
  if (FieldOr(local, "default_member_permissions", kNull) != FieldOr(remote, "default_member_permissions", kNull)) {
    return false;
  }
  if (global_scope && BoolField(local, "dm_permission", true) != BoolField(remote, "dm_permission", true)) {
    return false;
  }
  if (BoolField(local, "nsfw", false) != BoolField(remote, "nsfw", false)) return false;
  return OptionListsEqual(ArrayField(local, "options"), ArrayField(remote, "options"));
}

}  // namespace appcmd
