#ifndef APPCMD_CORE_LOCALIZATIONS_H_
#define APPCMD_CORE_LOCALIZATIONS_H_

#include <map>
#include <optional>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

#include <nlohmann/json.hpp>

namespace appcmd {

bool IsKnownLocale(absl::string_view locale);

// Locale -> text map attached to names and descriptions.
// Ordered so the produced wire form is stable.
class Localizations {
 public:
  Localizations() = default;

  // Fails on unknown locale keys.
  static absl::StatusOr<Localizations> Create(std::map<std::string, std::string> values);

  absl::Status Set(const std::string& locale, std::string text);
  std::optional<std::string> Get(const std::string& locale) const;

  // Entries of `other` win.
  void Merge(const Localizations& other);

  bool empty() const { return values_.empty(); }
  const std::map<std::string, std::string>& values() const { return values_; }

  // null when empty, matching what the service returns for unset maps.
  nlohmann::json ToJson() const;

  // Applies `validate` to every localized text.
  template <typename Fn>
  absl::Status ValidateEach(Fn validate) const {
    for (const auto& [locale, text] : values_) {
      if (auto status = validate(text); !status.ok()) return status;
    }
    return absl::OkStatus();
  }

  bool operator==(const Localizations& other) const { return values_ == other.values_; }
  bool operator!=(const Localizations& other) const { return !(*this == other); }

 private:
  std::map<std::string, std::string> values_;
};

// Treats null, a missing key and {} as the same empty map.
bool LocalizationJsonEquals(const nlohmann::json& a, const nlohmann::json& b);

}  // namespace appcmd

#endif  // APPCMD_CORE_LOCALIZATIONS_H_
