#include "core/localizations.h"

#include <algorithm>
#include <array>

#include "absl/strings/str_cat.h"

namespace appcmd {

namespace {

constexpr std::array<absl::string_view, 32> kLocales = {
    "id", "da",    "de", "en-GB", "en-US", "es-ES", "es-419", "fr", "hr", "it", "lt",
    "hu", "nl",    "no", "pl",    "pt-BR", "ro",    "fi",     "sv-SE", "vi", "tr", "cs",
    "el", "bg",    "ru", "uk",    "hi",    "th",    "zh-CN",  "ja", "zh-TW", "ko"};

bool IsEmptyMap(const nlohmann::json& j) { return j.is_null() || (j.is_object() && j.empty()); }

}  // namespace

bool IsKnownLocale(absl::string_view locale) {
  return std::find(kLocales.begin(), kLocales.end(), locale) != kLocales.end();
}

absl::StatusOr<Localizations> Localizations::Create(std::map<std::string, std::string> values) {
  Localizations result;
  for (auto& [locale, text] : values) {
    if (auto status = result.Set(locale, std::move(text)); !status.ok()) return status;
  }
  return result;
}

absl::Status Localizations::Set(const std::string& locale, std::string text) {
  if (!IsKnownLocale(locale)) {
    return absl::InvalidArgumentError(absl::StrCat("Unknown locale '", locale, "'"));
  }
  values_[locale] = std::move(text);
  return absl::OkStatus();
}

std::optional<std::string> Localizations::Get(const std::string& locale) const {
  auto it = values_.find(locale);
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

void Localizations::Merge(const Localizations& other) {
  for (const auto& [locale, text] : other.values_) {
    values_[locale] = text;
  }
}

nlohmann::json Localizations::ToJson() const {
  if (values_.empty()) return nullptr;
  nlohmann::json j = nlohmann::json::object();
  for (const auto& [locale, text] : values_) {
    j[locale] = text;
  }
  return j;
}

bool LocalizationJsonEquals(const nlohmann::json& a, const nlohmann::json& b) {
  if (IsEmptyMap(a) && IsEmptyMap(b)) return true;
  return a == b;
}

}  // namespace appcmd
