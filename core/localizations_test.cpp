#include "core/localizations.h"

#include "gtest/gtest.h"

namespace appcmd {
namespace {

TEST(LocalizationsTest, CreateRejectsUnknownLocale) {
  EXPECT_TRUE(Localizations::Create({{"fr", "couleur"}, {"en-GB", "colour"}}).ok());
  auto bad = Localizations::Create({{"fr", "couleur"}, {"xx-YY", "nope"}});
  EXPECT_EQ(bad.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_TRUE(IsKnownLocale("pt-BR"));
  EXPECT_FALSE(IsKnownLocale("pt"));
}

TEST(LocalizationsTest, MergePrefersOther) {
  Localizations base = *Localizations::Create({{"fr", "un"}, {"de", "eins"}});
  Localizations other = *Localizations::Create({{"fr", "deux"}});
  base.Merge(other);
  EXPECT_EQ(base.Get("fr"), "deux");
  EXPECT_EQ(base.Get("de"), "eins");
  EXPECT_FALSE(base.Get("ja").has_value());
}

TEST(LocalizationsTest, EmptyMapIsNullOnTheWire) {
  EXPECT_TRUE(Localizations().ToJson().is_null());
  nlohmann::json j = Localizations::Create({{"fr", "couleur"}})->ToJson();
  EXPECT_EQ(j, nlohmann::json({{"fr", "couleur"}}));
}

TEST(LocalizationsTest, JsonEqualityTreatsEmptyFormsAlike) {
  EXPECT_TRUE(LocalizationJsonEquals(nullptr, nlohmann::json::object()));
  EXPECT_TRUE(LocalizationJsonEquals(nlohmann::json::object(), nullptr));
  EXPECT_FALSE(LocalizationJsonEquals(nullptr, {{"fr", "x"}}));
  EXPECT_TRUE(LocalizationJsonEquals({{"fr", "x"}}, {{"fr", "x"}}));
}

}  // namespace
}  // namespace appcmd
