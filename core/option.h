#ifndef APPCMD_CORE_OPTION_H_
#define APPCMD_CORE_OPTION_H_

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

#include "core/localizations.h"

#include <nlohmann/json.hpp>

namespace appcmd {

enum class OptionType : int {
  kSubCommand = 1,
  kSubCommandGroup = 2,
  kString = 3,
  kInteger = 4,
  kBoolean = 5,
  kUser = 6,
  kChannel = 7,
  kRole = 8,
  kMentionable = 9,
  kNumber = 10,
  kAttachment = 11,
};

enum class ChannelType : int {
  kText = 0,
  kPrivate = 1,
  kVoice = 2,
  kGroup = 3,
  kCategory = 4,
  kNews = 5,
  kNewsThread = 10,
  kPublicThread = 11,
  kPrivateThread = 12,
  kStageVoice = 13,
  kDirectory = 14,
  kForum = 15,
};

absl::StatusOr<OptionType> OptionTypeFromInt(int value);
absl::string_view OptionTypeName(OptionType type);

// Sub-command and sub-command-group entries.
bool IsContainerType(OptionType type);
bool IsNumericType(OptionType type);
// string, integer and number accept choices and autocomplete.
bool SupportsChoices(OptionType type);

using ChoiceValue = std::variant<std::string, int64_t, double>;

class OptionChoice {
 public:
  // Name must be 1-100 characters long.
  static absl::StatusOr<OptionChoice> Create(std::string name, ChoiceValue value,
                                             Localizations name_localizations = {});

  const std::string& name() const { return name_; }
  const ChoiceValue& value() const { return value_; }
  const Localizations& name_localizations() const { return name_localizations_; }

  nlohmann::json ToJson() const;

 private:
  OptionChoice(std::string name, ChoiceValue value, Localizations name_localizations)
      : name_(std::move(name)), value_(std::move(value)), name_localizations_(std::move(name_localizations)) {}

  std::string name_;
  ChoiceValue value_;
  Localizations name_localizations_;
};

// Value injected for an option the user did not supply.
using OptionDefault = std::variant<std::monostate, std::string, int64_t, double, bool>;

// A single typed argument of a command. Immutable once created.
class Option {
 public:
  struct Params {
    OptionType type = OptionType::kString;
    std::string name;
    std::string description;
    bool required = true;
    std::vector<OptionChoice> choices;
    bool autocomplete = false;
    std::optional<double> min_value;
    std::optional<double> max_value;
    std::vector<ChannelType> channel_types;
    OptionDefault default_value;
    Localizations name_localizations;
    Localizations description_localizations;
    // Children, only for sub-command and sub-command-group types.
    std::vector<Option> options;
  };

  /**
   * @brief Validates `params` and builds the option.
   * Fails with InvalidArgument on a bad name or description, more than 25
   * choices, choices combined with autocomplete, numeric bounds or channel
   * filters on an incompatible type, choice values of the wrong kind, or a
   * sub-command-group without children.
   */
  static absl::StatusOr<Option> Create(Params params);

  OptionType type() const { return params_.type; }
  const std::string& name() const { return params_.name; }
  const std::string& description() const { return params_.description; }
  bool required() const { return params_.required; }
  bool autocomplete() const { return params_.autocomplete; }
  const std::vector<OptionChoice>& choices() const { return params_.choices; }
  const std::optional<double>& min_value() const { return params_.min_value; }
  const std::optional<double>& max_value() const { return params_.max_value; }
  const std::vector<ChannelType>& channel_types() const { return params_.channel_types; }
  const OptionDefault& default_value() const { return params_.default_value; }
  bool has_default() const { return !std::holds_alternative<std::monostate>(params_.default_value); }
  const Localizations& name_localizations() const { return params_.name_localizations; }
  const Localizations& description_localizations() const { return params_.description_localizations; }
  const std::vector<Option>& options() const { return params_.options; }

  nlohmann::json ToJson() const;

 private:
  explicit Option(Params params) : params_(std::move(params)) {}

  Params params_;
};

}  // namespace appcmd

#endif  // APPCMD_CORE_OPTION_H_
