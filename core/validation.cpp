#include "core/validation.h"

#include "absl/strings/substitute.h"
#include "re2/re2.h"

#include "core/constants.h"

namespace appcmd {

namespace {

// Letters without an uppercase or titlecase form, digits, combining marks,
// '-' and '_'. Invalid UTF-8 never matches.
LazyRE2 kNamePattern = {R"(^[-_\p{Ll}\p{Lm}\p{Lo}\p{N}\p{M}]{1,32}$)"};

}  // namespace

size_t Utf8Length(absl::string_view text) {
  size_t length = 0;
  for (char c : text) {
    // Continuation bytes look like 10xxxxxx.
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++length;
  }
  return length;
}

absl::Status ValidateName(absl::string_view name, absl::string_view what) {
  size_t length = Utf8Length(name);
  if (length < 1 || length > kMaxNameLength) {
    return absl::InvalidArgumentError(
        absl::Substitute("The name of the $0 has to be 1-$1 characters long, got '$2' with length $3.", what,
                         kMaxNameLength, name, length));
  }
  if (!RE2::FullMatch(re2::StringPiece(name.data(), name.size()), *kNamePattern)) {
    return absl::InvalidArgumentError(absl::Substitute(
        "The name of the $0 may only contain lowercase letters, digits, _ and -, got '$1'.", what, name));
  }
  return absl::OkStatus();
}

absl::Status ValidateContextName(absl::string_view name, absl::string_view what) {
  size_t length = Utf8Length(name);
  if (length < 1 || length > kMaxNameLength) {
    return absl::InvalidArgumentError(absl::Substitute(
        "The name of the $0 has to be 1-$1 characters long, got length $2.", what, kMaxNameLength, length));
  }
  return absl::OkStatus();
}

absl::Status ValidateDescription(absl::string_view description, absl::string_view what) {
  size_t length = Utf8Length(description);
  if (length < 1 || length > kMaxDescriptionLength) {
    return absl::InvalidArgumentError(absl::Substitute(
        "The description of the $0 must be 1-$1 characters long, got $2.", what, kMaxDescriptionLength, length));
  }
  return absl::OkStatus();
}

}  // namespace appcmd
