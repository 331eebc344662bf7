#ifndef APPCMD_CORE_VALIDATION_H_
#define APPCMD_CORE_VALIDATION_H_

#include <cstddef>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace appcmd {

// Number of UTF-8 code points in `text`.
size_t Utf8Length(absl::string_view text);

// Chat command, sub-command, group and option names: 1-32 code points of
// lowercase or uncased letters, digits, combining marks, '-' and '_'.
// `what` names the thing being validated in the error message.
absl::Status ValidateName(absl::string_view name, absl::string_view what);

// User and message command names: 1-32 code points, any characters.
absl::Status ValidateContextName(absl::string_view name, absl::string_view what);

// 1-100 code points.
absl::Status ValidateDescription(absl::string_view description, absl::string_view what);

}  // namespace appcmd

#endif  // APPCMD_CORE_VALIDATION_H_
