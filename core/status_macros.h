#ifndef APPCMD_CORE_STATUS_MACROS_H_
#define APPCMD_CORE_STATUS_MACROS_H_

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

#define RETURN_IF_ERROR(expr) \
  if (auto _status = (expr); !_status.ok()) return _status

// Like RETURN_IF_ERROR, with `context` prepended to the message. The status
// code is kept so callers can still classify the failure.
#define RETURN_IF_ERROR_WITH_CONTEXT(expr, context)                                        \
  if (auto _status = (expr); !_status.ok())                                                \
  return absl::Status(_status.code(), absl::StrCat((context), ": ", _status.message()))

#define ASSIGN_OR_RETURN_IMPL(status_or, lhs, rexpr) \
  auto status_or = (rexpr);                          \
  if (!status_or.ok()) return status_or.status();    \
  lhs = std::move(*status_or)

#define APPCMD_CONCAT_IMPL(x, y) x##y
#define APPCMD_CONCAT(x, y) APPCMD_CONCAT_IMPL(x, y)

#define ASSIGN_OR_RETURN(lhs, rexpr) ASSIGN_OR_RETURN_IMPL(APPCMD_CONCAT(_status_or, __LINE__), lhs, rexpr)

#endif  // APPCMD_CORE_STATUS_MACROS_H_
