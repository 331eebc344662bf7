#ifndef APPCMD_CORE_ERROR_SINK_H_
#define APPCMD_CORE_ERROR_SINK_H_

#include <string>

#include "absl/status/status.h"

#include "core/snowflake.h"

namespace appcmd {

class Interaction;

// Identifies the node an error belongs to.
struct CommandRef {
  // Space separated path, e.g. "config settings get".
  std::string qualified_name;
  int kind = 1;
  Snowflake command_id = 0;
  Snowflake guild_id = 0;
};

/**
 * @brief Process-wide destination for errors no node-level error handler
 * claimed: routing failures, failed checks and handler errors.
 */
class ErrorSink {
 public:
  virtual ~ErrorSink() = default;
  virtual void OnCommandError(const CommandRef& command, const Interaction& interaction,
                              const absl::Status& error) = 0;
};

class LoggingErrorSink : public ErrorSink {
 public:
  void OnCommandError(const CommandRef& command, const Interaction& interaction,
                      const absl::Status& error) override;
};

}  // namespace appcmd

#endif  // APPCMD_CORE_ERROR_SINK_H_
