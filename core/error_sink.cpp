#include "core/error_sink.h"

#include "absl/log/log.h"

#include "core/interaction.h"

namespace appcmd {

void LoggingErrorSink::OnCommandError(const CommandRef& command, const Interaction& interaction,
                                      const absl::Status& error) {
  LOG(ERROR) << "Ignoring error in command '" << command.qualified_name << "' (id "
             << FormatSnowflake(command.command_id) << ", guild " << FormatSnowflake(command.guild_id)
             << ", interaction " << FormatSnowflake(interaction.id()) << "): " << error;
}

}  // namespace appcmd
