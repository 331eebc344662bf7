#ifndef APPCMD_CORE_DISPATCHER_H_
#define APPCMD_CORE_DISPATCHER_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "core/arguments.h"
#include "core/command.h"
#include "core/error_sink.h"
#include "core/interaction.h"
#include "core/option.h"
#include "core/registry.h"

#include <nlohmann/json.hpp>

namespace appcmd {

// Converts one supplied option value to the bound parameter for `type`.
// Reference types resolve through `resolved` and fall back to the raw id.
ArgumentValue ResolveArgument(const InteractionOption& supplied, OptionType type, const ResolvedData& resolved);

// Binds `supplied` against the declared options of the addressed node and
// injects the defaults of options that were not supplied. Keys are handler
// parameter names, mapped through `connector`.
Arguments BindArguments(const std::vector<InteractionOption>& supplied, const std::vector<Option>& declared,
                        const ConnectorMap& connector, const ResolvedData& resolved);

/**
 * @brief Routes inbound interactions to the handlers in a Registry.
 *
 * Every failure is contained in the Outcome of the call that caused it;
 * nothing escapes Dispatch().
 */
class Dispatcher {
 public:
  enum class Result {
    HANDLED,          // Handler ran and succeeded
    AUTOCOMPLETED,    // Autocomplete handler produced choices
    CHECK_FAILED,     // A check rejected the invocation
    HANDLER_ERROR,    // Handler or autocomplete handler failed
    UNKNOWN_COMMAND,  // Addressed command, group or sub-command is not live
    NOT_A_COMMAND,    // Ping, component or modal interaction. Ignored.
  };

  struct Outcome {
    Result result = Result::NOT_A_COMMAND;
    // Space separated path of the addressed node.
    std::string qualified_name;
    absl::Status status;
    std::vector<OptionChoice> choices;

    // The autocomplete callback response carrying `choices`.
    nlohmann::json AutocompleteResponse() const;
  };

  static absl::StatusOr<std::unique_ptr<Dispatcher>> Create(const Registry* registry, ErrorSink* sink) {
    if (registry == nullptr) {
      return absl::InvalidArgumentError("Registry cannot be null");
    }
    if (sink == nullptr) {
      return absl::InvalidArgumentError("ErrorSink cannot be null");
    }
    return std::unique_ptr<Dispatcher>(new Dispatcher(registry, sink));
  }

  Outcome Dispatch(Interaction& interaction) const;

 private:
  Dispatcher(const Registry* registry, ErrorSink* sink) : registry_(registry), sink_(sink) {}

  Registry::CommandPtr Lookup(const CommandData& data, CommandKind kind) const;
  Outcome RoutingError(const CommandRef& ref, Interaction& interaction, const std::string& message) const;

  const Registry* registry_;
  ErrorSink* sink_;
};

}  // namespace appcmd

#endif  // APPCMD_CORE_DISPATCHER_H_
