#ifndef APPCMD_CORE_WIRE_COMPARE_H_
#define APPCMD_CORE_WIRE_COMPARE_H_

#include <nlohmann/json.hpp>

namespace appcmd {

/**
 * @brief Structural equality between a locally produced command wire form and
 * an entry fetched from the service.
 *
 * Fields the service omits when they hold their default (`required`,
 * `autocomplete`, `nsfw`, `dm_permission`, empty localization maps) compare
 * equal to the explicit default. Scalar options must appear in the same
 * position on both sides. Sub-command and sub-command-group entries are paired
 * by name and may appear in any slot; their children are compared recursively.
 *
 * @param global_scope dm_permission is only meaningful for global commands and
 * is ignored otherwise.
 */
bool CommandWireEquals(const nlohmann::json& local, const nlohmann::json& remote, bool global_scope);

// The option-list part of CommandWireEquals, exposed for tests.
bool OptionListsEqual(const nlohmann::json& local, const nlohmann::json& remote);

}  // namespace appcmd

#endif  // APPCMD_CORE_WIRE_COMPARE_H_
