#ifndef APPCMD_CORE_ARGUMENTS_H_
#define APPCMD_CORE_ARGUMENTS_H_

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <variant>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"

#include "core/entities.h"

namespace appcmd {

// A bound parameter. Reference options hold the resolved entity, or the raw
// id string when the payload did not resolve it.
using ArgumentValue =
    std::variant<std::monostate, std::string, int64_t, double, bool, User, Member, Role, Channel, Attachment, Message>;

// Parameters bound for one invocation, keyed by handler parameter name.
class Arguments {
 public:
  void Set(std::string name, ArgumentValue value) { values_[std::move(name)] = std::move(value); }

  bool Has(const std::string& name) const { return values_.count(name) > 0; }
  size_t size() const { return values_.size(); }
  bool empty() const { return values_.empty(); }

  const ArgumentValue* Find(const std::string& name) const {
    auto it = values_.find(name);
    return it == values_.end() ? nullptr : &it->second;
  }

  // NotFound when the parameter is absent, InvalidArgument when it holds
  // another type.
  template <typename T>
  absl::StatusOr<T> Get(const std::string& name) const {
    const ArgumentValue* value = Find(name);
    if (value == nullptr) return absl::NotFoundError(absl::StrCat("No argument named '", name, "'"));
    if (const T* typed = std::get_if<T>(value)) return *typed;
    return absl::InvalidArgumentError(absl::StrCat("Argument '", name, "' has a different type"));
  }

  template <typename T>
  T GetOr(const std::string& name, T fallback) const {
    const ArgumentValue* value = Find(name);
    if (value == nullptr) return fallback;
    if (const T* typed = std::get_if<T>(value)) return *typed;
    return fallback;
  }

  const std::map<std::string, ArgumentValue>& values() const { return values_; }

 private:
  std::map<std::string, ArgumentValue> values_;
};

}  // namespace appcmd

#endif  // APPCMD_CORE_ARGUMENTS_H_
