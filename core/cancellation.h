#ifndef APPCMD_CORE_CANCELLATION_H_
#define APPCMD_CORE_CANCELLATION_H_

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

namespace appcmd {

/**
 * @brief Shared between a synchronization pass and the requests it issues so
 * a timed out guild can abandon its in-flight HTTP call.
 *
 * The first Cancel() wins: its reason is what every observer reports.
 */
class CancellationRequest {
 public:
  CancellationRequest() = default;

  // Cancels with `reason` and runs the registered callbacks. Later calls are
  // ignored. An OK reason is replaced by CancelledError.
  void Cancel(absl::Status reason = absl::CancelledError("Request cancelled"));

  bool IsCancelled() const;

  // OK while not cancelled, else the reason given to Cancel().
  absl::Status status() const;

  using CallbackId = uint64_t;

  // Runs `cb` on cancellation, or right away when already cancelled, in which
  // case the returned id is 0.
  CallbackId RegisterCallback(std::function<void()> cb);

  // Drops a callback that has not run yet. Unknown ids are ignored.
  void UnregisterCallback(CallbackId id);

  // Blocks for up to `timeout`. Returns true when cancelled meanwhile.
  bool WaitFor(absl::Duration timeout) const;

 private:
  mutable absl::Mutex mu_;
  bool cancelled_ ABSL_GUARDED_BY(mu_) = false;
  absl::Status reason_ ABSL_GUARDED_BY(mu_);
  CallbackId next_id_ ABSL_GUARDED_BY(mu_) = 1;
  std::vector<std::pair<CallbackId, std::function<void()>>> callbacks_ ABSL_GUARDED_BY(mu_);
};

}  // namespace appcmd

#endif  // APPCMD_CORE_CANCELLATION_H_
