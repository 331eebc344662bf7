#include "core/cancellation.h"

#include <algorithm>
#include <utility>

namespace appcmd {

void CancellationRequest::Cancel(absl::Status reason) {
  if (reason.ok()) reason = absl::CancelledError("Request cancelled");
  std::vector<std::pair<CallbackId, std::function<void()>>> to_run;
  {
    absl::MutexLock lock(&mu_);
    if (cancelled_) return;
    cancelled_ = true;
    reason_ = std::move(reason);
    to_run.swap(callbacks_);
  }
  for (auto& entry : to_run) entry.second();
}

bool CancellationRequest::IsCancelled() const {
  absl::ReaderMutexLock lock(&mu_);
  return cancelled_;
}

absl::Status CancellationRequest::status() const {
  absl::ReaderMutexLock lock(&mu_);
  return reason_;
}

CancellationRequest::CallbackId CancellationRequest::RegisterCallback(std::function<void()> cb) {
  {
    absl::MutexLock lock(&mu_);
    if (!cancelled_) {
      CallbackId id = next_id_++;
      callbacks_.emplace_back(id, std::move(cb));
      return id;
    }
  }
  cb();
  return 0;
}

void CancellationRequest::UnregisterCallback(CallbackId id) {
  absl::MutexLock lock(&mu_);
  callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
                                  [id](const auto& entry) { return entry.first == id; }),
                   callbacks_.end());
}

bool CancellationRequest::WaitFor(absl::Duration timeout) const {
  absl::MutexLock lock(&mu_);
  mu_.AwaitWithTimeout(absl::Condition(&cancelled_), timeout);
  return cancelled_;
}

}  // namespace appcmd
