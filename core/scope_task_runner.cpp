#include "core/scope_task_runner.h"

#include <algorithm>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

namespace appcmd {

ScopeTaskRunner::ScopeTaskRunner(int num_threads) {
  num_threads = std::max(1, num_threads);
  for (int i = 0; i < num_threads; ++i) {
    workers_.emplace_back(&ScopeTaskRunner::WorkerLoop, this);
  }
}

ScopeTaskRunner::~ScopeTaskRunner() {
  {
    absl::MutexLock lock(&mu_);
    stop_ = true;
  }
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

std::vector<ScopeTaskRunner::Result> ScopeTaskRunner::Run(std::vector<Task> tasks, absl::Duration timeout,
                                                          std::shared_ptr<CancellationRequest> cancellation) {
  if (tasks.empty()) return {};

  struct Slot {
    bool started = false;
    bool done = false;
    absl::Time deadline = absl::InfiniteFuture();
    absl::Status status;
    std::shared_ptr<CancellationRequest> cancellation = std::make_shared<CancellationRequest>();
  };
  struct SharedState {
    absl::Mutex mu;
    std::vector<Slot> slots ABSL_GUARDED_BY(mu);
    size_t remaining ABSL_GUARDED_BY(mu) = 0;
    // Bumped whenever a task starts or finishes.
    int64_t version ABSL_GUARDED_BY(mu) = 0;
  };
  auto state = std::make_shared<SharedState>();
  std::vector<std::shared_ptr<CancellationRequest>> per_task;
  {
    absl::MutexLock lock(&state->mu);
    state->remaining = tasks.size();
    state->slots.resize(tasks.size());
    for (const auto& slot : state->slots) per_task.push_back(slot.cancellation);
  }
  CancellationRequest::CallbackId forward_id = 0;
  if (cancellation) {
    std::weak_ptr<CancellationRequest> parent = cancellation;
    forward_id = cancellation->RegisterCallback([per_task, parent]() {
      absl::Status reason = absl::CancelledError("Cancelled");
      if (auto locked = parent.lock()) reason = locked->status();
      for (const auto& c : per_task) c->Cancel(reason);
    });
  }

  for (size_t i = 0; i < tasks.size(); ++i) {
    auto task = [i, timeout, state, run = std::move(tasks[i].run)]() {
      std::shared_ptr<CancellationRequest> task_cancellation;
      {
        absl::MutexLock lock(&state->mu);
        Slot& slot = state->slots[i];
        slot.started = true;
        slot.deadline = absl::Now() + timeout;
        task_cancellation = slot.cancellation;
        state->version++;
      }

      absl::Status status = task_cancellation->IsCancelled() ? task_cancellation->status() : run(task_cancellation);

      absl::MutexLock lock(&state->mu);
      Slot& slot = state->slots[i];
      if (!slot.done) {
        slot.done = true;
        slot.status = std::move(status);
        state->remaining--;
      }
      state->version++;
    };

    absl::MutexLock lock(&mu_);
    tasks_.push(std::move(task));
  }

  // Wait for every task to finish or run out of time.
  {
    absl::MutexLock lock(&state->mu);
    while (state->remaining > 0) {
      absl::Time next_deadline = absl::InfiniteFuture();
      for (const auto& slot : state->slots) {
        if (slot.started && !slot.done) next_deadline = std::min(next_deadline, slot.deadline);
      }
      int64_t seen = state->version;
      auto changed = [state, seen]() ABSL_EXCLUSIVE_LOCKS_REQUIRED(state->mu) { return state->version != seen; };
      state->mu.AwaitWithDeadline(absl::Condition(&changed), next_deadline);

      absl::Time now = absl::Now();
      for (size_t i = 0; i < state->slots.size(); ++i) {
        Slot& slot = state->slots[i];
        if (!slot.started || slot.done || now < slot.deadline) continue;
        LOG(WARNING) << "Scope " << tasks[i].scope << " timed out after " << timeout;
        slot.done = true;
        slot.status = absl::DeadlineExceededError(absl::StrCat("Timed out after ", absl::FormatDuration(timeout)));
        state->remaining--;
        slot.cancellation->Cancel(slot.status);
      }
    }
  }

  // The caller's token may outlive this batch.
  if (cancellation && forward_id != 0) cancellation->UnregisterCallback(forward_id);

  std::vector<Result> results;
  absl::MutexLock lock(&state->mu);
  for (size_t i = 0; i < tasks.size(); ++i) {
    results.push_back({tasks[i].scope, state->slots[i].status});
  }
  return results;
}

void ScopeTaskRunner::WorkerLoop() {
  while (true) {
    std::function<void()> task;
    {
      absl::MutexLock lock(&mu_);
      auto condition = [this]() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) { return stop_ || !tasks_.empty(); };
      mu_.Await(absl::Condition(&condition));

      if (stop_ && tasks_.empty()) return;

      task = std::move(tasks_.front());
      tasks_.pop();
    }
    task();
  }
}

}  // namespace appcmd
