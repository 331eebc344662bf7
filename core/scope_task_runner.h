#ifndef APPCMD_CORE_SCOPE_TASK_RUNNER_H_
#define APPCMD_CORE_SCOPE_TASK_RUNNER_H_

#include <functional>
#include <memory>
#include <queue>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

#include "core/cancellation.h"
#include "core/snowflake.h"

namespace appcmd {

/**
 * @brief Runs one task per command scope on a fixed thread pool.
 *
 * With a single thread the scopes are processed one after another in
 * submission order.
 */
class ScopeTaskRunner {
 public:
  using TaskFunc = std::function<absl::Status(const std::shared_ptr<CancellationRequest>& cancellation)>;

  struct Task {
    Snowflake scope;
    TaskFunc run;
  };

  struct Result {
    Snowflake scope;
    absl::Status status;
  };

  /**
   * @param num_threads Number of worker threads, at least one.
   */
  explicit ScopeTaskRunner(int num_threads = 4);
  ~ScopeTaskRunner();

  /**
   * @brief Executes `tasks` and blocks until each has a result.
   * Every task gets its own cancellation, fired when `cancellation` fires or
   * when the task has been running longer than `timeout`. A task that times
   * out reports DeadlineExceeded right away; whatever it returns afterwards is
   * discarded.
   * @return Results in the order of `tasks`.
   */
  std::vector<Result> Run(std::vector<Task> tasks, absl::Duration timeout,
                          std::shared_ptr<CancellationRequest> cancellation);

 private:
  void WorkerLoop();

  std::vector<std::thread> workers_;

  absl::Mutex mu_;
  std::queue<std::function<void()>> tasks_ ABSL_GUARDED_BY(mu_);
  bool stop_ ABSL_GUARDED_BY(mu_) = false;
};

}  // namespace appcmd

#endif  // APPCMD_CORE_SCOPE_TASK_RUNNER_H_
