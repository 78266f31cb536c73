#include "app/Session.hpp"
#include "app/Scorer.hpp"
#include "util/Diag.hpp"
#include <condition_variable>
#include <mutex>

using namespace std::chrono;
using seagreen::model::ErrorKind;
using seagreen::model::SessionState;

namespace seagreen::app {

// Sleep until t unless a stop is requested first. Returns false on stop.
static bool wait_until_or_stop(steady_clock::time_point t, std::stop_token st) {
  std::mutex mu;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lk(mu);
  cv.wait_until(lk, st, t, []{ return false; });
  return !st.stop_requested();
}

SessionController::SessionController(seagreen::collectors::IProcessTable& table, Sampler& sampler, SessionOptions opts)
  : table_(table), sampler_(sampler), opts_(opts) {
  if (opts_.interval <= milliseconds::zero()) opts_.interval = milliseconds(1000);
  if (opts_.duration < seconds::zero()) opts_.duration = seconds::zero();
}

std::unexpected<seagreen::model::SessionError>
SessionController::fail(ErrorKind kind, int32_t pid, std::string detail) {
  if (handle_) sampler_.forget(*handle_);
  state_ = SessionState::Aborted;
  seagreen::util::debugf("session", "pid %d %s: %s", pid, seagreen::model::to_string(state_), seagreen::model::to_string(kind));
  return std::unexpected(seagreen::model::SessionError{kind, pid, std::move(detail)});
}

std::expected<seagreen::model::Report, seagreen::model::SessionError>
SessionController::run(int32_t pid, std::stop_token st) {
  state_ = SessionState::Pending;
  handle_.reset();
  aggregator_.reset();

  auto resolved = table_.resolve(pid);
  if (!resolved) {
    return fail(resolved.error(), pid,
                 resolved.error() == ErrorKind::PermissionDenied ? "cannot read process" : "no such process");
  }
  handle_ = *resolved;
  state_ = SessionState::Running;
  sampler_.forget(*handle_); // no stale delta from an earlier session
  seagreen::util::debugf("session", "tracking pid %d (%s) via %s for %llds every %lldms", pid, handle_->name.c_str(), table_.name(),
                         static_cast<long long>(opts_.duration.count()), static_cast<long long>(opts_.interval.count()));
  if (hooks_.started) hooks_.started(*handle_, opts_);

  const auto start = steady_clock::now();
  const auto deadline = start + opts_.duration;
  auto next_tick = start;
  auto end = start;
  auto reason = seagreen::model::EndReason::Deadline;

  for (;;) {
    if (st.stop_requested()) return fail(ErrorKind::Cancelled, pid, "interrupted");
    auto obs = sampler_.sample(*handle_);
    end = steady_clock::now();
    if (!obs) {
      if (obs.error() == ErrorKind::ProcessGone) {
        reason = seagreen::model::EndReason::ProcessGone;
        break;
      }
      return fail(obs.error(), pid, "usage read refused");
    }
    aggregator_.ingest(*obs);
    double elapsed = duration<double>(end - start).count();
    seagreen::util::debugf("session", "tick %.2fs cpu=%.1f%%%s rss=%llu", elapsed, obs->cpu_pct,
                           obs->cpu_valid ? "" : " (warm-up)", static_cast<unsigned long long>(obs->memory_bytes));
    if (hooks_.tick) {
      hooks_.tick(seagreen::model::Progress{elapsed, static_cast<int>(opts_.duration.count()), aggregator_.finalize().samples, &*obs});
    }
    if (end >= deadline) break;
    // Fixed cadence from start; a slow sample shortens the next sleep
    next_tick += opts_.interval;
    if (next_tick < end) next_tick = end;
    if (next_tick > deadline) next_tick = deadline;
    if (!wait_until_or_stop(next_tick, st)) return fail(ErrorKind::Cancelled, pid, "interrupted");
  }

  sampler_.forget(*handle_);
  auto stats = aggregator_.finalize();
  double elapsed = duration<double>(end - start).count();

  seagreen::model::Report r;
  r.pid = handle_->pid;
  r.process_name = handle_->name;
  r.requested_seconds = static_cast<int>(opts_.duration.count());
  r.duration_s = elapsed;
  r.samples = stats.samples;
  r.cpu_samples = stats.cpu_samples;
  r.avg_cpu_pct = stats.avg_cpu();
  r.peak_cpu_pct = stats.cpu_peak;
  r.avg_memory_bytes = stats.avg_memory();
  r.peak_memory_bytes = stats.memory_peak;
  r.cpu_seconds = stats.cpu_seconds();
  r.score = score_or_sentinel(stats.cpu_samples ? std::optional<double>(stats.avg_cpu()) : std::nullopt, elapsed);
  r.end_reason = reason;
  state_ = SessionState::Completed;
  seagreen::util::debugf("session", "pid %d %s (%s) after %.2fs, %llu samples", pid, seagreen::model::to_string(state_),
                         reason == seagreen::model::EndReason::ProcessGone ? "process gone" : "deadline",
                         elapsed, static_cast<unsigned long long>(stats.samples));
  return r;
}

} // namespace seagreen::app
