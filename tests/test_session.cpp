#include "minitest.hpp"
#include "FakeProcessTable.hpp"
#include "app/InterruptWatch.hpp"
#include "app/Session.hpp"
#include "util/Diag.hpp"
#include <atomic>
#include <thread>

using namespace std::chrono;
using seagreen::app::Sampler;
using seagreen::app::SessionController;
using seagreen::app::SessionOptions;
using seagreen::model::EndReason;
using seagreen::model::ErrorKind;
using seagreen::model::RawUsage;
using seagreen::model::SessionState;

TEST(session_unknown_pid_takes_no_samples) {
  FakeProcessTable table;
  Sampler sampler(table);
  SessionController s(table, sampler, SessionOptions{seconds(5), milliseconds(100)});
  int ticks = 0;
  s.set_hooks({nullptr, [&](const seagreen::model::Progress&){ ++ticks; }});
  auto r = s.run(99999999);
  ASSERT_TRUE(!r.has_value());
  ASSERT_TRUE(r.error().kind == ErrorKind::NoSuchProcess);
  ASSERT_EQ(r.error().pid, 99999999);
  ASSERT_TRUE(s.state() == SessionState::Aborted);
  ASSERT_EQ(table.read_calls, 0);
  ASSERT_EQ(ticks, 0);
}

TEST(session_permission_denied_at_start) {
  FakeProcessTable table;
  table.add(1, "init");
  table.deny(1);
  Sampler sampler(table);
  SessionController s(table, sampler, SessionOptions{seconds(5), milliseconds(100)});
  auto r = s.run(1);
  ASSERT_TRUE(!r.has_value());
  ASSERT_TRUE(r.error().kind == ErrorKind::PermissionDenied);
  ASSERT_TRUE(s.state() == SessionState::Aborted);
}

TEST(session_completes_at_deadline) {
  FakeProcessTable table;
  table.add(42, "python3");
  table.script(42, RawUsage{0, 2048});
  Sampler sampler(table);
  SessionController s(table, sampler, SessionOptions{seconds(1), milliseconds(250)});
  int started = 0; int ticks = 0;
  s.set_hooks({[&](const seagreen::model::ProcessHandle& h, const SessionOptions& o){
                 ++started;
                 ASSERT_EQ(h.pid, 42);
                 ASSERT_TRUE(o.duration == seconds(1));
               },
               [&](const seagreen::model::Progress& p){
                 ++ticks;
                 ASSERT_EQ(p.requested_seconds, 1);
                 ASSERT_TRUE(p.last != nullptr);
               }});
  auto t0 = steady_clock::now();
  auto r = s.run(42);
  double wall = duration<double>(steady_clock::now() - t0).count();
  ASSERT_TRUE(r.has_value());
  ASSERT_TRUE(s.state() == SessionState::Completed);
  ASSERT_TRUE(r->end_reason == EndReason::Deadline);
  ASSERT_EQ(r->process_name, std::string("python3"));
  ASSERT_EQ(r->requested_seconds, 1);
  ASSERT_NEAR(r->duration_s, 1.0, 0.3);
  ASSERT_TRUE(wall < 2.0);
  ASSERT_TRUE(r->samples >= 4 && r->samples <= 6);
  ASSERT_EQ(r->cpu_samples, r->samples - 1);
  ASSERT_EQ(started, 1);
  ASSERT_EQ(static_cast<uint64_t>(ticks), r->samples);
  ASSERT_EQ(r->peak_memory_bytes, 2048u);
  // Idle target
  ASSERT_EQ(r->score.value, 100);
  ASSERT_TRUE(!r->score.insufficient_data);
  ASSERT_EQ(sampler.tracked(), 0u);
}

TEST(session_process_exit_ends_with_report) {
  FakeProcessTable table;
  table.add(7, "short");
  table.vanish_after(7, 3);
  Sampler sampler(table);
  SessionController s(table, sampler, SessionOptions{seconds(10), milliseconds(1000)});
  auto r = s.run(7);
  ASSERT_TRUE(r.has_value());
  ASSERT_TRUE(s.state() == SessionState::Completed);
  ASSERT_TRUE(r->end_reason == EndReason::ProcessGone);
  ASSERT_EQ(r->samples, 3u);
  ASSERT_EQ(r->requested_seconds, 10);
  // Measured up to the tick that found it gone, not the requested window
  ASSERT_NEAR(r->duration_s, 3.0, 0.5);
  ASSERT_TRUE(r->score.value >= 0 && r->score.value <= 100);
}

TEST(session_single_sample_is_insufficient) {
  FakeProcessTable table;
  table.add(7, "blink");
  table.vanish_after(7, 1);
  Sampler sampler(table);
  SessionController s(table, sampler, SessionOptions{seconds(5), milliseconds(100)});
  auto r = s.run(7);
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->samples, 1u);
  ASSERT_EQ(r->cpu_samples, 0u);
  ASSERT_TRUE(r->score.insufficient_data);
  ASSERT_EQ(r->score.value, 100);
}

TEST(session_busy_target_loses_points) {
  FakeProcessTable table;
  table.add(9, "spin");
  // One full core: 100 ticks per second at a 500ms interval
  for (uint64_t i = 0; i < 8; ++i) table.script(9, RawUsage{i * 50, 1 << 20});
  Sampler sampler(table);
  SessionController s(table, sampler, SessionOptions{seconds(2), milliseconds(500)});
  auto r = s.run(9);
  ASSERT_TRUE(r.has_value());
  ASSERT_TRUE(r->avg_cpu_pct > 80.0 && r->avg_cpu_pct < 120.0);
  ASSERT_TRUE(r->peak_cpu_pct >= r->avg_cpu_pct);
  ASSERT_TRUE(r->cpu_seconds > 1.5);
  ASSERT_TRUE(r->score.value < 100);
}

TEST(session_permission_lost_mid_session_aborts) {
  FakeProcessTable table;
  table.add(5, "daemon");
  table.script(5, RawUsage{1, 1});
  table.script(5, std::unexpected(ErrorKind::PermissionDenied));
  Sampler sampler(table);
  SessionController s(table, sampler, SessionOptions{seconds(5), milliseconds(50)});
  auto r = s.run(5);
  ASSERT_TRUE(!r.has_value());
  ASSERT_TRUE(r.error().kind == ErrorKind::PermissionDenied);
  ASSERT_TRUE(s.state() == SessionState::Aborted);
  ASSERT_EQ(sampler.tracked(), 0u);
}

TEST(session_stop_request_cancels_promptly) {
  FakeProcessTable table;
  table.add(3, "long");
  Sampler sampler(table);
  SessionController s(table, sampler, SessionOptions{seconds(30), milliseconds(1000)});
  std::stop_source src;
  std::jthread stopper([&src]{
    std::this_thread::sleep_for(milliseconds(150));
    src.request_stop();
  });
  auto t0 = steady_clock::now();
  auto r = s.run(3, src.get_token());
  double wall = duration<double>(steady_clock::now() - t0).count();
  ASSERT_TRUE(!r.has_value());
  ASSERT_TRUE(r.error().kind == ErrorKind::Cancelled);
  ASSERT_TRUE(s.state() == SessionState::Aborted);
  ASSERT_TRUE(wall < 1.0);
}

TEST(session_already_stopped_token_aborts_before_sampling) {
  FakeProcessTable table;
  table.add(3, "long");
  Sampler sampler(table);
  SessionController s(table, sampler, SessionOptions{seconds(30), milliseconds(1000)});
  std::stop_source src;
  src.request_stop();
  auto r = s.run(3, src.get_token());
  ASSERT_TRUE(!r.has_value());
  ASSERT_TRUE(r.error().kind == ErrorKind::Cancelled);
  ASSERT_EQ(table.read_calls, 0);
}

TEST(interrupt_flag_becomes_stop_request) {
  std::atomic<bool> flag{true}; // stale press from before the command
  seagreen::app::InterruptWatch watch(flag, milliseconds(5));
  auto token = watch.arm();
  ASSERT_TRUE(!flag.load());
  std::this_thread::sleep_for(milliseconds(30));
  ASSERT_TRUE(!token.stop_requested());
  flag.store(true);
  for (int i = 0; i < 200 && !token.stop_requested(); ++i) std::this_thread::sleep_for(milliseconds(5));
  ASSERT_TRUE(token.stop_requested());
  watch.disarm();
  ASSERT_TRUE(!flag.load());
  // Each command gets a fresh token
  auto next = watch.arm();
  ASSERT_TRUE(!next.stop_requested());
  watch.disarm();
}

TEST(session_state_names) {
  using seagreen::model::to_string;
  ASSERT_EQ(std::string(to_string(SessionState::Pending)), std::string("pending"));
  ASSERT_EQ(std::string(to_string(SessionState::Running)), std::string("running"));
  ASSERT_EQ(std::string(to_string(SessionState::Completed)), std::string("completed"));
  ASSERT_EQ(std::string(to_string(SessionState::Aborted)), std::string("aborted"));
}

TEST(session_logs_through_table_name_when_debugging) {
  FakeProcessTable table;
  table.add(8, "logged");
  table.vanish_after(8, 1);
  ASSERT_EQ(std::string(table.name()), std::string("fake"));
  seagreen::util::set_debug(true);
  Sampler sampler(table);
  SessionController s(table, sampler, SessionOptions{seconds(1), milliseconds(50)});
  auto r = s.run(8);
  seagreen::util::set_debug(false);
  ASSERT_TRUE(r.has_value());
  ASSERT_TRUE(s.state() == SessionState::Completed);
}
