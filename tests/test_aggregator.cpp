#include "minitest.hpp"
#include "app/Aggregator.hpp"

using seagreen::model::Observation;

static Observation obs(double cpu, bool valid, uint64_t mem, double cpu_time = 0.0) {
  Observation o;
  o.cpu_pct = cpu;
  o.cpu_valid = valid;
  o.memory_bytes = mem;
  o.cpu_time_s = cpu_time;
  return o;
}

TEST(aggregator_finalize_is_idempotent) {
  seagreen::app::Aggregator agg;
  agg.ingest(obs(0.0, false, 1000));
  agg.ingest(obs(20.0, true, 3000));
  auto a = agg.finalize();
  auto b = agg.finalize();
  ASSERT_TRUE(a == b);
  ASSERT_EQ(a.samples, 2u);
}

TEST(aggregator_peaks_bound_averages) {
  seagreen::app::Aggregator agg;
  agg.ingest(obs(0.0, false, 4096));
  agg.ingest(obs(10.0, true, 8192));
  agg.ingest(obs(50.0, true, 2048));
  agg.ingest(obs(30.0, true, 4096));
  auto s = agg.finalize();
  ASSERT_NEAR(s.avg_cpu(), 30.0, 1e-9);
  ASSERT_NEAR(s.cpu_peak, 50.0, 1e-9);
  ASSERT_EQ(s.memory_peak, 8192u);
  ASSERT_NEAR(s.avg_memory(), (4096.0 + 8192.0 + 2048.0 + 4096.0) / 4.0, 1e-9);
  ASSERT_TRUE(s.cpu_peak >= s.avg_cpu());
  ASSERT_TRUE(static_cast<double>(s.memory_peak) >= s.avg_memory());
}

TEST(aggregator_warmup_counts_only_towards_memory) {
  seagreen::app::Aggregator agg;
  agg.ingest(obs(0.0, false, 1000));
  auto s = agg.finalize();
  ASSERT_EQ(s.samples, 1u);
  ASSERT_EQ(s.cpu_samples, 0u);
  ASSERT_NEAR(s.avg_cpu(), 0.0, 1e-12);
  ASSERT_EQ(s.memory_peak, 1000u);
}

TEST(aggregator_cpu_seconds_spans_first_to_last) {
  seagreen::app::Aggregator agg;
  agg.ingest(obs(0.0, false, 1, 12.5));
  agg.ingest(obs(50.0, true, 1, 13.0));
  agg.ingest(obs(50.0, true, 1, 13.5));
  ASSERT_NEAR(agg.finalize().cpu_seconds(), 1.0, 1e-9);
}

TEST(aggregator_empty_and_reset) {
  seagreen::app::Aggregator agg;
  auto empty = agg.finalize();
  ASSERT_EQ(empty.samples, 0u);
  ASSERT_NEAR(empty.avg_memory(), 0.0, 1e-12);
  ASSERT_NEAR(empty.cpu_seconds(), 0.0, 1e-12);
  agg.ingest(obs(5.0, true, 10));
  agg.reset();
  ASSERT_TRUE(agg.finalize() == empty);
}
