#include <cmath>
#include <limits>
#include "test_util.h"
#include "nocgen/sweep.h"

using namespace nocgen;
using namespace nocgen::test;

namespace
{
	// Replays a latency curve, timing out from a given rate upwards
	class CurveOracle : public SimOracle
	{
	public:
		CurveOracle(LatencyFunc curve, double timeout_at = 1000.0)
			: m_curve(curve), m_timeout_at(timeout_at)
		{
		}

		SimResult simulate(const Graph&, double rate, TrafficPattern) override
		{
			m_calls++;

			SimResult result;
			result.timeout = rate >= m_timeout_at;
			result.avg_latency = m_curve(rate);
			return result;
		}

		unsigned calls() const { return m_calls; }

	protected:
		LatencyFunc m_curve;
		double m_timeout_at;
		unsigned m_calls = 0;
	};
}

TEST(Sweep, NeverSaturates)
{
	LogCapture logs;
	auto res = SweepController::run([](double r) { return 10.0 + 0.5 * r; });

	EXPECT_TRUE(res.state == SweepState::EXHAUSTED_RANGE);
	EXPECT_DOUBLE_EQ(-1.0, res.saturation_rate);
	EXPECT_DOUBLE_EQ(10.0, res.zero_load_latency);
	EXPECT_DOUBLE_EQ(100.0, res.latency_threshold);

	// 0, 10, ..., 100
	EXPECT_EQ(11u, res.oracle_calls);
	ASSERT_EQ(11u, res.samples.size());
	EXPECT_DOUBLE_EQ(100.0, res.samples.back().rate);
}

TEST(Sweep, FindsKnee)
{
	LogCapture logs;

	// Flat until 60%, then steep. Crosses the threshold of 100 at about 63.4%.
	auto curve = [](double r)
	{
		double lat = 20.0 + 0.2 * r;
		if (r > 60.0)
			lat += (r - 60.0) * 20.0;
		return lat;
	};

	auto res = SweepController::run(curve);

	EXPECT_TRUE(res.state == SweepState::SATURATED);
	EXPECT_DOUBLE_EQ(70.0, res.saturation_rate);
	EXPECT_EQ(8u, res.oracle_calls);

	// Within one step of the true crossing
	double knee = 1280.0 / 20.2;
	EXPECT_GE(res.saturation_rate, knee);
	EXPECT_LE(res.saturation_rate - knee, SweepOptions().sweep_step);
}

TEST(Sweep, StepHalvesOnSteepSlope)
{
	LogCapture logs;
	auto res = SweepController::run([](double r) { return 10.0 + 2.0 * r; });

	ASSERT_TRUE(res.state == SweepState::SATURATED);

	// 0, 10, 15, 17.5, 18.75, then one-percent steps from 19.75
	ASSERT_GE(res.samples.size(), 5u);
	EXPECT_DOUBLE_EQ(10.0, res.samples[1].rate);
	EXPECT_DOUBLE_EQ(15.0, res.samples[2].rate);
	EXPECT_DOUBLE_EQ(17.5, res.samples[3].rate);
	EXPECT_DOUBLE_EQ(18.75, res.samples[4].rate);

	// Latency passes 100 at 45%; the min step bounds the overshoot
	EXPECT_DOUBLE_EQ(45.75, res.saturation_rate);
	EXPECT_LE(res.saturation_rate - 45.0, SweepOptions().min_step);
	EXPECT_EQ(32u, res.oracle_calls);
}

TEST(Sweep, ClampsToMaxRate)
{
	LogCapture logs;

	SweepOptions opts;
	opts.sweep_step = 30;
	opts.min_step = 5;

	auto res = SweepController::run([](double) { return 12.0; }, opts);

	EXPECT_TRUE(res.state == SweepState::EXHAUSTED_RANGE);
	ASSERT_EQ(5u, res.samples.size());
	EXPECT_DOUBLE_EQ(90.0, res.samples[3].rate);
	EXPECT_DOUBLE_EQ(100.0, res.samples[4].rate);
}

TEST(Sweep, ThresholdFollowsZeroLoad)
{
	LogCapture logs;

	// 2.5x a zero-load latency of 60 beats the floor of 100
	auto res = SweepController::run([](double r) { return r < 50.0 ? 60.0 : 160.0; });

	EXPECT_DOUBLE_EQ(150.0, res.latency_threshold);
	EXPECT_TRUE(res.state == SweepState::SATURATED);
	EXPECT_DOUBLE_EQ(50.0, res.saturation_rate);
}

TEST(Sweep, TimeoutSaturates)
{
	LogCapture logs;
	CurveOracle oracle([](double) { return 15.0; }, 30.0);

	auto res = SweepController::run(oracle, Graph(), TrafficPattern::UNIFORM);

	EXPECT_TRUE(res.state == SweepState::SATURATED);
	EXPECT_DOUBLE_EQ(30.0, res.saturation_rate);
	EXPECT_TRUE(std::isinf(res.samples.back().latency));
	EXPECT_EQ(4u, oracle.calls());
	EXPECT_EQ(oracle.calls(), res.oracle_calls);
}

TEST(Sweep, ZeroLoadTimeout)
{
	LogCapture logs;
	CurveOracle oracle([](double) { return 15.0; }, 0.0);

	EXPECT_THROW(SweepController::run(oracle, Graph(), TrafficPattern::BURSTY), Exception);
	EXPECT_EQ(1u, oracle.calls());
}

TEST(Sweep, Stepwise)
{
	LogCapture logs;
	SweepController ctl;

	EXPECT_TRUE(ctl.get_state() == SweepState::PROBING);
	EXPECT_DOUBLE_EQ(0.0, ctl.next_rate());

	ctl.record(20.0);
	EXPECT_DOUBLE_EQ(10.0, ctl.next_rate());

	ctl.record(21.0);
	EXPECT_DOUBLE_EQ(20.0, ctl.next_rate());

	ctl.record(std::numeric_limits<double>::infinity());
	EXPECT_TRUE(ctl.get_state() == SweepState::SATURATED);
	EXPECT_DOUBLE_EQ(20.0, ctl.result().saturation_rate);

	EXPECT_THROW(ctl.next_rate(), Exception);
	EXPECT_THROW(ctl.record(1.0), Exception);
}

TEST(Sweep, MonotoneTerminates)
{
	LogCapture logs;

	// Steep everywhere, so every step after the first halves the step
	SweepOptions opts;
	opts.min_step = 0.5;
	opts.latency_floor = 1e9;

	auto res = SweepController::run([](double r) { return 10.0 + 3.0 * r; }, opts);

	EXPECT_TRUE(res.state == SweepState::EXHAUSTED_RANGE);
	EXPECT_LE(res.oracle_calls, (unsigned)(opts.max_rate / opts.min_step) + 2);

	for (unsigned i = 1; i < res.samples.size(); i++)
		EXPECT_GT(res.samples[i].rate, res.samples[i - 1].rate);
}

TEST(Sweep, BadOptions)
{
	SweepOptions opts;
	opts.sweep_step = 0;
	EXPECT_THROW(SweepController ctl(opts), ConfigError);

	opts = SweepOptions();
	opts.min_step = 20;
	EXPECT_THROW(SweepController ctl(opts), ConfigError);

	opts = SweepOptions();
	opts.max_rate = 150;
	EXPECT_THROW(SweepController ctl(opts), ConfigError);

	opts = SweepOptions();
	opts.latency_factor = 0.5;
	EXPECT_THROW(SweepController ctl(opts), ConfigError);
}
