#include "pch.h"
#include "nocgen/node.h"

using namespace nocgen;
using namespace nocgen::impl;

namespace
{
	void require(bool cond, const char* what)
	{
		if (!cond)
			throw ConfigError(what);
	}
}

void nocgen::check_options(const GeneratorOptions& o)
{
	require(!o.fast_domain.empty() && !o.slow_domain.empty(), "generator clock domain names must be non-empty");
	require(o.fast_bw_threshold > 0, "fast_bw_threshold must be positive");
	require(o.default_frequency > 0, "default_frequency must be positive");
	require(!o.crossbar_name.empty(), "crossbar_name must be non-empty");
	require(o.target_latency_divisor > 0, "target_latency_divisor must be positive");
}

void nocgen::check_options(const OptimizerOptions& o)
{
	require(o.low_bw_threshold > 0, "low_bw_threshold must be positive");
	require(o.high_bw_threshold >= o.low_bw_threshold, "high_bw_threshold must be at least low_bw_threshold");
	require(o.max_arbiter_inputs >= 2 && o.max_arbiter_inputs <= MAX_FANOUT,
		"max_arbiter_inputs must be between 2 and 4");
	require(o.default_frequency > 0, "default_frequency must be positive");
	require(!o.crossbar_name.empty(), "crossbar_name must be non-empty");
	require(o.weights.throughput >= 0 && o.weights.latency >= 0 && o.weights.area >= 0,
		"cost weights must be non-negative");
	require(o.weights.throughput + o.weights.latency + o.weights.area > 0,
		"cost weights must not all be zero");
}

void nocgen::check_options(const SweepOptions& o)
{
	require(o.sweep_step > 0, "sweep_step must be positive");
	require(o.min_step > 0 && o.min_step <= o.sweep_step, "min_step must be in (0, sweep_step]");
	require(o.sweep_threshold > 0, "sweep_threshold must be positive");
	require(o.latency_floor >= 0, "latency_floor must be non-negative");
	require(o.latency_factor >= 1, "latency_factor must be at least 1");
	require(o.max_rate > 0 && o.max_rate <= 100, "max_rate must be in (0, 100]");
}

void nocgen::check_options(const FlowOptions& o)
{
	require(o.utilization_warning > 0 && o.utilization_warning <= 1,
		"utilization_warning must be in (0, 1]");

	check_options(o.generator);
	check_options(o.optimizer);
	check_options(o.sweep);
}
