#include "pch.h"
#include "nocgen/sweep.h"

using namespace nocgen;
using namespace nocgen::impl;

std::string SweepResult::to_string() const
{
	std::string result = util::fmt("%s after %u rates, zero-load latency %.2f",
		state.to_string(), oracle_calls, zero_load_latency);

	if (state == SweepState::SATURATED)
		result += util::fmt(", saturates at %g%%", saturation_rate);

	return result;
}

SweepController::SweepController(const SweepOptions& opts)
	: m_opts(opts), m_step(opts.sweep_step)
{
	check_options(m_opts);
}

SweepState SweepController::get_state() const
{
	return m_result.state;
}

double SweepController::next_rate() const
{
	if (m_result.state != SweepState::PROBING)
		throw Exception("sweep already finished");

	return m_next;
}

void SweepController::record(double latency)
{
	if (m_result.state != SweepState::PROBING)
		throw Exception("sweep already finished");

	double rate = m_next;
	m_result.samples.push_back({rate, latency});
	m_result.oracle_calls++;

	log::debug("sweep: rate %g%% -> latency %g", rate, latency);

	if (m_result.samples.size() == 1)
	{
		// Zero-load measurement
		if (std::isinf(latency) || std::isnan(latency))
			throw Exception("zero-load simulation did not complete");

		m_result.zero_load_latency = latency;
		m_result.latency_threshold = std::max(m_opts.latency_floor,
			m_opts.latency_factor * latency);
	}
	else
	{
		if (latency > m_result.latency_threshold)
		{
			m_result.state = SweepState::SATURATED;
			m_result.saturation_rate = rate;
			return;
		}

		// Slow down where the curve steepens
		auto& prev = m_result.samples[m_result.samples.size() - 2];
		double slope = (latency - prev.latency) / (rate - prev.rate);
		if (slope >= m_opts.sweep_threshold)
			m_step = std::max(m_opts.min_step, m_step / 2);
	}

	m_next = rate + m_step;

	// Make sure the top of the range gets measured before giving up
	if (m_next > m_opts.max_rate)
	{
		if (rate < m_opts.max_rate)
			m_next = m_opts.max_rate;
		else
			m_result.state = SweepState::EXHAUSTED_RANGE;
	}
}

const SweepResult& SweepController::result() const
{
	return m_result;
}

SweepResult SweepController::run(const LatencyFunc& latency, const SweepOptions& opts)
{
	SweepController ctl(opts);
	while (ctl.get_state() == SweepState::PROBING)
		ctl.record(latency(ctl.next_rate()));

	log::info("sweep: %s", ctl.result().to_string().c_str());

	return ctl.result();
}

SweepResult SweepController::run(SimOracle& oracle, const Graph& g, TrafficPattern pattern,
	const SweepOptions& opts)
{
	return run([&](double rate)
	{
		SimResult res = oracle.simulate(g, rate, pattern);
		return res.timeout ? std::numeric_limits<double>::infinity() : res.avg_latency;
	}, opts);
}
