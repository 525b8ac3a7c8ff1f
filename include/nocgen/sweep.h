#pragma once

#include <vector>
#include <functional>
#include "nocgen/graph.h"

namespace nocgen
{
	struct SimResult
	{
		double avg_latency = 0;	// cycles
		unsigned long pkt_generated = 0;
		unsigned long total_received = 0;
		bool timeout = false;
	};

	// Performance model of a topology: a cycle-accurate simulator, or a stand-in
	class SimOracle
	{
	public:
		virtual ~SimOracle() = default;

		// injection_rate is a percentage in [0, 100]
		virtual SimResult simulate(const Graph& g, double injection_rate,
			TrafficPattern pattern) = 0;
	};

	SMART_ENUM(SweepState, PROBING, SATURATED, EXHAUSTED_RANGE);

	struct SweepSample
	{
		double rate;
		double latency;	// infinity for a timed-out run
	};

	struct SweepResult
	{
		SweepState state = SweepState::PROBING;
		double saturation_rate = -1;	// only meaningful when SATURATED
		double zero_load_latency = 0;
		double latency_threshold = 0;
		std::vector<SweepSample> samples;
		unsigned oracle_calls = 0;

		std::string to_string() const;
	};

	using LatencyFunc = std::function<double(double)>;

	//
	// Adaptive search for the saturation point: the lowest injection rate whose
	// latency exceeds max(latency_floor, latency_factor * zero-load latency).
	// Starts at rate 0 and advances by a step that halves whenever the latency
	// curve gets steep. Assumes latency does not decrease with rate.
	//
	// The controller is driven one rate at a time, so a caller can stop
	// between oracle calls:
	//
	//   SweepController ctl(opts);
	//   while (ctl.get_state() == SweepState::PROBING)
	//       ctl.record(latency(ctl.next_rate()));
	//
	class SweepController
	{
	public:
		explicit SweepController(const SweepOptions& opts = SweepOptions());

		SweepState get_state() const;

		// Next rate to measure. Throws if the sweep is finished.
		double next_rate() const;

		// Latency measured at next_rate(). A zero-load measurement that times out
		// throws, since there's nothing to compare against.
		void record(double latency);

		const SweepResult& result() const;

		// Whole sweeps
		static SweepResult run(const LatencyFunc& latency,
			const SweepOptions& opts = SweepOptions());
		static SweepResult run(SimOracle& oracle, const Graph& g, TrafficPattern pattern,
			const SweepOptions& opts = SweepOptions());

	protected:
		SweepOptions m_opts;
		SweepResult m_result;
		double m_next = 0;
		double m_step;
	};
}
