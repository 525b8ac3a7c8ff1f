#pragma once

#include "nocgen/sweep.h"

namespace nocgen
{
	//
	// Queueing-model stand-in for a cycle-accurate simulator. Each initiator
	// injects the given percentage of its NIU link capacity, split across its
	// flows in proportion to their guaranteed bandwidth. Flow latency is the
	// zero-load path latency plus a G/D/1 (Kingman) waiting time at every node
	// on the path. A node driven at or beyond its capacity makes the run time
	// out.
	//
	class AnalyticOracle : public SimOracle
	{
	public:
		// Throws ConfigError if there are no flows
		AnalyticOracle(const FlowList& flows, double default_frequency = 2000.0);

		SimResult simulate(const Graph& g, double injection_rate,
			TrafficPattern pattern) override;

		// Squared coefficient of variation of inter-arrival times
		static double arrival_variability(TrafficPattern pattern);

		// Link capacity of a node in GB/s, 0 if it has no datapath
		static double capacity(const Graph& g, NodeID id, double default_frequency);

	protected:
		FlowList m_flows;
		double m_default_freq;

		// Injection window used to report packet counts
		unsigned m_window = 10000;
	};
}
