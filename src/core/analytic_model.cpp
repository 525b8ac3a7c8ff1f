#include "pch.h"
#include "nocgen/analytic_model.h"
#include "nocgen/graph_algo.h"

using namespace nocgen;
using namespace nocgen::impl;

AnalyticOracle::AnalyticOracle(const FlowList& flows, double default_frequency)
	: m_flows(flows), m_default_freq(default_frequency)
{
	if (m_flows.empty())
		throw ConfigError("analytic model needs at least one flow");

	for (auto& f : m_flows)
	{
		if (f.bandwidth <= 0)
			throw ConfigError(util::fmt("flow %u -> %u has non-positive bandwidth", f.src, f.dst));
	}

	if (m_default_freq <= 0)
		throw ConfigError(util::fmt("non-positive default frequency %g", m_default_freq));
}

double AnalyticOracle::arrival_variability(TrafficPattern pattern)
{
	switch (pattern)
	{
	case TrafficPattern::BURSTY: return 2.0;
	case TrafficPattern::UNIFORM: return 1.0;
	case TrafficPattern::STREAMING: return 0.0;
	}
	return 1.0;
}

double AnalyticOracle::capacity(const Graph& g, NodeID id, double default_frequency)
{
	const Node& n = g.node(id);

	if (n.is<Target>())
		return n.as<Target>().max_bandwidth;

	unsigned width = declared_width(n);
	if (width == 0)
		return 0;

	// bits/cycle * MHz / 8000 = GB/s
	double freq = g.frequency(declared_domain(n), default_frequency);
	return width * freq / 8000.0;
}

SimResult AnalyticOracle::simulate(const Graph& g, double injection_rate, TrafficPattern pattern)
{
	SimResult result;

	if (injection_rate < 0 || injection_rate > 100)
		throw ConfigError(util::fmt("injection rate %g%% outside [0, 100]", injection_rate));

	// Share of each initiator's injected load per flow
	std::map<NodeID, double> init_bw;
	for (auto& f : m_flows)
		init_bw[f.src] += f.bandwidth;

	struct Routed
	{
		const TrafficFlow* flow;
		NodeList path;
		unsigned latency;
		double load;	// GB/s
	};

	std::vector<Routed> routed;
	std::map<NodeID, double> node_load;

	for (auto& f : m_flows)
	{
		Routed r;
		r.flow = &f;
		if (!algo::shortest_path(g, f.src, f.dst, &r.path, &r.latency))
		{
			log::warn("analytic model: flow %u -> %u has no path", f.src, f.dst);
			result.timeout = true;
			return result;
		}

		// The link out of the initiator sets how much it can inject
		double link = r.path.size() > 1 ? capacity(g, r.path[1], m_default_freq) : 0;
		r.load = injection_rate / 100.0 * link * f.bandwidth / init_bw[f.src];

		for (NodeID id : r.path)
			node_load[id] += r.load;

		routed.push_back(r);
	}

	double ca2 = arrival_variability(pattern);
	double total_bw = 0;
	double max_rho = 0;

	for (auto& r : routed)
	{
		double wait = 0;
		for (NodeID id : r.path)
		{
			double cap = capacity(g, id, m_default_freq);
			if (cap <= 0)
				continue;

			double rho = node_load[id] / cap;
			max_rho = std::max(max_rho, rho);

			// Kingman's approximation, deterministic one-cycle service
			if (rho < 1.0)
				wait += (ca2 / 2.0) * rho / (1.0 - rho);
		}

		result.avg_latency += (r.latency + wait) * r.flow->bandwidth;
		total_bw += r.flow->bandwidth;
	}

	result.avg_latency /= total_bw;
	result.timeout = max_rho >= 1.0;

	// Each initiator offers one packet per cycle at full rate
	result.pkt_generated = (unsigned long)std::llround(
		injection_rate / 100.0 * m_window * init_bw.size());
	result.total_received = result.timeout ?
		(unsigned long)std::llround(result.pkt_generated / max_rho) : result.pkt_generated;

	log::debug("analytic model: rate %g%% latency %.2f max utilization %.2f%s", injection_rate,
		result.avg_latency, max_rho, result.timeout ? " (timeout)" : "");

	return result;
}
