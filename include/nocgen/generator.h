#pragma once

#include <map>
#include <vector>
#include <string>
#include "nocgen/graph.h"

namespace nocgen
{
	struct InitiatorSpec
	{
		std::string name;
		double avg_throughput = 0;
		double max_throughput = 0;
		unsigned latency_requirement = 0;
		unsigned priority = 0;
		TrafficPattern traffic_pattern = TrafficPattern::BURSTY;
	};

	struct TargetSpec
	{
		std::string name;
		double max_bandwidth = 0;
		unsigned latency = 0;
		double size = 0;
	};

	// Endpoints referenced by name
	struct FlowSpec
	{
		std::string src;
		std::string dst;
		double bandwidth = 0;
		unsigned max_latency = 0;
		unsigned priority = 0;
	};

	struct Requirements
	{
		std::string network;
		std::vector<InitiatorSpec> initiators;
		std::vector<TargetSpec> targets;
		std::vector<FlowSpec> flows;
		std::vector<ClockDomain> clock_domains;
		OptimizeFor optimize_for = OptimizeFor::BANDWIDTH;
	};

	struct SynthesisReport
	{
		GraphSummary summary;
		std::map<std::string, unsigned> widths;	// derived width per NIU
		unsigned crossbar_width = 0;
		unsigned crossbar_ports = 0;
		double required_bandwidth = 0;	// sum of guaranteed flow bandwidth
		double capacity_bandwidth = 0;	// sum of target max_bandwidth

		std::string to_string() const;
	};

	struct GeneratedTopology
	{
		Graph graph;
		FlowList flows;
		SynthesisReport report;
	};

	// Builds the baseline topology: one NIU per endpoint and a single crossbar
	// Router giving every initiator a path to every target. Throws ConfigError
	// for non-positive bandwidths or frequencies, unresolvable or duplicate
	// names, flows above their initiator's max_throughput, and widths beyond
	// MAX_WIDTH.
	GeneratedTopology generate(const Requirements& req,
		const GeneratorOptions& opts = GeneratorOptions());

	// Datapath width needed to carry 'bandwidth' GB/s at 'frequency' MHz,
	// rounded up to a legal width
	unsigned derive_width(double bandwidth, double frequency);
}
