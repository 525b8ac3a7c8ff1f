#pragma once

#include <map>
#include <vector>
#include "nocgen/graph.h"

namespace nocgen
{
	// Bandwidth class of a flow relative to the optimizer thresholds
	SMART_ENUM(FlowClass, HIGH, MEDIUM, LOW);

	// How a flow is realized in the optimized topology
	SMART_ENUM(Implementation, DIRECT, CROSSBAR, ARBITER);

	struct FlowPlan
	{
		TrafficFlow flow;
		FlowClass cls;
		Implementation impl;
		bool routed = false;
		unsigned latency = 0;
		double cost = 0;
	};

	struct OptimizationReport
	{
		std::vector<FlowPlan> plans;
		std::map<Implementation, unsigned> distribution;

		unsigned dedicated_routers = 0;
		unsigned arbiters = 0;
		unsigned crossbar_edges_removed = 0;
		unsigned crossbar_edges_added = 0;
		unsigned reverted_steps = 0;

		double area_cost = 0;
		double avg_latency = 0;
		unsigned crossbar_flows = 0;
		double crossbar_bw_before = 0;
		double crossbar_bw_after = 0;

		bool changed() const;
		std::string to_string() const;
	};

	struct OptimizationResult
	{
		Graph graph;
		OptimizationReport report;
	};

	FlowClass classify(const TrafficFlow& flow, const OptimizerOptions& opts);

	// Restructures a generated topology around its shared crossbar. High-bandwidth
	// flows get a dedicated Router between their NIUs, and low-bandwidth flows
	// sharing a target are merged behind Arbiters. Every step is validated and
	// undone if it introduces errors, and (Initiator, Target) reachability is
	// never reduced. Running it again on its own output changes nothing.
	// Throws ConfigError if the graph has no crossbar.
	OptimizationResult optimize(const Graph& g, const FlowList& flows, OptimizeFor goal,
		const FlowOptions& opts = FlowOptions());

	// Total guaranteed bandwidth of the flows whose shortest path traverses the crossbar
	double crossbar_bandwidth(const Graph& g, const FlowList& flows,
		const std::string& crossbar_name);

	// Scores each flow's realization. Cost weights are normalized to sum to 1, so
	// every cost lies in [0, 1]. Used for the optimization report, and on its
	// own to evaluate a hand-built topology. Throws ConfigError for bad options.
	std::vector<FlowPlan> plan_flows(const Graph& g, const FlowList& flows,
		const OptimizerOptions& opts);
}
