#pragma once

#include <memory>
#include <functional>
#include "nocgen/flow.h"
#include "nocgen/sweep.h"

namespace nocgen
{
	struct Candidate
	{
		std::string name;
		Requirements req;
		FlowOptions opts;
	};

	struct ExploreResult
	{
		std::string name;
		bool ok = false;
		std::string error;	// why the candidate failed, if it did

		FlowStage stage = FlowStage::GENERATE;
		GraphSummary summary;
		double crossbar_bandwidth = 0;
		SweepResult sweep;
	};

	// Creates the performance oracle for one candidate's finished flow. Called
	// from worker threads, once per candidate.
	using OracleFactory = std::function<std::unique_ptr<SimOracle>(const FlowResult&)>;

	// Runs every candidate's full flow followed by a sweep, spread over
	// 'threads' workers. Results come back in candidate order. A candidate that
	// throws or fails validation is reported, not propagated.
	std::vector<ExploreResult> explore(const std::vector<Candidate>& candidates,
		const OracleFactory& factory, unsigned threads,
		TrafficPattern pattern = TrafficPattern::UNIFORM);
}
