#pragma once

#include "nocgen/graph.h"
#include "nocgen/generator.h"
#include "nocgen/validator.h"
#include "nocgen/optimizer.h"
#include "nocgen/routing.h"

namespace nocgen
{
	// Pipeline stages. A FlowResult's stage is the one that stopped the flow,
	// or DONE.
	SMART_ENUM(FlowStage, GENERATE, INSERT, VALIDATE, OPTIMIZE, REVALIDATE, ROUTE, DONE);

	struct FlowResult
	{
		FlowStage stage = FlowStage::GENERATE;

		Graph graph;
		FlowList flows;

		SynthesisReport synthesis;
		unsigned clock_converters = 0;
		unsigned width_converters = 0;

		// Findings of the most recent validation
		ValidationResult validation;

		bool optimized = false;
		OptimizationReport optimization;

		bool routed = false;
		RoutingTable routes;

		bool ok() const;
	};

	// Generator -> Converter Inserter -> Validator -> Optimizer -> Validator ->
	// Routing Table Builder. Stops after a validation stage that reports
	// errors. Transform-pass precondition failures are thrown.
	FlowResult run_flow(const Requirements& req, const FlowOptions& opts = FlowOptions());

	// Same, starting from an explicit graph. The optimizer only runs when the
	// graph has a crossbar.
	FlowResult run_flow(const Graph& g, const FlowList& flows, OptimizeFor goal,
		const FlowOptions& opts = FlowOptions());
}
