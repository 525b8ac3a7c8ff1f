#include "pch.h"
#include "nocgen/flow.h"
#include "nocgen/converter.h"

using namespace nocgen;
using namespace nocgen::impl;

namespace
{
	void log_findings(const ValidationResult& res)
	{
		for (auto& f : res.errors)
			log::error("%s", f.to_string().c_str());
		for (auto& f : res.warnings)
			log::warn("%s", f.to_string().c_str());
	}

	// Returns false if validation failed and the flow should stop
	bool do_validate(FlowResult& result, FlowStage stage, const FlowOptions& opts)
	{
		result.validation = validate(result.graph, result.flows, opts);
		log_findings(result.validation);

		if (!result.validation.ok())
		{
			log::error("%s failed with %u errors", stage.to_string(),
				(unsigned)result.validation.errors.size());
			result.stage = stage;
			return false;
		}

		return true;
	}

	void do_flow(FlowResult& result, OptimizeFor goal, bool can_optimize, const FlowOptions& opts)
	{
		// Close clock/width gaps
		auto conv = insert_converters(result.graph, opts.auto_insert_converters);
		result.graph = conv.graph;
		result.clock_converters = (unsigned)conv.clock_converters.size();
		result.width_converters = (unsigned)conv.width_converters.size();

		if (!do_validate(result, FlowStage::VALIDATE, opts))
			return;

		if (opts.run_optimizer && can_optimize)
		{
			auto opt = optimize(result.graph, result.flows, goal, opts);
			result.graph = opt.graph;
			result.optimization = opt.report;
			result.optimized = true;

			if (!do_validate(result, FlowStage::REVALIDATE, opts))
				return;
		}

		if (opts.build_routes)
		{
			result.routes = RoutingTable(result.graph);
			result.routed = true;
		}

		result.stage = FlowStage::DONE;
	}
}

bool FlowResult::ok() const
{
	return stage == FlowStage::DONE;
}

FlowResult nocgen::run_flow(const Requirements& req, const FlowOptions& opts)
{
	check_options(opts);

	FlowResult result;

	auto gen = generate(req, opts.generator);
	result.graph = gen.graph;
	result.flows = gen.flows;
	result.synthesis = gen.report;

	// Generated topologies are optimized around the generated crossbar
	FlowOptions fopts = opts;
	fopts.optimizer.crossbar_name = opts.generator.crossbar_name;

	do_flow(result, req.optimize_for, true, fopts);
	return result;
}

FlowResult nocgen::run_flow(const Graph& g, const FlowList& flows, OptimizeFor goal,
	const FlowOptions& opts)
{
	check_options(opts);

	FlowResult result;
	result.graph = g;
	result.flows = flows;
	result.synthesis.summary = summarize(g);

	NodeID xbar = g.find_node(opts.optimizer.crossbar_name);
	bool can_optimize = xbar != INVALID_NODE && g.node(xbar).is<Router>();
	if (!can_optimize && opts.run_optimizer)
	{
		log::info("no crossbar named %s, skipping optimization",
			opts.optimizer.crossbar_name.c_str());
	}

	do_flow(result, goal, can_optimize, opts);
	return result;
}
