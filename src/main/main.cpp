#include <iostream>
#include <boost/regex.hpp>

#include "getoptpp/getopt_pp.h"

#include "nocgen/nocgen.h"
#include "nocgen/log.h"
#include "nocgen/flow.h"
#include "nocgen/analytic_model.h"
#include "nocgen/lua/nocgen_lua.h"

using namespace nocgen;

namespace
{
	std::string s_script;
	lua::ArgsVec s_lua_args;

	// Command-line overrides, applied after the script has run
	bool s_verbose = false;
	bool s_no_converters = false;
	bool s_relax_niu = false;
	bool s_no_opt = false;
	bool s_sweep = false;
	bool s_routes = false;
	TrafficPattern s_pattern = TrafficPattern::UNIFORM;

	void parse_lua_args(const std::string& argstr)
	{
		// Extract key=val,key=val,... pairs from string
		for (auto cur_pos = argstr.cbegin(), end_pos = argstr.cend(); cur_pos != end_pos; )
		{
			static boost::regex pattern(R"(((\w+)=([^,=]+)(,)?).*)");
			boost::smatch mr;

			if (!boost::regex_match(cur_pos, end_pos, mr, pattern))
				throw Exception("malformed Lua args: " + argstr);

			s_lua_args.emplace_back(mr[2].str(), mr[3].str());
			cur_pos = mr[1].second;
		}
	}

	void parse_args(int argc, char** argv)
	{
		GetOpt::GetOpt_pp args(argc, argv);

		args >> GetOpt::OptionPresent("verbose", s_verbose);
		args >> GetOpt::OptionPresent("no_converters", s_no_converters);
		args >> GetOpt::OptionPresent("relax_niu", s_relax_niu);
		args >> GetOpt::OptionPresent("no_opt", s_no_opt);
		args >> GetOpt::OptionPresent("routes", s_routes);

		{
			std::string argstr;
			args >> GetOpt::Option("args", argstr);
			parse_lua_args(argstr);
		}

		args >> GetOpt::OptionPresent("sweep", s_sweep);
		if (s_sweep)
		{
			std::string pattern;
			args >> GetOpt::Option("sweep", pattern);
			if (!pattern.empty() && !TrafficPattern::from_string(pattern, s_pattern))
				throw Exception("unknown traffic pattern " + pattern);
		}

		if (!(args >> GetOpt::GlobalOption(s_script)))
			throw Exception("Must specify Lua script");
	}

	void s_exec_script()
	{
		log::info("Executing script %s", s_script.c_str());

		if (!s_lua_args.empty())
		{
			log::info("Script args:");
			for (const auto& parm : s_lua_args)
			{
				log::info("  %s=%s", parm.first.c_str(), parm.second.c_str());
			}
		}

		lua::exec_script(s_script);
	}

	void print_routes(const FlowResult& result)
	{
		auto& g = result.graph;
		auto& routes = result.routes;

		for (auto& entry : routes.entries())
		{
			NodeID src = entry.first.first;
			NodeID dst = entry.first.second;
			NodeID next = routes.neighbor(src, entry.second);

			std::cout << g.node(src).name << " -> " << g.node(dst).name << ": port "
				<< entry.second << " (" << g.node(next).name << ")" << std::endl;
		}
	}

	bool s_do_flow()
	{
		const Requirements& req = lua::requirements();
		FlowOptions opts = lua::options();

		if (s_no_converters) opts.auto_insert_converters = false;
		if (s_relax_niu) opts.niu_entry_only = false;
		if (s_no_opt) opts.run_optimizer = false;
		if (s_routes) opts.build_routes = true;

		FlowResult result = run_flow(req, opts);

		log::info("Synthesis: %s", result.synthesis.to_string().c_str());
		if (result.clock_converters || result.width_converters)
		{
			log::info("Converters: %u clock, %u width", result.clock_converters,
				result.width_converters);
		}

		if (result.optimized)
			log::info("Optimization: %s", result.optimization.to_string().c_str());

		if (!result.ok())
		{
			log::error("Flow stopped at stage %s", result.stage.to_string());
			return false;
		}

		log::info("Final topology: %s", summarize(result.graph).to_string().c_str());

		if (result.routed)
		{
			log::info("Routing table: %u entries", result.routes.size());
			if (s_routes)
				print_routes(result);
		}

		if (s_sweep)
		{
			AnalyticOracle oracle(result.flows, opts.generator.default_frequency);
			auto sweep = SweepController::run(oracle, result.graph, s_pattern, opts.sweep);

			if (sweep.state == SweepState::SATURATED)
			{
				log::info("Saturation point: %g%% injection (zero-load latency %.2f cycles)",
					sweep.saturation_rate, sweep.zero_load_latency);
			}
			else
			{
				log::info("No saturation up to %g%% injection", opts.sweep.max_rate);
			}
		}

		return true;
	}
}

int main(int argc, char** argv)
{
	int result = 1;

	try
	{
		parse_args(argc, argv);

		if (s_verbose)
			log::set_level(log::Message::DEBUG);

		lua::init(s_lua_args);
		s_exec_script();

		if (s_do_flow())
			result = 0;
	}
	catch (std::exception& e)
	{
		nocgen::log::error("%s", e.what());
	}

	lua::shutdown();

	return result;
}
