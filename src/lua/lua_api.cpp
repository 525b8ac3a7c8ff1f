#include <cmath>
#include <string>
#include <map>
#include <functional>
#include "nocgen/lua/nocgen_lua.h"
#include "nocgen/log.h"

using namespace nocgen;
using namespace nocgen::lua;

// LDoc package description

/// Functions for describing a network's requirements.
/// The contents of this package come pre-loaded into the global environment in a table called 'nocgen'.
/// @module nocgen

namespace
{
	Requirements s_req;
	FlowOptions s_opts;

	//
	// Table field access. These don't raise Lua errors themselves: problems are
	// thrown as ConfigError and turned into a Lua error by api_call().
	//

	bool has_field(lua_State* L, const char* key)
	{
		lua_getfield(L, 1, key);
		bool result = !lua_isnil(L, -1);
		lua_pop(L, 1);
		return result;
	}

	std::string get_string(lua_State* L, const char* key)
	{
		lua_getfield(L, 1, key);
		if (lua_type(L, -1) != LUA_TSTRING)
		{
			lua_pop(L, 1);
			throw ConfigError(std::string("missing or non-string field '") + key + "'");
		}

		std::string result = lua_tostring(L, -1);
		lua_pop(L, 1);
		return result;
	}

	double get_number(lua_State* L, const char* key, bool required, double def = 0)
	{
		lua_getfield(L, 1, key);
		if (lua_isnil(L, -1) && !required)
		{
			lua_pop(L, 1);
			return def;
		}

		if (lua_type(L, -1) != LUA_TNUMBER)
		{
			lua_pop(L, 1);
			throw ConfigError(std::string("missing or non-numeric field '") + key + "'");
		}

		double result = lua_tonumber(L, -1);
		lua_pop(L, 1);
		return result;
	}

	unsigned get_unsigned(lua_State* L, const char* key, bool required, unsigned def = 0)
	{
		double val = get_number(L, key, required, def);
		if (val < 0 || val != std::floor(val))
		{
			throw ConfigError(std::string("field '") + key +
				"' must be a non-negative integer");
		}
		return (unsigned)val;
	}

	// Runs an API function body. C++ exceptions must not unwind through Lua,
	// so failures are left on the Lua stack as an error message instead.
	bool api_call(lua_State* L, const std::function<void()>& body)
	{
		try
		{
			body();
			return true;
		}
		catch (Exception& e)
		{
			lua_pushstring(L, e.what());
			return false;
		}
	}

	/// Declare a clock domain
	/// @function clock_domain
	/// @tparam table args name (string), frequency (MHz)
	LFUNC(nocgen_clock_domain)
	{
		luaL_checktype(L, 1, LUA_TTABLE);

		bool ok = api_call(L, [=]()
		{
			ClockDomain d;
			d.name = get_string(L, "name");
			d.frequency = get_number(L, "frequency", true);

			if (d.frequency <= 0)
				throw ConfigError("clock domain " + d.name + " needs a positive frequency");

			s_req.clock_domains.push_back(d);
		});

		return ok ? 0 : lua_error(L);
	}

	/// Declare a traffic initiator
	/// @function initiator
	/// @tparam table args name, avg_throughput, max_throughput (GB/s),
	/// latency_req (cycles), priority (0 = highest), pattern (bursty, streaming, uniform)
	LFUNC(nocgen_initiator)
	{
		luaL_checktype(L, 1, LUA_TTABLE);

		bool ok = api_call(L, [=]()
		{
			InitiatorSpec decl;
			decl.name = get_string(L, "name");
			decl.max_throughput = get_number(L, "max_throughput", true);
			decl.avg_throughput = get_number(L, "avg_throughput", false, decl.max_throughput);
			decl.latency_requirement = get_unsigned(L, "latency_req", false);
			decl.priority = get_unsigned(L, "priority", false);

			if (has_field(L, "pattern"))
			{
				std::string pattern = get_string(L, "pattern");
				if (!TrafficPattern::from_string(pattern, decl.traffic_pattern))
					throw ConfigError("unknown traffic pattern " + pattern);
			}

			s_req.initiators.push_back(decl);
		});

		return ok ? 0 : lua_error(L);
	}

	/// Declare a target
	/// @function target
	/// @tparam table args name, max_bandwidth (GB/s), latency (cycles), size (GB)
	LFUNC(nocgen_target)
	{
		luaL_checktype(L, 1, LUA_TTABLE);

		bool ok = api_call(L, [=]()
		{
			TargetSpec decl;
			decl.name = get_string(L, "name");
			decl.max_bandwidth = get_number(L, "max_bandwidth", true);
			decl.latency = get_unsigned(L, "latency", false);
			decl.size = get_number(L, "size", false);

			s_req.targets.push_back(decl);
		});

		return ok ? 0 : lua_error(L);
	}

	/// Declare a traffic flow between a named initiator and target
	/// @function flow
	/// @tparam table args src, dst, bandwidth (GB/s), max_latency (cycles), priority
	LFUNC(nocgen_flow)
	{
		luaL_checktype(L, 1, LUA_TTABLE);

		bool ok = api_call(L, [=]()
		{
			FlowSpec decl;
			decl.src = get_string(L, "src");
			decl.dst = get_string(L, "dst");
			decl.bandwidth = get_number(L, "bandwidth", true);
			decl.max_latency = get_unsigned(L, "max_latency", false);
			decl.priority = get_unsigned(L, "priority", false);

			s_req.flows.push_back(decl);
		});

		return ok ? 0 : lua_error(L);
	}

	/// Set the optimization goal
	/// @function optimize_for
	/// @tparam string goal bandwidth, latency or none
	LFUNC(nocgen_optimize_for)
	{
		const char* goal = luaL_checkstring(L, 1);

		if (!OptimizeFor::from_string(goal, s_req.optimize_for))
			return luaL_error(L, "unknown optimization goal %s", goal);

		return 0;
	}

	/// Set a flow option by name
	/// @function option
	/// @tparam string name option name, eg. high_bw_threshold
	/// @param value number, boolean or string
	LFUNC(nocgen_option)
	{
		const char* name = luaL_checkstring(L, 1);
		luaL_checkany(L, 2);

		// Booleans don't convert with lua_tostring
		const char* value = lua_isboolean(L, 2) ?
			(lua_toboolean(L, 2) ? "true" : "false") : luaL_checkstring(L, 2);

		bool ok = api_call(L, [=]()
		{
			set_option(s_opts, name, value);
		});

		return ok ? 0 : lua_error(L);
	}

	/// Name the network
	/// @function network
	/// @tparam string name
	LFUNC(nocgen_network)
	{
		s_req.network = luaL_checkstring(L, 1);
		return 0;
	}

	LGLOBALS(
	{
		LM(clock_domain, nocgen_clock_domain),
		LM(initiator, nocgen_initiator),
		LM(target, nocgen_target),
		LM(flow, nocgen_flow),
		LM(optimize_for, nocgen_optimize_for),
		LM(option, nocgen_option),
		LM(network, nocgen_network)
	});

	//
	// Option setters, by name
	//

	bool parse_bool(const std::string& str)
	{
		if (str == "true" || str == "1" || str == "yes")
			return true;
		if (str == "false" || str == "0" || str == "no")
			return false;

		throw ConfigError("expected a boolean, got " + str);
	}

	double parse_double(const std::string& str)
	{
		size_t used = 0;
		double result = 0;

		try
		{
			result = std::stod(str, &used);
		}
		catch (std::logic_error&)
		{
			throw ConfigError("expected a number, got " + str);
		}

		if (used != str.size())
			throw ConfigError("expected a number, got " + str);

		return result;
	}

	unsigned parse_unsigned(const std::string& str)
	{
		double val = parse_double(str);
		if (val < 0 || val != std::floor(val))
			throw ConfigError("expected a non-negative integer, got " + str);

		return (unsigned)val;
	}

	using Setter = std::function<void(FlowOptions&, const std::string&)>;

	const std::map<std::string, Setter>& setters()
	{
		static const std::map<std::string, Setter> s_setters =
		{
			{ "auto_insert_converters", [](FlowOptions& o, const std::string& v) { o.auto_insert_converters = parse_bool(v); } },
			{ "niu_entry_only", [](FlowOptions& o, const std::string& v) { o.niu_entry_only = parse_bool(v); } },
			{ "run_optimizer", [](FlowOptions& o, const std::string& v) { o.run_optimizer = parse_bool(v); } },
			{ "build_routes", [](FlowOptions& o, const std::string& v) { o.build_routes = parse_bool(v); } },
			{ "utilization_warning", [](FlowOptions& o, const std::string& v) { o.utilization_warning = parse_double(v); } },

			{ "fast_domain", [](FlowOptions& o, const std::string& v) { o.generator.fast_domain = v; } },
			{ "slow_domain", [](FlowOptions& o, const std::string& v) { o.generator.slow_domain = v; } },
			{ "fast_bw_threshold", [](FlowOptions& o, const std::string& v) { o.generator.fast_bw_threshold = parse_double(v); } },
			{ "default_frequency", [](FlowOptions& o, const std::string& v)
				{
					o.generator.default_frequency = parse_double(v);
					o.optimizer.default_frequency = o.generator.default_frequency;
				} },
			{ "crossbar_name", [](FlowOptions& o, const std::string& v)
				{
					o.generator.crossbar_name = v;
					o.optimizer.crossbar_name = v;
				} },

			{ "high_bw_threshold", [](FlowOptions& o, const std::string& v) { o.optimizer.high_bw_threshold = parse_double(v); } },
			{ "low_bw_threshold", [](FlowOptions& o, const std::string& v) { o.optimizer.low_bw_threshold = parse_double(v); } },
			{ "max_arbiter_inputs", [](FlowOptions& o, const std::string& v) { o.optimizer.max_arbiter_inputs = parse_unsigned(v); } },
			{ "throughput_weight", [](FlowOptions& o, const std::string& v) { o.optimizer.weights.throughput = parse_double(v); } },
			{ "latency_weight", [](FlowOptions& o, const std::string& v) { o.optimizer.weights.latency = parse_double(v); } },
			{ "area_weight", [](FlowOptions& o, const std::string& v) { o.optimizer.weights.area = parse_double(v); } },

			{ "sweep_step", [](FlowOptions& o, const std::string& v) { o.sweep.sweep_step = parse_double(v); } },
			{ "min_step", [](FlowOptions& o, const std::string& v) { o.sweep.min_step = parse_double(v); } },
			{ "sweep_threshold", [](FlowOptions& o, const std::string& v) { o.sweep.sweep_threshold = parse_double(v); } },
			{ "latency_floor", [](FlowOptions& o, const std::string& v) { o.sweep.latency_floor = parse_double(v); } },
			{ "latency_factor", [](FlowOptions& o, const std::string& v) { o.sweep.latency_factor = parse_double(v); } },
			{ "max_rate", [](FlowOptions& o, const std::string& v) { o.sweep.max_rate = parse_double(v); } }
		};

		return s_setters;
	}
}

Requirements& lua::requirements()
{
	return s_req;
}

FlowOptions& lua::options()
{
	return s_opts;
}

void lua::set_option(FlowOptions& opts, const std::string& name, const std::string& value)
{
	auto it = setters().find(name);
	if (it == setters().end())
		throw ConfigError("unknown option " + name);

	it->second(opts, value);
	log::debug("option %s = %s", name.c_str(), value.c_str());
}
