#include "pch.h"
#include "nocgen/generator.h"

using namespace nocgen;
using namespace nocgen::impl;

namespace
{
	void check_requirements(const Requirements& req)
	{
		if (req.initiators.empty())
			throw ConfigError("requirements have no initiators");

		if (req.targets.empty())
			throw ConfigError("requirements have no targets");

		std::set<std::string> names;
		auto claim = [&](const std::string& name)
		{
			if (name.empty())
				throw ConfigError("initiators and targets need names");
			if (!names.insert(name).second)
				throw ConfigError("duplicate name " + name);
		};

		for (auto& i : req.initiators)
		{
			claim(i.name);

			if (i.max_throughput <= 0)
			{
				throw ConfigError(util::fmt("initiator %s: max_throughput must be positive, got %g",
					i.name.c_str(), i.max_throughput));
			}

			if (i.avg_throughput < 0 || i.avg_throughput > i.max_throughput)
			{
				throw ConfigError(util::fmt("initiator %s: avg_throughput %g outside [0, %g]",
					i.name.c_str(), i.avg_throughput, i.max_throughput));
			}
		}

		for (auto& t : req.targets)
		{
			claim(t.name);

			if (t.max_bandwidth <= 0)
			{
				throw ConfigError(util::fmt("target %s: max_bandwidth must be positive, got %g",
					t.name.c_str(), t.max_bandwidth));
			}

			if (t.size < 0)
				throw ConfigError("target " + t.name + ": negative size");
		}

		std::map<std::string, double> peak;
		for (auto& i : req.initiators)
			peak[i.name] = i.max_throughput;

		for (auto& f : req.flows)
		{
			if (f.bandwidth <= 0)
			{
				throw ConfigError(util::fmt("flow %s -> %s: bandwidth must be positive, got %g",
					f.src.c_str(), f.dst.c_str(), f.bandwidth));
			}

			// Unknown names are reported when flows are resolved
			auto it = peak.find(f.src);
			if (it != peak.end() && f.bandwidth > it->second)
			{
				throw ConfigError(util::fmt("flow %s -> %s: bandwidth %g exceeds initiator max_throughput %g",
					f.src.c_str(), f.dst.c_str(), f.bandwidth, it->second));
			}
		}
	}

	// Look up an endpoint created by the generator, by name and kind
	NodeID resolve(const Graph& g, const std::string& name, NodeKind kind)
	{
		NodeID id = g.find_node(name);
		if (id == INVALID_NODE || g.node(id).kind() != kind)
		{
			throw ConfigError(util::fmt("flow references unknown %s %s",
				kind.to_string(), name.c_str()));
		}
		return id;
	}
}

unsigned nocgen::derive_width(double bandwidth, double frequency)
{
	if (bandwidth <= 0)
		throw ConfigError(util::fmt("bandwidth must be positive, got %g", bandwidth));

	if (frequency <= 0)
		throw ConfigError(util::fmt("frequency must be positive, got %g", frequency));

	// GB/s * 8000 / MHz = bits per cycle
	double bits = bandwidth * 8000.0 / frequency;

	unsigned result = legal_width_for(bits);
	if (result == 0)
	{
		throw ConfigError(util::fmt("%g GB/s at %g MHz needs %.0f bits, more than %u",
			bandwidth, frequency, std::ceil(bits), MAX_WIDTH));
	}

	return result;
}

std::string SynthesisReport::to_string() const
{
	std::string result = summary.to_string();
	result += util::fmt("; crossbar %u bits, %u ports", crossbar_width, crossbar_ports);
	result += util::fmt("; bandwidth required %g GB/s of %g GB/s", required_bandwidth,
		capacity_bandwidth);
	return result;
}

GeneratedTopology nocgen::generate(const Requirements& req, const GeneratorOptions& opts)
{
	check_options(opts);
	check_requirements(req);

	GeneratedTopology result;
	Graph& g = result.graph;
	SynthesisReport& report = result.report;

	g.set_network(req.network);

	for (auto& d : req.clock_domains)
		g.add_clock_domain(d);

	// Make sure the two generated domains exist
	for (auto& name : { opts.fast_domain, opts.slow_domain })
	{
		if (g.get_clock_domain(name))
			continue;

		if (!req.clock_domains.empty())
		{
			log::warn("clock domain %s not declared, using %g MHz", name.c_str(),
				opts.default_frequency);
		}

		g.add_clock_domain({name, opts.default_frequency});
	}

	// Endpoint nodes
	NodeList init_ids;
	NodeList targ_ids;

	for (auto& decl : req.initiators)
	{
		Initiator attrs;
		attrs.avg_throughput = decl.avg_throughput;
		attrs.max_throughput = decl.max_throughput;
		attrs.latency_requirement = decl.latency_requirement;
		attrs.priority = decl.priority;
		attrs.traffic_pattern = decl.traffic_pattern;

		init_ids.push_back(g.add_node(decl.name, attrs));
	}

	for (auto& decl : req.targets)
	{
		Target attrs;
		attrs.max_bandwidth = decl.max_bandwidth;
		attrs.latency = decl.latency;
		attrs.size = decl.size;

		targ_ids.push_back(g.add_node(decl.name, attrs));
	}

	// One NIU per endpoint. Width and domain come from the endpoint's peak bandwidth.
	auto make_niu = [&](NodeID endpoint, double bw)
	{
		NIU attrs;
		attrs.clock_domain = bw >= opts.fast_bw_threshold ? opts.fast_domain : opts.slow_domain;
		attrs.width = derive_width(bw, g.frequency(attrs.clock_domain, opts.default_frequency));

		std::string name = g.node(endpoint).name + "_NIU";
		if (g.find_node(name) != INVALID_NODE)
			throw ConfigError("generated NIU name " + name + " collides with an existing node");

		report.widths[name] = attrs.width;
		log::debug("%s: %u bits in domain %s", name.c_str(), attrs.width, attrs.clock_domain.c_str());

		return g.add_node(name, attrs);
	};

	NodeList init_nius;
	NodeList targ_nius;

	for (unsigned i = 0; i < init_ids.size(); i++)
		init_nius.push_back(make_niu(init_ids[i], req.initiators[i].max_throughput));

	for (unsigned i = 0; i < targ_ids.size(); i++)
		targ_nius.push_back(make_niu(targ_ids[i], req.targets[i].max_bandwidth));

	// The crossbar. It runs in the fast domain at the widest NIU width.
	if (g.find_node(opts.crossbar_name) != INVALID_NODE)
		throw ConfigError("crossbar name " + opts.crossbar_name + " collides with an endpoint");

	Router xbar;
	xbar.clock_domain = opts.fast_domain;
	xbar.num_ports = (unsigned)(init_nius.size() + targ_nius.size());
	for (auto& w : report.widths)
		xbar.width = std::max(xbar.width, w.second);

	NodeID xbar_id = g.add_node(opts.crossbar_name, xbar);

	// Edges
	for (unsigned i = 0; i < init_ids.size(); i++)
	{
		unsigned w = g.node(init_nius[i]).as<NIU>().width;
		g.add_edge(Edge(init_ids[i], init_nius[i], w, opts.initiator_niu_latency));
		g.add_edge(Edge(init_nius[i], xbar_id, w, opts.niu_crossbar_latency));
	}

	for (unsigned i = 0; i < targ_ids.size(); i++)
	{
		unsigned w = g.node(targ_nius[i]).as<NIU>().width;
		g.add_edge(Edge(xbar_id, targ_nius[i], xbar.width, opts.crossbar_niu_latency));
		g.add_edge(Edge(targ_nius[i], targ_ids[i], w,
			req.targets[i].latency / opts.target_latency_divisor));
	}

	// Flows, by node id
	for (auto& decl : req.flows)
	{
		TrafficFlow f;
		f.src = resolve(g, decl.src, NodeKind::INITIATOR);
		f.dst = resolve(g, decl.dst, NodeKind::TARGET);
		f.bandwidth = decl.bandwidth;
		f.max_latency = decl.max_latency;
		f.priority = decl.priority;

		result.flows.push_back(f);
		report.required_bandwidth += f.bandwidth;
	}

	for (auto& t : req.targets)
		report.capacity_bandwidth += t.max_bandwidth;

	report.summary = summarize(g);
	report.crossbar_width = xbar.width;
	report.crossbar_ports = xbar.num_ports;
	report.widths[opts.crossbar_name] = xbar.width;

	log::info("generated %s", report.to_string().c_str());

	return result;
}
