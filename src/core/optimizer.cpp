#include "pch.h"
#include "nocgen/optimizer.h"
#include "nocgen/converter.h"
#include "nocgen/generator.h"
#include "nocgen/validator.h"
#include "nocgen/graph_algo.h"

using namespace nocgen;
using namespace nocgen::impl;

namespace
{
	// Per-implementation scores: relative throughput, and area in units of one
	// crossbar-port share
	double throughput_score(Implementation impl)
	{
		switch (impl)
		{
		case Implementation::DIRECT: return 1.0;
		case Implementation::CROSSBAR: return 0.7;
		case Implementation::ARBITER: return 0.5;
		}
		return 0;
	}

	double area_score(Implementation impl)
	{
		switch (impl)
		{
		case Implementation::DIRECT: return 100.0;
		case Implementation::CROSSBAR: return 5.0;
		case Implementation::ARBITER: return 2.0;
		}
		return 0;
	}

	// The NIU an endpoint attaches through
	NodeID niu_of(const Graph& g, NodeID endpoint)
	{
		Direction dir = g.node(endpoint).is<Initiator>() ? Direction::OUT : Direction::IN;
		for (NodeID n : g.neighbors(endpoint, dir))
		{
			if (g.node(n).is<NIU>())
				return n;
		}
		return INVALID_NODE;
	}

	// Follows converters downstream from 'cur' to the node that feeds the crossbar
	NodeID ingress_tail(const Graph& g, NodeID cur, NodeID xbar)
	{
		if (g.has_edge(cur, xbar))
			return cur;

		for (NodeID n : g.neighbors(cur, Direction::OUT))
		{
			if (!is_converter(g.node(n)))
				continue;

			NodeID result = ingress_tail(g, n, xbar);
			if (result != INVALID_NODE)
				return result;
		}

		return INVALID_NODE;
	}

	// Follows converters upstream from 'cur' to the node the crossbar feeds
	NodeID egress_head(const Graph& g, NodeID cur, NodeID xbar)
	{
		if (g.has_edge(xbar, cur))
			return cur;

		for (NodeID n : g.neighbors(cur, Direction::IN))
		{
			if (!is_converter(g.node(n)))
				continue;

			NodeID result = egress_head(g, n, xbar);
			if (result != INVALID_NODE)
				return result;
		}

		return INVALID_NODE;
	}

	// Converters left without an input or an output carry nothing
	unsigned prune_dangling(Graph& g)
	{
		unsigned result = 0;
		bool changed = true;

		while (changed)
		{
			changed = false;
			for (NodeID id : g.nodes())
			{
				if (!is_converter(g.node(id)))
					continue;

				if (g.degree(id, Direction::IN) == 0 || g.degree(id, Direction::OUT) == 0)
				{
					log::debug("removing dangling converter %s", g.node(id).name.c_str());
					g.remove_node(id);
					result++;
					changed = true;
				}
			}
		}

		return result;
	}

	// Holds context while restructuring
	class Optimizer
	{
	public:
		Optimizer(const Graph& g, const FlowList& flows, const FlowOptions& opts)
			: m_cur(g), m_flows(flows), m_fopts(opts), m_opts(opts.optimizer)
		{
			m_xbar = m_cur.find_node(m_opts.crossbar_name);
			if (m_xbar == INVALID_NODE || !m_cur.node(m_xbar).is<Router>())
			{
				throw ConfigError("no crossbar router named " + m_opts.crossbar_name +
					" to optimize around");
			}

			m_pairs = algo::reachable_pairs(m_cur);
			m_errors = (unsigned)validate(m_cur, m_flows, m_fopts).errors.size();
		}

		void add_dedicated_routers()
		{
			for (auto& f : m_flows)
			{
				if (classify(f, m_opts) != FlowClass::HIGH)
					continue;

				if (!m_cur.has_node(f.src) || !m_cur.has_node(f.dst))
					continue;

				std::string name = m_cur.node(f.src).name + "_" + m_cur.node(f.dst).name + "_Router";
				if (m_cur.find_node(name) != INVALID_NODE)
					continue;

				Graph g = m_cur;
				if (add_dedicated_router(g, f, name))
				{
					if (commit(g, "dedicated router " + name))
						m_report.dedicated_routers++;
				}
			}
		}

		void add_arbiters()
		{
			// Initiators with medium flows keep their crossbar connection
			std::set<NodeID> pinned;
			for (auto& f : m_flows)
			{
				if (classify(f, m_opts) == FlowClass::MEDIUM)
					pinned.insert(f.src);
			}

			for (NodeID targ : m_cur.find(NodeKind::TARGET))
			{
				// Candidates in flow declaration order. The sort below is stable,
				// so equal priorities keep that order.
				std::vector<std::pair<unsigned, NodeID>> cands;
				std::set<NodeID> seen;

				for (auto& f : m_flows)
				{
					if (f.dst != targ || classify(f, m_opts) != FlowClass::LOW)
						continue;
					if (pinned.count(f.src) || !seen.insert(f.src).second)
						continue;
					if (!m_cur.has_node(f.src))
						continue;

					NodeID niu = niu_of(m_cur, f.src);
					if (niu == INVALID_NODE || ingress_tail(m_cur, niu, m_xbar) == INVALID_NODE)
						continue;

					cands.emplace_back(f.priority, f.src);
				}

				std::stable_sort(cands.begin(), cands.end(),
					[](const std::pair<unsigned, NodeID>& a, const std::pair<unsigned, NodeID>& b)
				{
					return a.first < b.first;
				});

				unsigned count = 0;
				for (unsigned i = 0; i < cands.size(); i += m_opts.max_arbiter_inputs)
				{
					unsigned end = std::min((unsigned)cands.size(), i + m_opts.max_arbiter_inputs);
					if (end - i < 2)
						break;

					NodeList group;
					for (unsigned j = i; j < end; j++)
						group.push_back(cands[j].second);

					Graph g = m_cur;
					std::string name = add_arbiter(g, targ, group, count);
					if (commit(g, "arbiter " + name))
					{
						m_report.arbiters++;
						count++;
					}
				}
			}
		}

		void finish()
		{
			if (!m_report.changed())
				return;

			auto& xbar = m_cur.node_mut(m_xbar).as<Router>();
			xbar.num_ports = m_cur.degree(m_xbar, Direction::BOTH);
			log::debug("crossbar now has %u ports", xbar.num_ports);
		}

		Graph& graph() { return m_cur; }
		OptimizationReport& report() { return m_report; }

	protected:
		// Removes crossbar edge (src,dst) unless doing so disconnects an
		// initiator from a target it could reach before
		bool try_remove_xbar_edge(Graph& g, NodeID src, NodeID dst)
		{
			if (!g.has_edge(src, dst))
				return false;

			Edge saved = g.edge(src, dst);
			g.remove_edge(src, dst);

			auto pairs = algo::reachable_pairs(g);
			if (!std::includes(pairs.begin(), pairs.end(), m_pairs.begin(), m_pairs.end()))
			{
				g.add_edge(saved);
				return false;
			}

			m_step_removed++;
			return true;
		}

		bool add_dedicated_router(Graph& g, const TrafficFlow& f, const std::string& name)
		{
			NodeID ni = niu_of(g, f.src);
			NodeID nt = niu_of(g, f.dst);
			if (ni == INVALID_NODE || nt == INVALID_NODE)
			{
				log::debug("flow %s -> %s has no NIUs, no dedicated router", g.node(f.src).name.c_str(),
					g.node(f.dst).name.c_str());
				return false;
			}

			const NIU& src_niu = g.node(ni).as<NIU>();

			Router r;
			r.clock_domain = src_niu.clock_domain;
			r.width = derive_width_for(g, f.bandwidth, r.clock_domain);
			r.num_ports = 2;

			NodeID rid = g.add_node(name, r);
			g.add_edge(Edge(ni, rid, src_niu.width, m_opts.dedicated_latency));
			g.add_edge(Edge(rid, nt, r.width, m_opts.dedicated_latency));

			NodeID tail = ingress_tail(g, ni, m_xbar);
			if (tail != INVALID_NODE)
				try_remove_xbar_edge(g, tail, m_xbar);

			NodeID head = egress_head(g, nt, m_xbar);
			if (head != INVALID_NODE)
				try_remove_xbar_edge(g, m_xbar, head);

			prune_dangling(g);
			return true;
		}

		std::string add_arbiter(Graph& g, NodeID targ, const NodeList& group, unsigned index)
		{
			const Router& xbar = g.node(m_xbar).as<Router>();

			Arbiter a;
			a.num_inputs = (unsigned)group.size();
			a.width = xbar.width;
			a.policy = ArbPolicy::PRIORITY;

			std::string base = g.node(targ).name + "_Arbiter";
			std::string name;
			do
			{
				name = base + std::to_string(index++);
			} while (g.find_node(name) != INVALID_NODE);

			NodeID aid = g.add_node(name, a);

			for (NodeID init : group)
			{
				NodeID tail = ingress_tail(g, niu_of(g, init), m_xbar);
				Edge saved = g.edge(tail, m_xbar);

				g.remove_edge(tail, m_xbar);
				g.add_edge(Edge(tail, aid, out_width(g.node(tail)), saved.latency));
				m_step_removed++;
			}

			g.add_edge(Edge(aid, m_xbar, a.width, m_opts.arbiter_latency));
			m_step_added++;

			return name;
		}

		unsigned derive_width_for(const Graph& g, double bw, const std::string& domain)
		{
			return derive_width(bw, g.frequency(domain, m_opts.default_frequency));
		}

		// Closes any new mismatches, then keeps the step only if it doesn't add
		// validation errors or lose reachability
		bool commit(Graph& g, const std::string& what)
		{
			unsigned removed = m_step_removed;
			unsigned added = m_step_added;
			m_step_removed = 0;
			m_step_added = 0;

			if (m_fopts.auto_insert_converters)
				g = insert_converters(g).graph;

			unsigned errors = (unsigned)validate(g, m_flows, m_fopts).errors.size();
			auto pairs = algo::reachable_pairs(g);

			if (errors > m_errors ||
				!std::includes(pairs.begin(), pairs.end(), m_pairs.begin(), m_pairs.end()))
			{
				log::debug("optimizer: reverted %s (%u errors, was %u)", what.c_str(), errors, m_errors);
				m_report.reverted_steps++;
				return false;
			}

			log::debug("optimizer: added %s", what.c_str());
			m_cur = g;
			m_errors = errors;
			m_report.crossbar_edges_removed += removed;
			m_report.crossbar_edges_added += added;
			return true;
		}

		Graph m_cur;
		const FlowList& m_flows;
		const FlowOptions& m_fopts;
		const OptimizerOptions& m_opts;

		NodeID m_xbar;
		std::set<NodePair> m_pairs;
		unsigned m_errors;

		unsigned m_step_removed = 0;
		unsigned m_step_added = 0;

		OptimizationReport m_report;
	};
}

bool OptimizationReport::changed() const
{
	return dedicated_routers > 0 || arbiters > 0;
}

std::string OptimizationReport::to_string() const
{
	std::string result = util::fmt("%u dedicated routers, %u arbiters, crossbar edges -%u +%u",
		dedicated_routers, arbiters, crossbar_edges_removed, crossbar_edges_added);

	for (auto& p : distribution)
		result += util::fmt(", %s: %u", p.first.to_string(), p.second);

	result += util::fmt("; area %g, avg latency %.1f, crossbar bandwidth %g -> %g GB/s",
		area_cost, avg_latency, crossbar_bw_before, crossbar_bw_after);

	return result;
}

FlowClass nocgen::classify(const TrafficFlow& flow, const OptimizerOptions& opts)
{
	if (flow.bandwidth >= opts.high_bw_threshold)
		return FlowClass::HIGH;
	else if (flow.bandwidth < opts.low_bw_threshold)
		return FlowClass::LOW;
	else
		return FlowClass::MEDIUM;
}

double nocgen::crossbar_bandwidth(const Graph& g, const FlowList& flows,
	const std::string& crossbar_name)
{
	NodeID xbar = g.find_node(crossbar_name);
	if (xbar == INVALID_NODE)
		return 0;

	double result = 0;
	for (auto& f : flows)
	{
		NodeList path;
		if (algo::shortest_path(g, f.src, f.dst, &path, nullptr) && util::exists(path, xbar))
			result += f.bandwidth;
	}

	return result;
}

std::vector<FlowPlan> nocgen::plan_flows(const Graph& g, const FlowList& flows,
	const OptimizerOptions& opts)
{
	check_options(opts);

	// Weights are relative, so costs stay in [0, 1]
	const CostWeights& w = opts.weights;
	double total = w.throughput + w.latency + w.area;

	std::vector<FlowPlan> result;
	NodeID xbar = g.find_node(opts.crossbar_name);

	for (auto& f : flows)
	{
		FlowPlan plan;
		plan.flow = f;
		plan.cls = classify(f, opts);
		plan.impl = Implementation::CROSSBAR;

		NodeList path;
		plan.routed = algo::shortest_path(g, f.src, f.dst, &path, &plan.latency);

		if (plan.routed)
		{
			bool via_xbar = xbar != INVALID_NODE && util::exists(path, xbar);
			bool via_arb = std::any_of(path.begin(), path.end(), [&](NodeID id)
			{
				return g.node(id).is<Arbiter>();
			});

			if (!via_xbar)
				plan.impl = Implementation::DIRECT;
			else if (via_arb)
				plan.impl = Implementation::ARBITER;
		}

		// Latency penalty is relative to the tightest applicable bound
		unsigned bound = f.max_latency;
		if (bound == 0 && g.has_node(f.src) && g.node(f.src).is<Initiator>())
			bound = g.node(f.src).as<Initiator>().latency_requirement;

		double lat_penalty = 0;
		if (!plan.routed)
			lat_penalty = 1.0;
		else if (bound > 0)
			lat_penalty = std::min(1.0, (double)plan.latency / bound);

		plan.cost = (w.throughput * (1.0 - throughput_score(plan.impl)) +
			w.latency * lat_penalty +
			w.area * area_score(plan.impl) / 100.0) / total;

		result.push_back(plan);
	}

	return result;
}

OptimizationResult nocgen::optimize(const Graph& g, const FlowList& flows, OptimizeFor goal,
	const FlowOptions& opts)
{
	check_options(opts.optimizer);

	Optimizer opt(g, flows, opts);

	if (goal != OptimizeFor::NONE)
	{
		opt.add_dedicated_routers();

		// Arbitration adds a hop, so it's only done when optimizing for bandwidth
		if (goal == OptimizeFor::BANDWIDTH)
			opt.add_arbiters();
	}

	opt.finish();

	OptimizationResult result;
	result.graph = opt.graph();
	result.report = opt.report();

	auto& report = result.report;
	report.crossbar_bw_before = crossbar_bandwidth(g, flows, opts.optimizer.crossbar_name);
	report.crossbar_bw_after = crossbar_bandwidth(result.graph, flows, opts.optimizer.crossbar_name);
	report.plans = plan_flows(result.graph, flows, opts.optimizer);

	unsigned routed = 0;
	for (auto& plan : report.plans)
	{
		report.distribution[plan.impl]++;
		report.area_cost += area_score(plan.impl);

		if (plan.impl != Implementation::DIRECT)
			report.crossbar_flows++;

		if (plan.routed)
		{
			report.avg_latency += plan.latency;
			routed++;
		}
	}

	if (routed > 0)
		report.avg_latency /= routed;

	log::info("optimized for %s: %s", goal.to_string(), report.to_string().c_str());

	return result;
}
