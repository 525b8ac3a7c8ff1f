#include <algorithm>
#include "test_util.h"
#include "nocgen/routing.h"
#include "nocgen/converter.h"
#include "nocgen/optimizer.h"
#include "nocgen/graph_algo.h"

using namespace nocgen;
using namespace nocgen::test;

namespace
{
	// 0 -> {1, 2} -> 3 -> 4
	Graph make_diamond()
	{
		std::vector<Node> nodes;
		for (unsigned i = 0; i < 5; i++)
			nodes.push_back(Node(i, "r" + std::to_string(i), router(32, 4)));

		std::vector<Edge> edges =
		{
			Edge(0, 1, 32, 1),
			Edge(0, 2, 32, 1),
			Edge(1, 3, 32, 1),
			Edge(2, 3, 32, 1),
			Edge(3, 4, 32, 1)
		};

		return Graph(nodes, edges);
	}

	// Follows ports from src to dst and returns the nodes visited, both ends included
	NodeList walk(const Graph& g, const RoutingTable& rt, NodeID src, NodeID dst)
	{
		NodeList result{src};
		NodeID cur = src;

		while (cur != dst)
		{
			unsigned port = rt.port(cur, dst);
			EXPECT_NE(LOCAL_PORT, port);

			NodeID next = rt.neighbor(cur, port);
			EXPECT_TRUE(g.has_edge(cur, next));

			cur = next;
			result.push_back(cur);
			if (result.size() > g.num_nodes())
			{
				ADD_FAILURE() << "routing loop from " << src << " to " << dst;
				break;
			}
		}

		return result;
	}

	// Every route is a minimum-latency path, and the same one shortest_path reports
	void expect_shortest_routes(const Graph& g, const RoutingTable& rt)
	{
		for (auto& entry : rt.entries())
		{
			NodeID src = entry.first.first;
			NodeID dst = entry.first.second;

			NodeList path;
			unsigned latency;
			ASSERT_TRUE(algo::shortest_path(g, src, dst, &path, &latency));

			NodeList walked = walk(g, rt, src, dst);
			EXPECT_EQ(path, walked);
			EXPECT_EQ(latency, algo::path_latency(g, walked));
			EXPECT_EQ(algo::distances_to(g, dst).at(src).second, walked.size() - 1);
		}
	}

	bool passes(const Graph& g, const NodeList& path, const std::string& name)
	{
		NodeID id = g.find_node(name);
		return id != INVALID_NODE && std::find(path.begin(), path.end(), id) != path.end();
	}
}

TEST(Routing, Diamond)
{
	LogCapture logs;
	Graph g = make_diamond();
	RoutingTable rt(g);

	// Both ways to 3 cost the same; the lower id wins
	EXPECT_EQ(1u, rt.port(0, 3));
	EXPECT_EQ(1u, rt.neighbor(0, rt.port(0, 3)));
	EXPECT_EQ(1u, rt.port(0, 4));
	EXPECT_EQ(2u, rt.port(0, 2));
	EXPECT_EQ(2u, rt.neighbor(0, 2));
	EXPECT_EQ(1u, rt.port(2, 3));

	// Node 0 reaches all 5, 1 and 2 reach 3 each, 3 reaches 2, 4 reaches itself
	EXPECT_EQ(14u, rt.size());

	expect_shortest_routes(g, rt);
}

TEST(Routing, SelfIsLocal)
{
	LogCapture logs;
	Graph g = make_diamond();
	RoutingTable rt(g);

	for (NodeID id : g.nodes())
	{
		EXPECT_EQ(LOCAL_PORT, rt.port(id, id));
		EXPECT_EQ(id, rt.neighbor(id, LOCAL_PORT));
	}
}

TEST(Routing, Unreachable)
{
	LogCapture logs;
	Graph g = make_diamond();
	RoutingTable rt(g);

	unsigned port = 99;
	EXPECT_FALSE(rt.lookup(4, 0, &port));
	EXPECT_EQ(99u, port);
	EXPECT_FALSE(rt.lookup(1, 2, nullptr));
	EXPECT_THROW(rt.port(4, 0), NoRouteError);

	EXPECT_EQ(INVALID_NODE, rt.neighbor(0, 3));
	EXPECT_EQ(INVALID_NODE, rt.neighbor(42, 1));
}

TEST(Routing, Empty)
{
	LogCapture logs;
	RoutingTable rt{Graph()};
	EXPECT_EQ(0u, rt.size());
	EXPECT_FALSE(rt.lookup(0, 0, nullptr));
}

TEST(Routing, OptimizedTopology)
{
	LogCapture logs;

	Requirements req;
	req.initiators = { initiator_spec("gpu", 64.0), initiator_spec("cpu", 2.0),
		initiator_spec("dsp", 1.0) };
	req.targets = { target_spec("ddr", 100.0), target_spec("sram", 10.0) };
	req.flows = { flow_spec("gpu", "ddr", 60.0), flow_spec("cpu", "sram", 2.0),
		flow_spec("dsp", "sram", 1.0) };

	auto gen = generate(req);
	Graph g = insert_converters(gen.graph).graph;
	g = optimize(g, gen.flows, OptimizeFor::BANDWIDTH).graph;

	RoutingTable rt(g);
	expect_shortest_routes(g, rt);

	// Every initiator can still reach every target
	for (auto& p : algo::reachable_pairs(g))
		EXPECT_TRUE(rt.lookup(p.first, p.second, nullptr));
	EXPECT_EQ(6u, algo::reachable_pairs(g).size());
}

TEST(Routing, PrefersLowerLatency)
{
	LogCapture logs;
	Graph g = make_diamond();

	// Going through 1 now costs more, so traffic from 0 goes through 2
	g.edge_mut(1, 3).latency = 4;
	RoutingTable rt(g);

	EXPECT_EQ(2u, rt.neighbor(0, rt.port(0, 3)));
	EXPECT_EQ(2u, rt.neighbor(0, rt.port(0, 4)));
	EXPECT_EQ(NodeList({0, 2, 3, 4}), walk(g, rt, 0, 4));

	expect_shortest_routes(g, rt);
}

TEST(Routing, FlowsTakeReportedPaths)
{
	LogCapture logs;

	// gpu -> ddr gets a dedicated router, cpu/dsp -> sram share an arbiter
	Requirements req;
	req.initiators = { initiator_spec("gpu", 64.0), initiator_spec("cpu", 2.0),
		initiator_spec("dsp", 1.0) };
	req.targets = { target_spec("ddr", 100.0), target_spec("sram", 10.0) };
	req.flows = { flow_spec("gpu", "ddr", 60.0), flow_spec("cpu", "sram", 2.0),
		flow_spec("dsp", "sram", 1.0) };

	auto gen = generate(req);
	Graph before = insert_converters(gen.graph).graph;
	auto opt = optimize(before, gen.flows, OptimizeFor::BANDWIDTH);
	const Graph& g = opt.graph;
	ASSERT_EQ(1u, opt.report.dedicated_routers);
	ASSERT_EQ(1u, opt.report.arbiters);

	RoutingTable rt(g);

	ASSERT_EQ(3u, opt.report.plans.size());
	for (auto& plan : opt.report.plans)
	{
		NodeList path;
		ASSERT_TRUE(algo::shortest_path(g, plan.flow.src, plan.flow.dst, &path, nullptr));

		NodeList walked = walk(g, rt, plan.flow.src, plan.flow.dst);
		EXPECT_EQ(path, walked);
		EXPECT_EQ(plan.latency, algo::path_latency(g, walked));

		bool via_xbar = passes(g, walked, "Crossbar");
		bool via_arb = passes(g, walked, "sram_Arbiter0");

		if (plan.cls == FlowClass::HIGH)
		{
			EXPECT_TRUE(plan.impl == Implementation::DIRECT);
			EXPECT_TRUE(passes(g, walked, "gpu_ddr_Router"));
			EXPECT_FALSE(via_xbar);
		}
		else
		{
			EXPECT_TRUE(plan.impl == Implementation::ARBITER);
			EXPECT_TRUE(via_arb);
			EXPECT_TRUE(via_xbar);
		}
	}

	// What the report counts on the crossbar is what the routes put there
	double xbar_bw = 0;
	for (auto& f : gen.flows)
	{
		if (passes(g, walk(g, rt, f.src, f.dst), "Crossbar"))
			xbar_bw += f.bandwidth;
	}
	EXPECT_DOUBLE_EQ(opt.report.crossbar_bw_after, xbar_bw);
	EXPECT_DOUBLE_EQ(3.0, xbar_bw);
}
