#include "pch.h"
#include "nocgen/routing.h"
#include "nocgen/graph_algo.h"

using namespace nocgen;
using namespace nocgen::impl;

RoutingTable::RoutingTable(const Graph& g)
{
	for (NodeID id : g.nodes())
		m_ports[id] = g.neighbors(id, Direction::OUT);

	for (NodeID dst : g.nodes())
	{
		// Latency and hop distance of every node to 'dst'
		auto dist = algo::distances_to(g, dst);

		for (auto& p : dist)
		{
			NodeID src = p.first;

			if (src == dst)
			{
				m_entries[NodePair(src, dst)] = LOCAL_PORT;
				continue;
			}

			// Same hop the realized path takes
			NodeID next = algo::next_hop(g, src, dist);
			auto& outs = m_ports[src];
			auto it = std::find(outs.begin(), outs.end(), next);
			if (it != outs.end())
				m_entries[NodePair(src, dst)] = (unsigned)(it - outs.begin()) + 1;
		}
	}

	log::info("routing table: %u entries over %u nodes", size(), g.num_nodes());
}

bool RoutingTable::lookup(NodeID src, NodeID dst, unsigned* port) const
{
	auto it = m_entries.find(NodePair(src, dst));
	if (it == m_entries.end())
		return false;

	if (port)
		*port = it->second;
	return true;
}

unsigned RoutingTable::port(NodeID src, NodeID dst) const
{
	unsigned result;
	if (!lookup(src, dst, &result))
		throw NoRouteError(util::fmt("no route from node %u to node %u", src, dst));

	return result;
}

NodeID RoutingTable::neighbor(NodeID node, unsigned port) const
{
	auto it = m_ports.find(node);
	if (it == m_ports.end())
		return INVALID_NODE;

	if (port == LOCAL_PORT)
		return node;

	if (port > it->second.size())
		return INVALID_NODE;

	return it->second[port - 1];
}

const RoutingTable::Entries& RoutingTable::entries() const
{
	return m_entries;
}

unsigned RoutingTable::size() const
{
	return (unsigned)m_entries.size();
}
