#pragma once

#include <map>
#include "nocgen/graph.h"

namespace nocgen
{
	// Output port 0 is the node's local port. Output neighbour k (0-based, in
	// ascending id order) is port k+1.
	const unsigned LOCAL_PORT = 0;

	//
	// Next-hop table over a topology. Holds an entry for every ordered pair
	// (src, dst) with a directed path from src to dst, and nothing else: a
	// missing entry means there is no route.
	//
	class RoutingTable
	{
	public:
		using Entries = std::map<NodePair, unsigned>;

		RoutingTable() = default;

		// Builds the table from a reverse minimum-latency search to every node.
		// Each entry is the first hop of algo::shortest_path(), so packets follow
		// the same path the validator and optimizer measure.
		explicit RoutingTable(const Graph& g);

		// Returns false if there is no route
		bool lookup(NodeID src, NodeID dst, unsigned* port) const;

		// Throws NoRouteError if there is no route
		unsigned port(NodeID src, NodeID dst) const;

		// The node reached through 'port' of 'node', or INVALID_NODE
		NodeID neighbor(NodeID node, unsigned port) const;

		const Entries& entries() const;
		unsigned size() const;

	protected:
		Entries m_entries;
		std::map<NodeID, NodeList> m_ports;
	};
}
