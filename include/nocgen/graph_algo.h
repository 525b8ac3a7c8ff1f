#pragma once

#include <map>
#include <set>
#include "nocgen/graph.h"

namespace nocgen
{
namespace algo
{
	// Distance from a node to a fixed destination: path latency first, then
	// hop count. A path's latency is the sum of its edge latencies plus the
	// intrinsic latency of every node on it, both ends included.
	using Distance = std::pair<unsigned, unsigned>;
	using DistanceMap = std::map<NodeID, Distance>;

	// Distance to 'dest' from every node that has a directed path to it
	DistanceMap distances_to(const Graph& g, NodeID dest);

	// The hop 'cur' takes toward the destination 'dist' was computed for: the
	// lowest-id out-neighbour lying on a minimum-distance path. Returns
	// INVALID_NODE at the destination itself or when there is no path.
	NodeID next_hop(const Graph& g, NodeID cur, const DistanceMap& dist);

	// The realized path from 'src' to 'dest': next_hop() followed from 'src'.
	// This is the path packets take through a RoutingTable, so validation,
	// bandwidth accounting and routing all agree on it. Returns false if there
	// is no path. The path's nodes (src and dest included) go in path_out, its
	// latency in latency_out, if not null.
	bool shortest_path(const Graph& g, NodeID src, NodeID dest,
		NodeList* path_out, unsigned* latency_out);

	// Latency of an explicit path, same metric as shortest_path
	unsigned path_latency(const Graph& g, const NodeList& path);

	// Hop distance from 'root' to every node reachable from it. With Direction::IN
	// edges are followed backwards, giving the distance of every node TO 'root'.
	std::map<NodeID, unsigned> bfs_distances(const Graph& g, NodeID root, Direction dir);

	// Every node reachable from 'src' over directed edges, 'src' included
	std::set<NodeID> reachable(const Graph& g, NodeID src);

	// (Initiator, Target) pairs connected by a directed path
	std::set<NodePair> reachable_pairs(const Graph& g);

	// Number of weakly connected components
	unsigned connected_components(const Graph& g);
}
}
