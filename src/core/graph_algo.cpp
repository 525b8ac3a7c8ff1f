#include "pch.h"
#include "nocgen/graph_algo.h"

using namespace nocgen;

algo::DistanceMap algo::distances_to(const Graph& g, NodeID dest)
{
	DistanceMap result;
	if (!g.has_node(dest))
		return result;

	// Dijkstra over reversed edges. Settled nodes are marked so stale queue
	// entries can be skipped.
	std::set<NodeID> done;
	std::set<std::pair<Distance, NodeID>> to_visit;

	result[dest] = Distance(node_latency(g.node(dest)), 0);
	to_visit.insert({ result[dest], dest });

	while (!to_visit.empty())
	{
		NodeID cur = to_visit.begin()->second;
		Distance cur_dist = to_visit.begin()->first;
		to_visit.erase(to_visit.begin());

		if (!done.insert(cur).second)
			continue;

		for (NodeID prev : g.neighbors(cur, Direction::IN))
		{
			if (done.count(prev))
				continue;

			// Cost of going from 'prev' to 'dest' through 'cur'
			Distance new_dist(cur_dist.first + g.edge(prev, cur).latency +
				node_latency(g.node(prev)), cur_dist.second + 1);

			auto it = result.find(prev);
			if (it == result.end() || new_dist < it->second)
			{
				result[prev] = new_dist;
				to_visit.insert({ new_dist, prev });
			}
		}
	}

	return result;
}

NodeID algo::next_hop(const Graph& g, NodeID cur, const DistanceMap& dist)
{
	auto cur_it = dist.find(cur);
	if (cur_it == dist.end() || cur_it->second.second == 0)
		return INVALID_NODE;

	unsigned own = node_latency(g.node(cur));

	// Neighbours come back in ascending id order. Hop counts strictly drop
	// along the way, so following next hops cannot loop.
	for (NodeID neigh : g.neighbors(cur, Direction::OUT))
	{
		auto it = dist.find(neigh);
		if (it == dist.end())
			continue;

		Distance via(own + g.edge(cur, neigh).latency + it->second.first, it->second.second + 1);
		if (via == cur_it->second)
			return neigh;
	}

	return INVALID_NODE;
}

bool algo::shortest_path(const Graph& g, NodeID src, NodeID dest,
	NodeList* path_out, unsigned* latency_out)
{
	// Initialize outputs
	if (path_out)
		path_out->clear();

	if (!g.has_node(src) || !g.has_node(dest))
		return false;

	auto dist = distances_to(g, dest);
	auto it = dist.find(src);
	if (it == dist.end())
		return false;

	if (latency_out)
		*latency_out = it->second.first;

	if (path_out)
	{
		for (NodeID cur = src; cur != INVALID_NODE; cur = next_hop(g, cur, dist))
			path_out->push_back(cur);
	}

	return true;
}

unsigned algo::path_latency(const Graph& g, const NodeList& path)
{
	unsigned result = 0;

	for (unsigned i = 0; i < path.size(); i++)
	{
		result += node_latency(g.node(path[i]));
		if (i > 0)
			result += g.edge(path[i-1], path[i]).latency;
	}

	return result;
}

std::map<NodeID, unsigned> algo::bfs_distances(const Graph& g, NodeID root, Direction dir)
{
	std::map<NodeID, unsigned> result;
	if (!g.has_node(root))
		return result;

	std::deque<NodeID> frontier{root};
	result[root] = 0;

	while (!frontier.empty())
	{
		NodeID cur = frontier.front();
		frontier.pop_front();

		for (NodeID neigh : g.neighbors(cur, dir))
		{
			if (result.count(neigh))
				continue;

			result[neigh] = result[cur] + 1;
			frontier.push_back(neigh);
		}
	}

	return result;
}

std::set<NodeID> algo::reachable(const Graph& g, NodeID src)
{
	std::set<NodeID> result;
	for (auto& p : bfs_distances(g, src, Direction::OUT))
		result.insert(p.first);
	return result;
}

std::set<NodePair> algo::reachable_pairs(const Graph& g)
{
	std::set<NodePair> result;
	for (NodeID init : g.find(NodeKind::INITIATOR))
	{
		for (NodeID v : reachable(g, init))
		{
			if (g.node(v).is<Target>())
				result.emplace(init, v);
		}
	}
	return result;
}

unsigned algo::connected_components(const Graph& g)
{
	std::set<NodeID> visited;
	unsigned result = 0;

	for (NodeID id : g.nodes())
	{
		if (visited.count(id))
			continue;

		// Flood-fill this component, ignoring edge direction
		result++;
		for (auto& p : bfs_distances(g, id, Direction::BOTH))
			visited.insert(p.first);
	}

	return result;
}
