#pragma once

#include <map>
#include <set>
#include <vector>
#include <string>
#include "nocgen/common.h"
#include "nocgen/node.h"

namespace nocgen
{
	using NodeList = std::vector<NodeID>;
	using NodePair = std::pair<NodeID, NodeID>;

	SMART_ENUM(Direction, IN, OUT, BOTH);

	struct Edge
	{
		NodeID src = INVALID_NODE;
		NodeID dst = INVALID_NODE;
		unsigned width = 0;	// bits carried
		unsigned latency = 0;	// cycles

		Edge() = default;
		Edge(NodeID _src, NodeID _dst, unsigned _width = 0, unsigned _latency = 0)
			: src(_src), dst(_dst), width(_width), latency(_latency) { }
	};

	struct ClockDomain
	{
		std::string name;
		double frequency = 0;	// MHz
	};

	struct TrafficFlow
	{
		NodeID src = INVALID_NODE;	// Initiator
		NodeID dst = INVALID_NODE;	// Target
		double bandwidth = 0;	// GB/s, guaranteed
		unsigned max_latency = 0;	// cycles, 0 = unconstrained
		unsigned priority = 0;
	};

	using FlowList = std::vector<TrafficFlow>;

	//
	// Topology graph. Nodes are addressed by stable integer ids. Edges are
	// directed and keyed by their (src, dst) pair, so there is at most one edge
	// per ordered pair. Copying a Graph produces an independent snapshot, which
	// is what every transform pass works on.
	//
	class Graph
	{
	public:
		Graph() = default;

		// Throws StructuralError on duplicate node ids, edges that reference
		// missing nodes, self-loops and multi-edges.
		Graph(const std::vector<Node>& nodes, const std::vector<Edge>& edges,
			const std::vector<ClockDomain>& domains = {});

		PROP_GET_SET(network, const std::string&, m_network);

		// Nodes
		NodeID add_node(const std::string& name, const NodeAttrs& attrs);
		void add_node(const Node& node);
		void remove_node(NodeID id);
		bool has_node(NodeID id) const;
		const Node& node(NodeID id) const;
		Node& node_mut(NodeID id);
		NodeID find_node(const std::string& name) const;
		NodeList nodes() const;
		NodeList find(NodeKind kind) const;
		unsigned num_nodes() const;

		// Edges
		void add_edge(const Edge& edge);
		void remove_edge(NodeID src, NodeID dst);
		bool has_edge(NodeID src, NodeID dst) const;
		const Edge& edge(NodeID src, NodeID dst) const;
		Edge& edge_mut(NodeID src, NodeID dst);
		std::vector<Edge> edges() const;
		unsigned num_edges() const;

		// Adjacency, sorted by node id
		NodeList neighbors(NodeID id, Direction dir) const;
		unsigned degree(NodeID id, Direction dir) const;

		// Clock domains, referenced by name from nodes
		void add_clock_domain(const ClockDomain& domain);
		const ClockDomain* get_clock_domain(const std::string& name) const;
		const std::vector<ClockDomain>& clock_domains() const;
		double frequency(const std::string& domain, double fallback) const;

	protected:
		void check_node(NodeID id) const;

		std::string m_network;
		std::map<NodeID, Node> m_nodes;
		std::map<NodePair, Edge> m_edges;
		std::map<NodeID, std::set<NodeID>> m_out;
		std::map<NodeID, std::set<NodeID>> m_in;
		std::vector<ClockDomain> m_domains;
	};

	// Node/edge counts for reports
	struct GraphSummary
	{
		unsigned nodes = 0;
		unsigned edges = 0;
		std::map<NodeKind, unsigned> by_kind;

		unsigned count(NodeKind kind) const;
		std::string to_string() const;
	};

	GraphSummary summarize(const Graph&);
}
