#include "pch.h"
#include "nocgen/graph.h"

using namespace nocgen;
using namespace nocgen::impl;

namespace
{
	const std::set<NodeID> s_empty;

	const std::set<NodeID>& adj(const std::map<NodeID, std::set<NodeID>>& m, NodeID id)
	{
		auto it = m.find(id);
		return it == m.end() ? s_empty : it->second;
	}
}

Graph::Graph(const std::vector<Node>& nodes, const std::vector<Edge>& edges,
	const std::vector<ClockDomain>& domains)
{
	for (auto& d : domains)
		add_clock_domain(d);

	for (auto& n : nodes)
		add_node(n);

	for (auto& e : edges)
		add_edge(e);
}

void Graph::check_node(NodeID id) const
{
	if (!has_node(id))
		throw StructuralError(util::fmt("reference to nonexistent node id %u", id));
}

NodeID Graph::add_node(const std::string& name, const NodeAttrs& attrs)
{
	NodeID id = m_nodes.empty() ? 0 : m_nodes.rbegin()->first + 1;
	add_node(Node(id, name, attrs));
	return id;
}

void Graph::add_node(const Node& node)
{
	if (node.id == INVALID_NODE)
		throw StructuralError("node " + node.name + " has no id");

	if (has_node(node.id))
	{
		throw StructuralError(util::fmt("duplicate node id %u (%s, %s)", node.id,
			m_nodes.at(node.id).name.c_str(), node.name.c_str()));
	}

	m_nodes[node.id] = node;
}

void Graph::remove_node(NodeID id)
{
	check_node(id);

	// Copies, since remove_edge modifies the adjacency sets
	auto outs = adj(m_out, id);
	auto ins = adj(m_in, id);

	for (NodeID dst : outs)
		remove_edge(id, dst);
	for (NodeID src : ins)
		remove_edge(src, id);

	m_out.erase(id);
	m_in.erase(id);
	m_nodes.erase(id);
}

bool Graph::has_node(NodeID id) const
{
	return m_nodes.count(id) != 0;
}

const Node& Graph::node(NodeID id) const
{
	check_node(id);
	return m_nodes.at(id);
}

Node& Graph::node_mut(NodeID id)
{
	check_node(id);
	return m_nodes.at(id);
}

NodeID Graph::find_node(const std::string& name) const
{
	for (auto& p : m_nodes)
	{
		if (p.second.name == name)
			return p.first;
	}
	return INVALID_NODE;
}

NodeList Graph::nodes() const
{
	return util::keys<NodeList>(m_nodes);
}

NodeList Graph::find(NodeKind kind) const
{
	NodeList result;
	for (auto& p : m_nodes)
	{
		if (p.second.kind() == kind)
			result.push_back(p.first);
	}
	return result;
}

unsigned Graph::num_nodes() const
{
	return (unsigned)m_nodes.size();
}

void Graph::add_edge(const Edge& edge)
{
	check_node(edge.src);
	check_node(edge.dst);

	if (edge.src == edge.dst)
	{
		throw StructuralError("self-loop on node " + m_nodes.at(edge.src).name);
	}

	if (has_edge(edge.src, edge.dst))
	{
		throw StructuralError("duplicate edge " + m_nodes.at(edge.src).name +
			" -> " + m_nodes.at(edge.dst).name);
	}

	m_edges[NodePair(edge.src, edge.dst)] = edge;
	m_out[edge.src].insert(edge.dst);
	m_in[edge.dst].insert(edge.src);
}

void Graph::remove_edge(NodeID src, NodeID dst)
{
	auto it = m_edges.find(NodePair(src, dst));
	if (it == m_edges.end())
		throw StructuralError(util::fmt("no edge %u -> %u to remove", src, dst));

	m_edges.erase(it);
	m_out[src].erase(dst);
	m_in[dst].erase(src);
}

bool Graph::has_edge(NodeID src, NodeID dst) const
{
	return m_edges.count(NodePair(src, dst)) != 0;
}

const Edge& Graph::edge(NodeID src, NodeID dst) const
{
	return const_cast<Graph*>(this)->edge_mut(src, dst);
}

Edge& Graph::edge_mut(NodeID src, NodeID dst)
{
	auto it = m_edges.find(NodePair(src, dst));
	if (it == m_edges.end())
		throw StructuralError(util::fmt("no edge %u -> %u", src, dst));

	return it->second;
}

std::vector<Edge> Graph::edges() const
{
	std::vector<Edge> result;
	for (auto& p : m_edges)
		result.push_back(p.second);
	return result;
}

unsigned Graph::num_edges() const
{
	return (unsigned)m_edges.size();
}

NodeList Graph::neighbors(NodeID id, Direction dir) const
{
	check_node(id);

	std::set<NodeID> result;
	if (dir != Direction::IN)
	{
		auto& outs = adj(m_out, id);
		result.insert(outs.begin(), outs.end());
	}
	if (dir != Direction::OUT)
	{
		auto& ins = adj(m_in, id);
		result.insert(ins.begin(), ins.end());
	}

	return NodeList(result.begin(), result.end());
}

unsigned Graph::degree(NodeID id, Direction dir) const
{
	check_node(id);

	unsigned result = 0;
	if (dir != Direction::IN)
		result += (unsigned)adj(m_out, id).size();
	if (dir != Direction::OUT)
		result += (unsigned)adj(m_in, id).size();

	return result;
}

void Graph::add_clock_domain(const ClockDomain& domain)
{
	if (domain.name.empty())
		throw ConfigError("clock domain needs a name");

	if (domain.frequency <= 0)
	{
		throw ConfigError(util::fmt("clock domain %s has non-positive frequency %g",
			domain.name.c_str(), domain.frequency));
	}

	if (get_clock_domain(domain.name))
		throw ConfigError("duplicate clock domain " + domain.name);

	m_domains.push_back(domain);
}

const ClockDomain* Graph::get_clock_domain(const std::string& name) const
{
	for (auto& d : m_domains)
	{
		if (d.name == name)
			return &d;
	}
	return nullptr;
}

const std::vector<ClockDomain>& Graph::clock_domains() const
{
	return m_domains;
}

double Graph::frequency(const std::string& domain, double fallback) const
{
	auto d = get_clock_domain(domain);
	return d ? d->frequency : fallback;
}

unsigned GraphSummary::count(NodeKind kind) const
{
	auto it = by_kind.find(kind);
	return it == by_kind.end() ? 0 : it->second;
}

std::string GraphSummary::to_string() const
{
	std::string result = util::fmt("%u nodes, %u edges", nodes, edges);
	for (auto& p : by_kind)
		result += util::fmt(", %s: %u", p.first.to_string(), p.second);
	return result;
}

GraphSummary nocgen::summarize(const Graph& g)
{
	GraphSummary result;
	result.nodes = g.num_nodes();
	result.edges = g.num_edges();

	for (NodeID id : g.nodes())
		result.by_kind[g.node(id).kind()]++;

	return result;
}
