#include "pch.h"
#include "nocgen/validator.h"
#include "nocgen/graph_algo.h"

using namespace nocgen;
using namespace nocgen::impl;

namespace
{
	class Checker
	{
	public:
		Checker(const Graph& g, const FlowList& flows, const FlowOptions& opts)
			: m_g(g), m_flows(flows), m_opts(opts)
		{
		}

		ValidationResult run()
		{
			check_niu_entry();
			add(find_mismatches(m_g));
			check_fanout();
			check_legality();
			check_flows();
			check_warnings();

			return m_result;
		}

	protected:
		const std::string& name(NodeID id) const
		{
			return m_g.node(id).name;
		}

		void error(Category cat, NodeID node, const std::string& msg)
		{
			m_result.errors.push_back({Severity::ERROR, cat, node, msg});
		}

		void warning(Category cat, NodeID node, const std::string& msg)
		{
			m_result.warnings.push_back({Severity::WARNING, cat, node, msg});
		}

		void add(const FindingList& list)
		{
			for (auto& f : list)
			{
				if (f.severity == Severity::ERROR)
					m_result.errors.push_back(f);
				else
					m_result.warnings.push_back(f);
			}
		}

		// Initiators/Targets connect to the fabric through NIUs
		void check_niu_entry()
		{
			for (NodeID id : m_g.nodes())
			{
				const Node& n = m_g.node(id);
				if (!is_endpoint(n))
					continue;

				bool is_init = n.is<Initiator>();
				Direction needed = is_init ? Direction::OUT : Direction::IN;

				if (m_g.degree(id, needed) == 0)
				{
					error(Category::STRUCTURAL, id, util::fmt("%s %s has no %s edge",
						n.kind().to_string(), n.name.c_str(), is_init ? "outgoing" : "incoming"));
				}

				if (!m_opts.niu_entry_only)
					continue;

				for (NodeID other : m_g.neighbors(id, Direction::BOTH))
				{
					if (!m_g.node(other).is<NIU>())
					{
						error(Category::STRUCTURAL, id, util::fmt("%s %s connects to %s %s instead of an NIU",
							n.kind().to_string(), n.name.c_str(),
							m_g.node(other).kind().to_string(), name(other).c_str()));
					}
				}
			}
		}

		void check_fanout()
		{
			for (NodeID id : m_g.nodes())
			{
				const Node& n = m_g.node(id);

				if (n.is<Arbiter>())
				{
					unsigned declared = n.as<Arbiter>().num_inputs;
					unsigned actual = m_g.degree(id, Direction::IN);

					if (declared > MAX_FANOUT)
					{
						error(Category::CAPACITY, id, util::fmt("arbiter %s declares %u inputs, limit is %u",
							n.name.c_str(), declared, MAX_FANOUT));
					}
					if (declared != actual)
					{
						error(Category::CAPACITY, id, util::fmt("arbiter %s declares %u inputs but has %u",
							n.name.c_str(), declared, actual));
					}
				}
				else if (n.is<Decoder>())
				{
					unsigned declared = n.as<Decoder>().num_outputs;
					unsigned actual = m_g.degree(id, Direction::OUT);

					if (declared > MAX_FANOUT)
					{
						error(Category::CAPACITY, id, util::fmt("decoder %s declares %u outputs, limit is %u",
							n.name.c_str(), declared, MAX_FANOUT));
					}
					if (declared != actual)
					{
						error(Category::CAPACITY, id, util::fmt("decoder %s declares %u outputs but has %u",
							n.name.c_str(), declared, actual));
					}
				}
				else if (n.is<Router>())
				{
					unsigned ports = n.as<Router>().num_ports;
					unsigned used = m_g.degree(id, Direction::BOTH);

					if (used > ports)
					{
						error(Category::CAPACITY, id, util::fmt("router %s has %u ports but %u connections",
							n.name.c_str(), ports, used));
					}
				}
			}
		}

		// Widths and clock domain references
		void check_legality()
		{
			bool have_domains = !m_g.clock_domains().empty();

			for (NodeID id : m_g.nodes())
			{
				const Node& n = m_g.node(id);

				std::set<unsigned> widths{declared_width(n), in_width(n), out_width(n)};
				for (unsigned w : widths)
				{
					if (w != 0 && !is_legal_width(w))
					{
						error(Category::CONFIG, id, util::fmt("%s has illegal width %u",
							n.name.c_str(), w));
					}
				}

				if (!have_domains)
					continue;

				std::set<std::string> domains{declared_domain(n), in_domain(n), out_domain(n)};
				for (auto& d : domains)
				{
					if (!d.empty() && !m_g.get_clock_domain(d))
					{
						error(Category::CONFIG, id, util::fmt("%s references undeclared clock domain %s",
							n.name.c_str(), d.c_str()));
					}
				}
			}

			for (auto& e : m_g.edges())
			{
				if (e.width != 0 && !is_legal_width(e.width))
				{
					error(Category::CONFIG, e.src, util::fmt("edge %s -> %s has illegal width %u",
						name(e.src).c_str(), name(e.dst).c_str(), e.width));
				}
			}
		}

		void check_flows()
		{
			std::map<NodeID, double> target_load;

			for (auto& f : m_flows)
			{
				if (!m_g.has_node(f.src) || !m_g.node(f.src).is<Initiator>())
				{
					error(Category::STRUCTURAL, f.src, util::fmt("flow source %u is not an initiator", f.src));
					continue;
				}

				if (!m_g.has_node(f.dst) || !m_g.node(f.dst).is<Target>())
				{
					error(Category::STRUCTURAL, f.dst, util::fmt("flow destination %u is not a target", f.dst));
					continue;
				}

				target_load[f.dst] += f.bandwidth;
				check_flow_latency(f);
			}

			for (auto& p : target_load)
			{
				const Node& n = m_g.node(p.first);
				double cap = n.as<Target>().max_bandwidth;
				double usage = cap > 0 ? p.second / cap : std::numeric_limits<double>::infinity();

				if (usage > 1.0)
				{
					error(Category::BANDWIDTH, p.first, util::fmt("target %s oversubscribed: %g GB/s of %g GB/s",
						n.name.c_str(), p.second, cap));
				}
				else if (usage > m_opts.utilization_warning)
				{
					warning(Category::BANDWIDTH, p.first, util::fmt("target %s at %.0f%% utilization",
						n.name.c_str(), usage * 100.0));
				}
			}
		}

		void check_flow_latency(const TrafficFlow& f)
		{
			unsigned latency;
			if (!algo::shortest_path(m_g, f.src, f.dst, nullptr, &latency))
			{
				error(Category::STRUCTURAL, f.src, util::fmt("no path for flow %s -> %s",
					name(f.src).c_str(), name(f.dst).c_str()));
				return;
			}

			unsigned req = m_g.node(f.src).as<Initiator>().latency_requirement;
			if (req > 0 && latency > req)
			{
				error(Category::LATENCY, f.src, util::fmt("flow %s -> %s latency %u exceeds initiator requirement %u",
					name(f.src).c_str(), name(f.dst).c_str(), latency, req));
			}

			if (f.max_latency > 0 && latency > f.max_latency)
			{
				error(Category::LATENCY, f.src, util::fmt("flow %s -> %s latency %u exceeds flow limit %u",
					name(f.src).c_str(), name(f.dst).c_str(), latency, f.max_latency));
			}
		}

		void check_warnings()
		{
			for (NodeID id : m_g.nodes())
			{
				const Node& n = m_g.node(id);

				if (n.is<ClockConverter>())
				{
					auto& cc = n.as<ClockConverter>();
					if (cc.src_clock_domain == cc.dst_clock_domain)
					{
						warning(Category::STRUCTURAL, id, util::fmt("clock converter %s does not change domain",
							n.name.c_str()));
					}
				}
				else if (n.is<WidthConverter>())
				{
					auto& wc = n.as<WidthConverter>();
					if (wc.src_width == wc.dst_width)
					{
						warning(Category::STRUCTURAL, id, util::fmt("width converter %s does not change width",
							n.name.c_str()));
					}
				}
			}

			if (m_g.num_nodes() > 0)
			{
				unsigned comps = algo::connected_components(m_g);
				if (comps > 1)
				{
					warning(Category::STRUCTURAL, INVALID_NODE, util::fmt("graph has %u disconnected components",
						comps));
				}
			}
		}

		const Graph& m_g;
		const FlowList& m_flows;
		const FlowOptions& m_opts;
		ValidationResult m_result;
	};
}

std::string Finding::to_string() const
{
	return util::fmt("[%s] %s", category.to_string(), message.c_str());
}

bool ValidationResult::ok() const
{
	return errors.empty();
}

unsigned ValidationResult::count(Category cat) const
{
	return (unsigned)std::count_if(errors.begin(), errors.end(), [=](const Finding& f)
	{
		return f.category == cat;
	});
}

void ValidationResult::throw_if_errors() const
{
	if (!errors.empty())
		throw_finding(errors.front());
}

void nocgen::throw_finding(const Finding& f)
{
	switch (f.category)
	{
	case Category::STRUCTURAL: throw StructuralError(f.message);
	case Category::CONFIG: throw ConfigError(f.message);
	case Category::CAPACITY: throw CapacityError(f.message);
	case Category::BANDWIDTH: throw BandwidthError(f.message);
	case Category::LATENCY: throw LatencyError(f.message);
	}

	throw Exception(f.message);
}

FindingList nocgen::find_mismatches(const Graph& g)
{
	FindingList result;

	for (auto& e : g.edges())
	{
		const Node& u = g.node(e.src);
		const Node& v = g.node(e.dst);

		if (!u.is<WidthConverter>() && !v.is<WidthConverter>())
		{
			unsigned wu = out_width(u);
			unsigned wv = in_width(v);

			if (wu != 0 && wv != 0 && wu != wv)
			{
				result.push_back({Severity::ERROR, Category::STRUCTURAL, e.src,
					util::fmt("width mismatch on %s (%u) -> %s (%u)",
					u.name.c_str(), wu, v.name.c_str(), wv)});
			}
			else if (e.width != 0 && ((wu != 0 && e.width != wu) || (wv != 0 && e.width != wv)))
			{
				result.push_back({Severity::ERROR, Category::STRUCTURAL, e.src,
					util::fmt("edge %s -> %s carries %u bits, endpoints declare %u",
					u.name.c_str(), v.name.c_str(), e.width, wu != 0 ? wu : wv)});
			}
		}

		if (!u.is<ClockConverter>() && !v.is<ClockConverter>())
		{
			const std::string& du = out_domain(u);
			const std::string& dv = in_domain(v);

			if (!du.empty() && !dv.empty() && du != dv)
			{
				result.push_back({Severity::ERROR, Category::STRUCTURAL, e.src,
					util::fmt("clock domain mismatch on %s (%s) -> %s (%s)",
					u.name.c_str(), du.c_str(), v.name.c_str(), dv.c_str())});
			}
		}
	}

	return result;
}

ValidationResult nocgen::validate(const Graph& g, const FlowList& flows, const FlowOptions& opts)
{
	Checker checker(g, flows, opts);
	auto result = checker.run();

	log::debug("validate: %u errors, %u warnings",
		(unsigned)result.errors.size(), (unsigned)result.warnings.size());

	return result;
}
