#include "pch.h"
#include "nocgen/converter.h"

using namespace nocgen;
using namespace nocgen::impl;

namespace
{
	std::string unique_name(const Graph& g, const std::string& base)
	{
		std::string result = base;
		for (unsigned i = 1; g.find_node(result) != INVALID_NODE; i++)
			result = base + "_" + std::to_string(i);
		return result;
	}

	// Replaces edge (u,v) with (u,mid) and (mid,v). The original latency is
	// split across the two halves.
	void split_edge(Graph& g, const Edge& e, NodeID mid, unsigned w_up, unsigned w_down)
	{
		unsigned lat_up = std::max(1u, e.latency / 2);
		unsigned lat_down = std::max(1u, e.latency - e.latency / 2);

		g.remove_edge(e.src, e.dst);
		g.add_edge(Edge(e.src, mid, w_up, lat_up));
		g.add_edge(Edge(mid, e.dst, w_down, lat_down));
	}

	class Inserter
	{
	public:
		Inserter(const Graph& g)
			: m_g(g)
		{
		}

		void run()
		{
			clock_pass();
			width_pass();
		}

		ConversionResult result()
		{
			ConversionResult result;
			result.graph = m_g;
			result.clock_converters = m_ccs;
			result.width_converters = m_wcs;
			return result;
		}

	protected:
		// Name prefix for converters on edge (u,v). Converters carry the names
		// of the edge they were inserted on, even when stacked.
		std::string edge_name(NodeID u, NodeID v)
		{
			auto it = m_origin.find(u);
			if (it != m_origin.end())
				return it->second;

			return m_g.node(u).name + "_" + m_g.node(v).name;
		}

		void clock_pass()
		{
			for (auto& e : m_g.edges())
			{
				const Node& u = m_g.node(e.src);
				const Node& v = m_g.node(e.dst);

				if (u.is<ClockConverter>() || v.is<ClockConverter>())
					continue;

				const std::string& du = out_domain(u);
				const std::string& dv = in_domain(v);

				if (du.empty() || dv.empty() || du == dv)
					continue;

				ClockConverter cc;
				cc.width = out_width(u) ? out_width(u) : in_width(v);
				cc.clock_domain = dv;
				cc.src_clock_domain = du;
				cc.dst_clock_domain = dv;

				std::string prefix = edge_name(e.src, e.dst);
				NodeID id = m_g.add_node(unique_name(m_g, prefix + "_CDC"), cc);

				log::debug("inserted clock converter %s (%s -> %s)",
					m_g.node(id).name.c_str(), du.c_str(), dv.c_str());

				m_origin[id] = prefix;
				m_ccs.push_back(id);

				// Both halves run at the converter's width. A width change, if
				// any, is the width pass's job.
				unsigned w = cc.width ? cc.width : e.width;
				split_edge(m_g, e, id, w, w);
			}
		}

		void width_pass()
		{
			for (auto& e : m_g.edges())
			{
				const Node& a = m_g.node(e.src);
				const Node& b = m_g.node(e.dst);

				if (a.is<WidthConverter>() || b.is<WidthConverter>())
					continue;

				unsigned wa = out_width(a);
				unsigned wb = in_width(b);

				if (wa == 0 || wb == 0 || wa == wb)
				{
					fix_carried_width(e, wa ? wa : wb);
					continue;
				}

				WidthConverter wc;
				wc.src_width = wa;
				wc.dst_width = wb;
				wc.width = std::max(wa, wb);
				wc.clock_domain = in_domain(b).empty() ? out_domain(a) : in_domain(b);

				std::string prefix = edge_name(e.src, e.dst);
				NodeID id = m_g.add_node(unique_name(m_g, prefix + "_WC"), wc);

				log::debug("inserted width converter %s (%u -> %u)",
					m_g.node(id).name.c_str(), wa, wb);

				m_wcs.push_back(id);
				split_edge(m_g, e, id, wa, wb);
			}
		}

		// An edge between width-compatible endpoints carries their width
		void fix_carried_width(const Edge& e, unsigned width)
		{
			if (width == 0 || e.width == 0 || e.width == width)
				return;

			log::debug("edge %s -> %s: carried width %u -> %u", m_g.node(e.src).name.c_str(),
				m_g.node(e.dst).name.c_str(), e.width, width);

			m_g.edge_mut(e.src, e.dst).width = width;
		}

		Graph m_g;
		NodeList m_ccs;
		NodeList m_wcs;
		std::map<NodeID, std::string> m_origin;
	};
}

ConversionResult nocgen::insert_converters(const Graph& g, bool enabled)
{
	if (!enabled)
	{
		ConversionResult result;
		result.graph = g;
		result.errors = find_mismatches(g);

		log::info("converter insertion disabled, %u mismatches left in place",
			(unsigned)result.errors.size());

		return result;
	}

	Inserter ins(g);
	ins.run();
	auto result = ins.result();

	log::info("inserted %u clock converters and %u width converters",
		(unsigned)result.clock_converters.size(), (unsigned)result.width_converters.size());

	return result;
}
