#include "pch.h"
#include <boost/mpl/size.hpp>
#include "nocgen/node.h"

using namespace nocgen;

static_assert(boost::mpl::size<NodeAttrs::types>::value == 8,
	"NodeKind and NodeAttrs must list the same alternatives");

namespace
{
	const std::string s_no_domain;

	// Input/output-side width. Everything except a WidthConverter looks the
	// same from both sides.
	class WidthVisitor : public boost::static_visitor<unsigned>
	{
	public:
		WidthVisitor(bool input) : m_input(input) { }

		unsigned operator() (const Initiator&) const { return 0; }
		unsigned operator() (const Target&) const { return 0; }
		unsigned operator() (const NIU& n) const { return n.width; }
		unsigned operator() (const Router& n) const { return n.width; }
		unsigned operator() (const Arbiter& n) const { return n.width; }
		unsigned operator() (const Decoder& n) const { return n.width; }
		unsigned operator() (const ClockConverter& n) const { return n.width; }
		unsigned operator() (const WidthConverter& n) const
		{
			return m_input ? n.src_width : n.dst_width;
		}

	protected:
		bool m_input;
	};

	class DomainVisitor : public boost::static_visitor<const std::string&>
	{
	public:
		DomainVisitor(bool input) : m_input(input) { }

		const std::string& operator() (const Initiator&) const { return s_no_domain; }
		const std::string& operator() (const Target&) const { return s_no_domain; }
		const std::string& operator() (const NIU& n) const { return n.clock_domain; }
		const std::string& operator() (const Router& n) const { return n.clock_domain; }
		const std::string& operator() (const Arbiter&) const { return s_no_domain; }
		const std::string& operator() (const Decoder&) const { return s_no_domain; }
		const std::string& operator() (const ClockConverter& n) const
		{
			return m_input ? n.src_clock_domain : n.dst_clock_domain;
		}
		const std::string& operator() (const WidthConverter& n) const { return n.clock_domain; }

	protected:
		bool m_input;
	};

	// Configured (not port-side) width and domain
	class DeclaredWidth : public boost::static_visitor<unsigned>
	{
	public:
		unsigned operator() (const Initiator&) const { return 0; }
		unsigned operator() (const Target&) const { return 0; }
		template<class T> unsigned operator() (const T& n) const { return n.width; }
	};

	class DeclaredDomain : public boost::static_visitor<const std::string&>
	{
	public:
		const std::string& operator() (const NIU& n) const { return n.clock_domain; }
		const std::string& operator() (const Router& n) const { return n.clock_domain; }
		const std::string& operator() (const ClockConverter& n) const { return n.clock_domain; }
		const std::string& operator() (const WidthConverter& n) const { return n.clock_domain; }
		template<class T> const std::string& operator() (const T&) const { return s_no_domain; }
	};

	class LatencyVisitor : public boost::static_visitor<unsigned>
	{
	public:
		unsigned operator() (const Initiator&) const { return 0; }
		unsigned operator() (const Target&) const { return 0; }
		unsigned operator() (const NIU&) const { return 0; }
		unsigned operator() (const Router&) const { return 1; }
		unsigned operator() (const Arbiter&) const { return 1; }
		unsigned operator() (const Decoder&) const { return 1; }
		unsigned operator() (const ClockConverter&) const { return 2; }
		unsigned operator() (const WidthConverter&) const { return 1; }
	};
}

NodeKind Node::kind() const
{
	return (NodeKind::NodeKind_e)attrs.which();
}

unsigned nocgen::in_width(const Node& n)
{
	return boost::apply_visitor(WidthVisitor(true), n.attrs);
}

unsigned nocgen::out_width(const Node& n)
{
	return boost::apply_visitor(WidthVisitor(false), n.attrs);
}

const std::string& nocgen::in_domain(const Node& n)
{
	return boost::apply_visitor(DomainVisitor(true), n.attrs);
}

const std::string& nocgen::out_domain(const Node& n)
{
	return boost::apply_visitor(DomainVisitor(false), n.attrs);
}

unsigned nocgen::declared_width(const Node& n)
{
	return boost::apply_visitor(DeclaredWidth(), n.attrs);
}

const std::string& nocgen::declared_domain(const Node& n)
{
	return boost::apply_visitor(DeclaredDomain(), n.attrs);
}

unsigned nocgen::node_latency(const Node& n)
{
	return boost::apply_visitor(LatencyVisitor(), n.attrs);
}

bool nocgen::is_legal_width(unsigned width)
{
	for (unsigned w = MIN_WIDTH; w <= MAX_WIDTH; w *= 2)
	{
		if (w == width)
			return true;
	}
	return false;
}

unsigned nocgen::legal_width_for(double bits)
{
	for (unsigned w = MIN_WIDTH; w <= MAX_WIDTH; w *= 2)
	{
		if (bits <= (double)w)
			return w;
	}
	return 0;
}

bool nocgen::is_converter(const Node& n)
{
	return n.is<ClockConverter>() || n.is<WidthConverter>();
}

bool nocgen::is_endpoint(const Node& n)
{
	return n.is<Initiator>() || n.is<Target>();
}
