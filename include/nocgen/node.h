#pragma once

#include <string>
#include <limits>
#include <boost/variant.hpp>
#include "nocgen/nocgen.h"

namespace nocgen
{
	using NodeID = unsigned;
	const NodeID INVALID_NODE = std::numeric_limits<NodeID>::max();

	// Order must match the alternatives of NodeAttrs below
	SMART_ENUM(NodeKind, INITIATOR, TARGET, NIU, ROUTER, ARBITER, DECODER,
		CLOCK_CONVERTER, WIDTH_CONVERTER);

	SMART_ENUM(TrafficPattern, BURSTY, STREAMING, UNIFORM);
	SMART_ENUM(ArbPolicy, PRIORITY, ROUND_ROBIN, WEIGHTED);

	// Legal datapath widths are the powers of two in [MIN_WIDTH, MAX_WIDTH]
	const unsigned MIN_WIDTH = 32;
	const unsigned MAX_WIDTH = 1024;

	// Arbiter fan-in and Decoder fan-out limit
	const unsigned MAX_FANOUT = 4;

	struct Initiator
	{
		double avg_throughput = 0;	// GB/s
		double max_throughput = 0;	// GB/s
		unsigned latency_requirement = 0;	// cycles
		unsigned priority = 0;	// 0 = highest
		TrafficPattern traffic_pattern = TrafficPattern::BURSTY;
	};

	struct Target
	{
		double max_bandwidth = 0;	// GB/s
		unsigned latency = 0;	// cycles
		double size = 0;	// GB
	};

	struct NIU
	{
		unsigned width = 0;
		std::string clock_domain;
	};

	struct Router
	{
		unsigned width = 0;
		std::string clock_domain;
		unsigned num_ports = 0;
	};

	struct Arbiter
	{
		unsigned num_inputs = 0;
		unsigned width = 0;
		ArbPolicy policy = ArbPolicy::PRIORITY;
	};

	struct Decoder
	{
		unsigned num_outputs = 0;
		unsigned width = 0;
	};

	struct ClockConverter
	{
		unsigned width = 0;
		std::string clock_domain;
		std::string src_clock_domain;
		std::string dst_clock_domain;
	};

	struct WidthConverter
	{
		unsigned width = 0;
		std::string clock_domain;
		unsigned src_width = 0;
		unsigned dst_width = 0;
	};

	using NodeAttrs = boost::variant<Initiator, Target, NIU, Router, Arbiter, Decoder,
		ClockConverter, WidthConverter>;

	struct Node
	{
		NodeID id = INVALID_NODE;
		std::string name;
		NodeAttrs attrs;

		Node() = default;
		Node(NodeID _id, const std::string& _name, const NodeAttrs& _attrs)
			: id(_id), name(_name), attrs(_attrs) { }

		NodeKind kind() const;

		template<class T> bool is() const
		{
			return boost::get<T>(&attrs) != nullptr;
		}

		// Throws StructuralError if the node is of a different kind
		template<class T> T& as()
		{
			T* result = boost::get<T>(&attrs);
			if (!result)
				throw StructuralError("node " + name + " has unexpected kind " +
					kind().to_string());
			return *result;
		}

		template<class T> const T& as() const
		{
			return const_cast<Node*>(this)->as<T>();
		}
	};

	// Per-port-side attribute queries. Converters report their source-side
	// value on the input side and their destination-side value on the output
	// side. A return value of 0 / empty string means the node does not declare
	// that attribute.
	unsigned in_width(const Node&);
	unsigned out_width(const Node&);
	const std::string& in_domain(const Node&);
	const std::string& out_domain(const Node&);

	// The single width/domain a node is configured with (0 / empty if none)
	unsigned declared_width(const Node&);
	const std::string& declared_domain(const Node&);

	// Intrinsic traversal latency, cycles
	unsigned node_latency(const Node&);

	bool is_legal_width(unsigned width);

	// Smallest legal width holding 'bits', or 0 if it exceeds MAX_WIDTH
	unsigned legal_width_for(double bits);

	bool is_converter(const Node&);
	bool is_endpoint(const Node&);
}
