#pragma once

#include "nocgen/graph.h"
#include "nocgen/validator.h"

namespace nocgen
{
	struct ConversionResult
	{
		Graph graph;
		NodeList clock_converters;
		NodeList width_converters;

		// Only populated when insertion is disabled: the mismatches that
		// would have been fixed
		FindingList errors;
	};

	// Returns a copy of g with a ClockConverter interposed on every edge whose
	// endpoints are in different clock domains, then a WidthConverter on every
	// edge whose endpoints have different widths. Every other edge is made to
	// carry its endpoints' width. Running it on its own output adds nothing. With enabled=false the graph comes back unmodified along
	// with the mismatches.
	ConversionResult insert_converters(const Graph& g, bool enabled = true);
}
