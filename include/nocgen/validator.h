#pragma once

#include <vector>
#include <string>
#include "nocgen/graph.h"

namespace nocgen
{
	SMART_ENUM(Severity, ERROR, WARNING);

	// Mirrors the exception taxonomy
	SMART_ENUM(Category, STRUCTURAL, CONFIG, CAPACITY, BANDWIDTH, LATENCY);

	struct Finding
	{
		Severity severity = Severity::ERROR;
		Category category = Category::STRUCTURAL;
		NodeID node = INVALID_NODE;	// offending node, if there is one
		std::string message;

		std::string to_string() const;
	};

	using FindingList = std::vector<Finding>;

	struct ValidationResult
	{
		FindingList errors;
		FindingList warnings;

		bool ok() const;

		// Number of errors in a category
		unsigned count(Category cat) const;

		// Throws the typed exception matching the first error, if any
		void throw_if_errors() const;
	};

	// Checks every structural, capacity, clock/width, bandwidth and latency rule
	// against g. Never modifies the graph and never throws for rule violations:
	// they come back as data. Flows are only needed for the bandwidth and
	// latency rules.
	ValidationResult validate(const Graph& g, const FlowList& flows = {},
		const FlowOptions& opts = FlowOptions());

	// Just the width-match and clock-match rules
	FindingList find_mismatches(const Graph& g);

	// Throws the exception type that corresponds to the finding's category
	void throw_finding(const Finding& f);
}
