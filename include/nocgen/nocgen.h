#pragma once

#include <string>
#include <stdexcept>
#include "nocgen/smart_enum.h"

namespace nocgen
{
	// nocgen exception base class
	class Exception : public std::runtime_error
	{
	public:
		Exception(const char* what)
			: std::runtime_error(what) { }
		Exception(const std::string& what)
			: std::runtime_error(what.c_str()) { }
	};

	// Malformed references, duplicate ids, illegal edges
	class StructuralError : public Exception
	{
	public:
		using Exception::Exception;
	};

	// Invalid or out-of-range configuration/requirement values
	class ConfigError : public Exception
	{
	public:
		using Exception::Exception;
	};

	// Port/fan-in/fan-out overflow
	class CapacityError : public Exception
	{
	public:
		using Exception::Exception;
	};

	// Target oversubscription
	class BandwidthError : public Exception
	{
	public:
		using Exception::Exception;
	};

	// Latency requirement violated
	class LatencyError : public Exception
	{
	public:
		using Exception::Exception;
	};

	// Routing table lookup for a pair that has no path
	class NoRouteError : public Exception
	{
	public:
		using Exception::Exception;
	};

	SMART_ENUM(OptimizeFor, BANDWIDTH, LATENCY, NONE);

	struct GeneratorOptions
	{
		std::string fast_domain = "fast";
		std::string slow_domain = "slow";

		// Nodes whose relevant bandwidth (GB/s) reaches this go to the fast domain
		double fast_bw_threshold = 2.0;

		// Used when a node's clock domain is not declared (MHz)
		double default_frequency = 2000.0;

		std::string crossbar_name = "Crossbar";

		unsigned initiator_niu_latency = 1;
		unsigned niu_crossbar_latency = 2;
		unsigned crossbar_niu_latency = 2;

		// NIU->Target edge latency is target.latency / this
		unsigned target_latency_divisor = 10;
	};

	// Relative weights, normalized before use
	struct CostWeights
	{
		double throughput = 0.6;
		double latency = 0.3;
		double area = 0.1;
	};

	struct OptimizerOptions
	{
		// GB/s. Flows at or above high get dedicated routers, flows below low
		// are grouped behind arbiters.
		double high_bw_threshold = 50.0;
		double low_bw_threshold = 5.0;

		unsigned max_arbiter_inputs = 4;
		unsigned dedicated_latency = 1;
		unsigned arbiter_latency = 1;
		double default_frequency = 2000.0;

		std::string crossbar_name = "Crossbar";
		CostWeights weights;
	};

	struct SweepOptions
	{
		double sweep_step = 10.0;
		double min_step = 1.0;

		// Slope (latency cycles per injection percent) at which the step halves
		double sweep_threshold = 1.0;

		// Saturated once latency > max(latency_floor, latency_factor * zero-load)
		double latency_floor = 100.0;
		double latency_factor = 2.5;

		double max_rate = 100.0;
	};

	struct FlowOptions
	{
		bool auto_insert_converters = true;

		// Initiators/Targets may only attach to NIUs. Clearing this relaxes the rule.
		bool niu_entry_only = true;

		bool run_optimizer = true;
		bool build_routes = true;

		// Target utilisation above this (but within capacity) is a warning
		double utilization_warning = 0.9;

		GeneratorOptions generator;
		OptimizerOptions optimizer;
		SweepOptions sweep;
	};

	// Range checks, throw ConfigError
	void check_options(const GeneratorOptions&);
	void check_options(const OptimizerOptions&);
	void check_options(const SweepOptions&);
	void check_options(const FlowOptions&);
}
