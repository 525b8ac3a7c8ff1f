#pragma once

#include <mutex>
#include <vector>
#include <string>
#include <gtest/gtest.h>
#include "nocgen/graph.h"
#include "nocgen/generator.h"
#include "nocgen/log.h"

namespace nocgen
{
namespace test
{
	// Collects log messages instead of printing them, for the lifetime of the
	// object. Worker threads may log concurrently.
	class LogCapture
	{
	public:
		LogCapture()
		{
			log::set_handler([this](const log::Message& msg)
			{
				std::lock_guard<std::mutex> lock(m_mutex);
				messages.push_back(msg);
			});
		}

		~LogCapture()
		{
			log::reset_handler();
		}

		unsigned count(log::Message::Level lvl)
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			unsigned result = 0;
			for (auto& m : messages)
			{
				if (m.level == lvl)
					result++;
			}
			return result;
		}

		std::vector<log::Message> messages;

	protected:
		std::mutex m_mutex;
	};

	inline NIU niu(unsigned width, const std::string& domain = "fast")
	{
		NIU result;
		result.width = width;
		result.clock_domain = domain;
		return result;
	}

	inline Router router(unsigned width, unsigned ports, const std::string& domain = "fast")
	{
		Router result;
		result.width = width;
		result.clock_domain = domain;
		result.num_ports = ports;
		return result;
	}

	inline Initiator initiator(double max_bw = 1.0, unsigned latency_req = 0)
	{
		Initiator result;
		result.avg_throughput = max_bw;
		result.max_throughput = max_bw;
		result.latency_requirement = latency_req;
		return result;
	}

	inline Target target(double max_bw = 100.0, unsigned latency = 0)
	{
		Target result;
		result.max_bandwidth = max_bw;
		result.latency = latency;
		return result;
	}

	inline TrafficFlow flow(NodeID src, NodeID dst, double bw, unsigned max_latency = 0)
	{
		TrafficFlow result;
		result.src = src;
		result.dst = dst;
		result.bandwidth = bw;
		result.max_latency = max_latency;
		return result;
	}

	inline std::vector<ClockDomain> fast_slow_domains()
	{
		return { {"fast", 2000.0}, {"slow", 1000.0} };
	}

	inline InitiatorSpec initiator_spec(const std::string& name, double max_bw,
		unsigned latency_req = 0, unsigned priority = 0)
	{
		InitiatorSpec result;
		result.name = name;
		result.avg_throughput = max_bw;
		result.max_throughput = max_bw;
		result.latency_requirement = latency_req;
		result.priority = priority;
		return result;
	}

	inline TargetSpec target_spec(const std::string& name, double max_bw, unsigned latency = 0)
	{
		TargetSpec result;
		result.name = name;
		result.max_bandwidth = max_bw;
		result.latency = latency;
		return result;
	}

	inline FlowSpec flow_spec(const std::string& src, const std::string& dst, double bw,
		unsigned priority = 0)
	{
		FlowSpec result;
		result.src = src;
		result.dst = dst;
		result.bandwidth = bw;
		result.priority = priority;
		return result;
	}

	// Two initiators into one target, everything at 2000 MHz
	inline Requirements two_initiator_reqs()
	{
		Requirements req;
		req.network = "soc";
		req.clock_domains = { {"fast", 2000.0}, {"slow", 2000.0} };
		req.initiators = { initiator_spec("cpu", 2.0), initiator_spec("dma", 8.0) };
		req.targets = { target_spec("mem", 25.6, 40) };
		req.flows = { flow_spec("cpu", "mem", 2.0), flow_spec("dma", "mem", 8.0) };
		return req;
	}

	// Number of edges into/out of a node whose other end satisfies 'pred'
	template<class PRED>
	unsigned count_neighbors(const Graph& g, NodeID id, Direction dir, PRED pred)
	{
		unsigned result = 0;
		for (NodeID n : g.neighbors(id, dir))
		{
			if (pred(g.node(n)))
				result++;
		}
		return result;
	}
}
}
