#include "pch.h"
#include "nocgen/explore.h"

using namespace nocgen;
using namespace nocgen::impl;

namespace
{
	// Hands out candidate indices to workers
	class WorkQueue
	{
	public:
		WorkQueue(unsigned count)
		{
			for (unsigned i = 0; i < count; i++)
				m_queue.push_back(i);
		}

		bool pop(unsigned& out)
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			if (m_queue.empty())
				return false;

			out = m_queue.front();
			m_queue.pop_front();
			return true;
		}

	protected:
		std::mutex m_mutex;
		std::deque<unsigned> m_queue;
	};

	void run_candidate(const Candidate& cand, const OracleFactory& factory,
		TrafficPattern pattern, ExploreResult& result)
	{
		result.name = cand.name;

		try
		{
			FlowResult flow = run_flow(cand.req, cand.opts);
			result.stage = flow.stage;
			result.summary = summarize(flow.graph);
			result.crossbar_bandwidth = crossbar_bandwidth(flow.graph, flow.flows,
				cand.opts.generator.crossbar_name);

			if (!flow.ok())
			{
				result.error = util::fmt("stopped at %s: %s", flow.stage.to_string(),
					flow.validation.errors.front().to_string().c_str());
				return;
			}

			auto oracle = factory(flow);
			if (!oracle)
				throw Exception("oracle factory returned nothing for " + cand.name);

			result.sweep = SweepController::run(*oracle, flow.graph, pattern, cand.opts.sweep);
			result.ok = true;
		}
		catch (std::exception& e)
		{
			result.ok = false;
			result.error = e.what();
		}

		if (!result.ok)
			log::error("candidate %s: %s", cand.name.c_str(), result.error.c_str());
	}
}

std::vector<ExploreResult> nocgen::explore(const std::vector<Candidate>& candidates,
	const OracleFactory& factory, unsigned threads, TrafficPattern pattern)
{
	std::vector<ExploreResult> results(candidates.size());
	WorkQueue queue((unsigned)candidates.size());

	threads = std::max(1u, std::min(threads, (unsigned)candidates.size()));
	log::info("exploring %u candidates on %u threads", (unsigned)candidates.size(), threads);

	// Each worker writes only its own candidates' result slots
	auto worker = [&]()
	{
		unsigned idx;
		while (queue.pop(idx))
			run_candidate(candidates[idx], factory, pattern, results[idx]);
	};

	std::vector<std::thread> pool;
	for (unsigned i = 0; i < threads; i++)
		pool.emplace_back(worker);

	for (auto& t : pool)
		t.join();

	unsigned ok = (unsigned)std::count_if(results.begin(), results.end(),
		[](const ExploreResult& r) { return r.ok; });
	log::info("exploration done: %u of %u candidates succeeded", ok, (unsigned)results.size());

	return results;
}
