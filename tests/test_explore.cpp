#include <atomic>
#include "test_util.h"
#include "nocgen/explore.h"
#include "nocgen/analytic_model.h"

using namespace nocgen;
using namespace nocgen::test;

namespace
{
	Candidate make_candidate(const std::string& name, double mem_bw)
	{
		Candidate result;
		result.name = name;
		result.req = two_initiator_reqs();
		result.req.targets[0].max_bandwidth = mem_bw;
		return result;
	}

	OracleFactory analytic_factory(std::atomic<unsigned>* made = nullptr)
	{
		return [=](const FlowResult& flow)
		{
			if (made)
				(*made)++;
			return std::unique_ptr<SimOracle>(new AnalyticOracle(flow.flows));
		};
	}
}

TEST(Explore, ResultsInOrder)
{
	LogCapture logs;

	std::vector<Candidate> cands;
	for (unsigned i = 0; i < 6; i++)
		cands.push_back(make_candidate("c" + std::to_string(i), 16.0 + 8.0 * i));

	std::atomic<unsigned> made(0);
	auto results = explore(cands, analytic_factory(&made), 3);

	ASSERT_EQ(6u, results.size());
	for (unsigned i = 0; i < 6; i++)
	{
		EXPECT_EQ(cands[i].name, results[i].name);
		EXPECT_TRUE(results[i].ok) << results[i].error;
		EXPECT_TRUE(results[i].error.empty());
		EXPECT_TRUE(results[i].stage == FlowStage::DONE);
		EXPECT_GT(results[i].sweep.oracle_calls, 0u);
	}

	EXPECT_EQ(6u, made.load());
}

TEST(Explore, SingleThreadMatchesParallel)
{
	LogCapture logs;

	std::vector<Candidate> cands =
	{
		make_candidate("small", 12.8),
		make_candidate("large", 51.2)
	};

	auto serial = explore(cands, analytic_factory(), 1);
	auto parallel = explore(cands, analytic_factory(), 8);

	ASSERT_EQ(serial.size(), parallel.size());
	for (unsigned i = 0; i < serial.size(); i++)
	{
		EXPECT_EQ(serial[i].summary.nodes, parallel[i].summary.nodes);
		EXPECT_DOUBLE_EQ(serial[i].crossbar_bandwidth, parallel[i].crossbar_bandwidth);
		EXPECT_TRUE(serial[i].sweep.state == parallel[i].sweep.state);
		EXPECT_DOUBLE_EQ(serial[i].sweep.saturation_rate, parallel[i].sweep.saturation_rate);
	}
}

TEST(Explore, FailuresRecorded)
{
	LogCapture logs;

	std::vector<Candidate> cands =
	{
		make_candidate("good", 25.6),
		make_candidate("oversubscribed", 8.0),
		make_candidate("bad_width", 900.0)
	};

	// Unknown flow endpoint
	cands.push_back(make_candidate("bad_flow", 25.6));
	cands.back().req.flows[0].dst = "nowhere";

	auto results = explore(cands, analytic_factory(), 2);
	ASSERT_EQ(4u, results.size());

	EXPECT_TRUE(results[0].ok);

	EXPECT_FALSE(results[1].ok);
	EXPECT_TRUE(results[1].stage == FlowStage::VALIDATE);
	EXPECT_FALSE(results[1].error.empty());

	EXPECT_FALSE(results[2].ok);
	EXPECT_FALSE(results[2].error.empty());

	EXPECT_FALSE(results[3].ok);
	EXPECT_NE(std::string::npos, results[3].error.find("nowhere"));

	// One line per failed candidate, at least
	EXPECT_GE(logs.count(log::Message::ERROR), 3u);
}

TEST(Explore, NullOracle)
{
	LogCapture logs;

	std::vector<Candidate> cands = { make_candidate("c", 25.6) };
	auto results = explore(cands, [](const FlowResult&) { return std::unique_ptr<SimOracle>(); }, 1);

	ASSERT_EQ(1u, results.size());
	EXPECT_FALSE(results[0].ok);
	EXPECT_TRUE(results[0].stage == FlowStage::DONE);
}

TEST(Explore, Empty)
{
	LogCapture logs;
	EXPECT_TRUE(explore({}, analytic_factory(), 4).empty());
}
