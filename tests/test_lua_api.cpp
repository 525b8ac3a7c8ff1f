#include "test_util.h"
#include "nocgen/lua/nocgen_lua.h"
#include "nocgen/flow.h"

using namespace nocgen;
using namespace nocgen::test;

namespace
{
	class LuaApiTest : public ::testing::Test
	{
	protected:
		void TearDown() override
		{
			lua::shutdown();
		}

		// Runs 'code' and returns the error it raised, or an empty string
		std::string error_of(const std::string& code)
		{
			try
			{
				lua::exec_string(code);
			}
			catch (Exception& e)
			{
				return e.what();
			}
			return "";
		}

		LogCapture logs;
	};

	const char* SOC_SCRIPT = R"(
		nocgen.network("soc")
		nocgen.clock_domain{name="fast", frequency=2000}
		nocgen.clock_domain{name="slow", frequency=1000}

		nocgen.initiator{name="cpu", max_throughput=2, latency_req=100, pattern="streaming"}
		nocgen.initiator{name="dma", avg_throughput=4, max_throughput=8, priority=1}
		nocgen.target{name="mem", max_bandwidth=tonumber(nocgen.argv.mem_bw), latency=40}

		nocgen.flow{src="cpu", dst="mem", bandwidth=2}
		nocgen.flow{src="dma", dst="mem", bandwidth=8, max_latency=50}

		nocgen.optimize_for("latency")
		nocgen.option("high_bw_threshold", 40)
		nocgen.option("niu_entry_only", true)
	)";
}

TEST_F(LuaApiTest, DescribeNetwork)
{
	lua::init({ {"mem_bw", "25.6"} });
	lua::exec_string(SOC_SCRIPT);

	const Requirements& req = lua::requirements();
	EXPECT_EQ("soc", req.network);
	EXPECT_EQ(2u, req.clock_domains.size());
	EXPECT_DOUBLE_EQ(1000.0, req.clock_domains[1].frequency);

	ASSERT_EQ(2u, req.initiators.size());
	EXPECT_EQ("cpu", req.initiators[0].name);
	EXPECT_DOUBLE_EQ(2.0, req.initiators[0].avg_throughput);
	EXPECT_EQ(100u, req.initiators[0].latency_requirement);
	EXPECT_TRUE(req.initiators[0].traffic_pattern == TrafficPattern::STREAMING);
	EXPECT_DOUBLE_EQ(4.0, req.initiators[1].avg_throughput);
	EXPECT_EQ(1u, req.initiators[1].priority);
	EXPECT_TRUE(req.initiators[1].traffic_pattern == TrafficPattern::BURSTY);

	ASSERT_EQ(1u, req.targets.size());
	EXPECT_DOUBLE_EQ(25.6, req.targets[0].max_bandwidth);
	EXPECT_EQ(40u, req.targets[0].latency);

	ASSERT_EQ(2u, req.flows.size());
	EXPECT_EQ(50u, req.flows[1].max_latency);

	EXPECT_TRUE(req.optimize_for == OptimizeFor::LATENCY);
	EXPECT_DOUBLE_EQ(40.0, lua::options().optimizer.high_bw_threshold);
	EXPECT_TRUE(lua::options().niu_entry_only);

	auto res = run_flow(req, lua::options());
	EXPECT_TRUE(res.ok());
}

TEST_F(LuaApiTest, InitResets)
{
	lua::init({ {"mem_bw", "25.6"} });
	lua::exec_string(SOC_SCRIPT);
	ASSERT_FALSE(lua::requirements().initiators.empty());

	lua::init({});
	EXPECT_TRUE(lua::requirements().initiators.empty());
	EXPECT_TRUE(lua::requirements().network.empty());
	EXPECT_DOUBLE_EQ(FlowOptions().optimizer.high_bw_threshold,
		lua::options().optimizer.high_bw_threshold);

	// No args given, so argv is empty
	EXPECT_EQ("", error_of("assert(next(nocgen.argv) == nil)"));
}

TEST_F(LuaApiTest, ScriptErrors)
{
	lua::init({});

	EXPECT_NE(std::string::npos, error_of("nocgen.initiator{max_throughput=1}").find("'name'"));
	EXPECT_NE(std::string::npos,
		error_of("nocgen.initiator{name='x', max_throughput=1, pattern='wavy'}").find("wavy"));
	EXPECT_NE(std::string::npos,
		error_of("nocgen.target{name='m', max_bandwidth=1, latency=-3}").find("latency"));
	EXPECT_NE(std::string::npos, error_of("nocgen.clock_domain{name='z', frequency=0}").find("z"));
	EXPECT_NE(std::string::npos, error_of("nocgen.optimize_for('fastest')").find("fastest"));
	EXPECT_NE(std::string::npos, error_of("nocgen.option('turbo', 1)").find("turbo"));
	EXPECT_NE(std::string::npos, error_of("nocgen.option('max_arbiter_inputs', 'many')").find("many"));

	// Syntax errors and plain Lua errors come back the same way
	EXPECT_FALSE(error_of("this is not lua").empty());
	EXPECT_NE(std::string::npos, error_of("error('boom')").find("boom"));

	// Nothing half-registered
	EXPECT_TRUE(lua::requirements().initiators.empty());
	EXPECT_TRUE(lua::requirements().targets.empty());
}

TEST_F(LuaApiTest, MissingScript)
{
	lua::init({});
	EXPECT_THROW(lua::exec_script("/nonexistent/script.lua"), Exception);
}

TEST_F(LuaApiTest, NotInitialized)
{
	lua::shutdown();
	EXPECT_THROW(lua::exec_string("x = 1"), Exception);
}

TEST(LuaOptions, SetByName)
{
	FlowOptions opts;

	lua::set_option(opts, "max_arbiter_inputs", "2");
	EXPECT_EQ(2u, opts.optimizer.max_arbiter_inputs);

	lua::set_option(opts, "run_optimizer", "false");
	EXPECT_FALSE(opts.run_optimizer);

	lua::set_option(opts, "crossbar_name", "Fabric");
	EXPECT_EQ("Fabric", opts.generator.crossbar_name);
	EXPECT_EQ("Fabric", opts.optimizer.crossbar_name);

	lua::set_option(opts, "default_frequency", "1500");
	EXPECT_DOUBLE_EQ(1500.0, opts.generator.default_frequency);
	EXPECT_DOUBLE_EQ(1500.0, opts.optimizer.default_frequency);

	lua::set_option(opts, "latency_factor", "3.5");
	EXPECT_DOUBLE_EQ(3.5, opts.sweep.latency_factor);

	EXPECT_THROW(lua::set_option(opts, "warp_speed", "1"), ConfigError);
	EXPECT_THROW(lua::set_option(opts, "max_arbiter_inputs", "2.5"), ConfigError);
	EXPECT_THROW(lua::set_option(opts, "run_optimizer", "maybe"), ConfigError);
	EXPECT_THROW(lua::set_option(opts, "sweep_step", "10x"), ConfigError);
}
