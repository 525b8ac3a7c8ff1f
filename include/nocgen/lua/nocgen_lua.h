#pragma once

#include <vector>
#include <string>
#include <lua.hpp>
#include "nocgen/generator.h"

namespace nocgen
{
namespace lua
{
	// Macros for function definition
	#define LFUNC(name) int name(lua_State* L)
	#define LM(name,func) {#name, func}
	#define LGLOBALS(...) nocgen::lua::GlobalsReg s_globals_reg(__VA_ARGS__)

	typedef std::vector<std::pair<const char*, lua_CFunction>> FuncList;

	// Global API functions, collected at static-init time by LGLOBALS and
	// installed into the nocgen table by init()
	class GlobalsReg
	{
	public:
		GlobalsReg(const FuncList& funcs)
		{
			entries().push_back(funcs);
		}

		static std::vector<FuncList>& entries()
		{
			static std::vector<FuncList> s_entries;
			return s_entries;
		}
	};

	// Init/shutdown. Args end up in the nocgen.argv table.
	using ArgsVec = std::vector<std::pair<std::string, std::string>>;
	void init(const ArgsVec&);
	void shutdown();

	// utility
	lua_State* get_state();
	void exec_script(const std::string& filename);
	void exec_string(const std::string& code);
	void pcall_top(int nargs, int nret);
	void lerror(const std::string& what);

	// What the script described. Reset by init().
	Requirements& requirements();
	FlowOptions& options();

	// Sets a FlowOptions field by name from its string form.
	// Throws ConfigError for unknown names or unparseable values.
	void set_option(FlowOptions& opts, const std::string& name, const std::string& value);
}
}
