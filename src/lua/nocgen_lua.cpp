#include "nocgen/lua/nocgen_lua.h"
#include "nocgen/log.h"

using namespace nocgen;
using namespace lua;

namespace
{
	// Constants, Lua state
	const char* API_TABLE_NAME = "nocgen";
	const char* API_ARGV_TABLE = "argv";
	lua_State* s_state = nullptr;

	// Lua hooks
	LFUNC(s_panic)
	{
		std::string err = luaL_checkstring(L, -1);
		throw Exception(err);
		return 0;
	}

	LFUNC(s_stacktrace)
	{
		const char* err = luaL_checkstring(L, -1);
		luaL_traceback(L, L, err, 1);
		return 1;
	}

	// Adds a list of CFunctions as key/value pairs to the Lua table at the top of the stack
	void s_register_funclist(const FuncList& flist)
	{
		for (const auto& entry : flist)
		{
			lua_pushcfunction(s_state, entry.second);
			lua_setfield(s_state, -2, entry.first);
		}
	}

	void s_check_state()
	{
		if (!s_state)
			throw Exception("Lua state not initialized");
	}
}

lua_State* lua::get_state()
{
	return s_state;
}

void lua::init(const lua::ArgsVec& argv)
{
	// Start over with a fresh state and a fresh description
	shutdown();
	requirements() = Requirements();
	options() = FlowOptions();

	s_state = luaL_newstate();
	if (!s_state)
		throw Exception("could not create Lua state");

	lua_atpanic(s_state, s_panic);
	luaL_checkversion(s_state);
	luaL_openlibs(s_state);

	// Create the API table and fill it with every registered global function
	lua_newtable(s_state);
	for (auto& entry : GlobalsReg::entries())
	{
		s_register_funclist(entry);
	}

	// With API table still on the stack, create the argv table and populate it
	lua_newtable(s_state);
	for (const auto& kv : argv)
	{
		lua_pushstring(s_state, kv.second.c_str());
		lua_setfield(s_state, -2, kv.first.c_str());
	}

	// Add argv table to API table, then publish the API table
	lua_setfield(s_state, -2, API_ARGV_TABLE);
	lua_setglobal(s_state, API_TABLE_NAME);
}

void lua::shutdown()
{
	if (s_state)
	{
		lua_close(s_state);
		s_state = nullptr;
	}
}

void lua::pcall_top(int nargs, int nret)
{
	s_check_state();

	// Calls the function at the top of the stack, below its arguments.
	// The traceback handler goes underneath the function.
	int base = lua_gettop(s_state) - nargs;
	lua_pushcfunction(s_state, s_stacktrace);
	lua_insert(s_state, base);

	int s = lua_pcall(s_state, nargs, nret, base);
	if (s != LUA_OK)
	{
		std::string err = lua_tostring(s_state, -1) ? lua_tostring(s_state, -1) : "unknown Lua error";
		lua_pop(s_state, 1);
		lua_remove(s_state, base);
		throw Exception(err);
	}

	// Remove stacktrace function.
	lua_remove(s_state, base);
}

void lua::exec_script(const std::string& filename)
{
	s_check_state();

	// Load the file. This pushes one entry on the stack.
	int s = luaL_loadfile(s_state, filename.c_str());
	if (s != LUA_OK)
	{
		std::string err = luaL_checkstring(s_state, -1);
		lua_pop(s_state, 1);
		throw Exception(err);
	}

	// Run the function at the top of the stack (the loaded file)
	pcall_top(0, 0);
}

void lua::exec_string(const std::string& code)
{
	s_check_state();

	int s = luaL_loadstring(s_state, code.c_str());
	if (s != LUA_OK)
	{
		std::string err = luaL_checkstring(s_state, -1);
		lua_pop(s_state, 1);
		throw Exception(err);
	}

	pcall_top(0, 0);
}

void lua::lerror(const std::string& what)
{
	lua_pushstring(s_state, what.c_str());
	lua_error(s_state);
}
