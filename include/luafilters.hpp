// LuaJIT glue for filters written in Lua.
// a Lua filter is a chunk that returns a function f(value, ...). values cross the boundary as nil, booleans, numbers,
// strings and tables (sequences become 1-based arrays). inside Lua, stencil.filter(name, value, ...) calls any registered filter.
#pragma once
#include <lua.hpp>
#include <value.hpp>


lua_State* newLuaState(Session* session); // a fresh state with the standard libraries and the stencil table

void pushValue(lua_State* L, const Value& value);

Value toValue(lua_State* L, int index); // tables nested deeper than 32 levels come back as null
