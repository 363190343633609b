#include <luafilters.hpp>
#include <session.hpp>
#include <util.hpp>
#include <exception>


static int stencil_filter(lua_State* L) { // stencil.filter(name, value, ...)
    Session* session = (Session*)lua_touserdata(L, lua_upvalueindex(1));
    const char* name = luaL_checkstring(L, 1);
    try { // C++ objects have to be gone before lua_error unwinds past this frame
        Value value = toValue(L, 2);
        std::vector<Value> args;
        for (int i = 3; i <= lua_gettop(L); i ++) {
            args.push_back(toValue(L, i));
        }
        pushValue(L, session -> filters().apply(name, value, args));
        return 1;
    }
    catch (const std::exception& e) { // a C++ filter threw; hand it to Lua as an ordinary error
        lua_pushstring(L, e.what());
    }
    return lua_error(L);
}


lua_State* newLuaState(Session* session) {
    lua_State* L = luaL_newstate();
    if (L == NULL) {
        fprintf(stderr, ERROR "Couldn't create a Lua state; Lua filters are unavailable.\n");
        return NULL;
    }
    luaL_openlibs(L);
    lua_createtable(L, 0, 1); // "stencil" table
    lua_pushlightuserdata(L, session);
    lua_pushcclosure(L, stencil_filter, 1);
    lua_setfield(L, -2, "filter");
    lua_setglobal(L, "stencil");
    return L;
}


void pushValue(lua_State* L, const Value& value) {
    switch (value.type) {
        case Value::Null:
            lua_pushnil(L);
            break;
        case Value::Boolean:
            lua_pushboolean(L, value.boolean);
            break;
        case Value::Number:
            lua_pushnumber(L, value.number);
            break;
        case Value::String:
            lua_pushlstring(L, value.string.c_str(), value.string.size());
            break;
        case Value::Sequence:
            lua_createtable(L, value.size(), 0);
            for (size_t i = 0; i < value.size(); i ++) {
                pushValue(L, (*value.sequence)[i]);
                lua_rawseti(L, -2, i + 1);
            }
            break;
        case Value::Mapping:
            lua_createtable(L, 0, value.size());
            for (auto& entry : *value.mapping) {
                pushValue(L, entry.second);
                lua_setfield(L, -2, entry.first.c_str());
            }
            break;
    }
}


static Value toValueDepth(lua_State* L, int index, int depth) {
    if (index < 0 && index > LUA_REGISTRYINDEX) { // relative indices shift as we push, so pin them down
        index = lua_gettop(L) + index + 1;
    }
    switch (lua_type(L, index)) {
        case LUA_TBOOLEAN:
            return Value((bool)lua_toboolean(L, index));
        case LUA_TNUMBER:
            return Value((double)lua_tonumber(L, index));
        case LUA_TSTRING: {
            size_t length;
            const char* s = lua_tolstring(L, index, &length);
            return Value(std::string(s, length));
        }
        case LUA_TTABLE: {
            if (depth >= 32) {
                return Value();
            }
            size_t length = lua_objlen(L, index);
            if (length > 0) {
                Value ret = Value::list();
                for (size_t i = 1; i <= length; i ++) {
                    lua_rawgeti(L, index, i);
                    ret.push(toValueDepth(L, -1, depth + 1));
                    lua_pop(L, 1);
                }
                return ret;
            }
            Value ret = Value::map();
            lua_pushnil(L);
            while (lua_next(L, index) != 0) {
                std::string key;
                if (lua_type(L, -2) == LUA_TSTRING) {
                    key = lua_tostring(L, -2);
                }
                else if (lua_type(L, -2) == LUA_TNUMBER) {
                    key = formatNumber(lua_tonumber(L, -2)); // lua_tostring would convert the key in place and break lua_next
                }
                else {
                    lua_pop(L, 1);
                    continue;
                }
                ret.set(key, toValueDepth(L, -1, depth + 1));
                lua_pop(L, 1);
            }
            return ret;
        }
        default:
            return Value();
    }
}

Value toValue(lua_State* L, int index) {
    return toValueDepth(L, index, 0);
}
