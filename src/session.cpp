#include <session.hpp>
#include <luafilters.hpp>
#include <mapview.hpp>
#include <util.hpp>
#include <sys/stat.h>
#include <ctime>
#include <exception>


std::string defaultErrorHandler(const std::string& message) {
    fprintf(stderr, ERROR "Template error: %s\n", message.c_str());
    return "<!-- Template error: " + message + " -->";
}


Session::Session(std::string dir) : errorHandler(defaultErrorHandler) {
    if (dir.size() > 0) {
        setTemplateDir(dir);
    }
    lua = newLuaState(this);
}

Session::~Session() {
    if (lua != NULL) {
        lua_close(lua);
    }
}

void Session::setTemplateDir(std::string dir) {
    for (char& c : dir) {
        if (c == '\\') {
            c = '/';
        }
    }
    if (dir.size() > 1 && dir[dir.size() - 1] == '/') {
        dir.pop_back();
    }
    struct stat sb;
    if (stat(dir.c_str(), &sb) != 0 || !S_ISDIR(sb.st_mode)) {
        fprintf(stderr, WARNING "Template directory %s does not exist (yet).\n", dir.c_str());
    }
    templateDir = dir;
}

const std::string& Session::getTemplateDir() const {
    return templateDir;
}

void Session::setDebug(bool on) {
    debugMode = on;
    cache.setTracing(on);
}

bool Session::debug() const {
    return debugMode;
}

void Session::setMaxNesting(int depth) {
    maxNesting = depth > 0 ? depth : 1;
}

int Session::getMaxNesting() const {
    return maxNesting;
}

void Session::registerFilter(const std::string& name, FilterFunction filter) {
    filterRegistry.add(name, filter);
}

bool Session::hasFilter(const std::string& name) const {
    return filterRegistry.has(name);
}

const FilterRegistry& Session::filters() const {
    return filterRegistry;
}

static const char* luaError(lua_State* L) { // error({}) and friends leave something that isn't a string
    const char* message = lua_tostring(L, -1);
    return message != NULL ? message : "(non-string error)";
}

bool Session::registerLuaFilter(const std::string& name, const std::string& source) {
    if (lua == NULL) {
        return false;
    }
    std::lock_guard<std::recursive_mutex> guard(m_mutex);
    std::string chunkName = "=filter " + name;
    if (luaL_loadbuffer(lua, source.c_str(), source.size(), chunkName.c_str()) != 0 || lua_pcall(lua, 0, 1, 0) != 0) {
        fprintf(stderr, ERROR "Lua filter %s didn't load:\n\t%s\n", name.c_str(), luaError(lua));
        lua_pop(lua, 1);
        return false;
    }
    if (!lua_isfunction(lua, -1)) {
        fprintf(stderr, ERROR "Lua filter %s must return a function, not a %s.\n", name.c_str(), luaL_typename(lua, -1));
        lua_pop(lua, 1);
        return false;
    }
    int ref = luaL_ref(lua, LUA_REGISTRYINDEX);
    auto old = luaRefs.find(name);
    if (old != luaRefs.end()) {
        luaL_unref(lua, LUA_REGISTRYINDEX, old -> second);
    }
    luaRefs[name] = ref;
    filterRegistry.add(name, [this, name, ref](const Value& value, const std::vector<Value>& args) {
        std::lock_guard<std::recursive_mutex> guard(m_mutex);
        lua_rawgeti(lua, LUA_REGISTRYINDEX, ref);
        pushValue(lua, value);
        for (const Value& arg : args) {
            pushValue(lua, arg);
        }
        if (lua_pcall(lua, 1 + args.size(), 1, 0) != 0) {
            fprintf(stderr, ERROR "Lua filter %s failed:\n\t%s\n", name.c_str(), luaError(lua));
            lua_pop(lua, 1);
            return value;
        }
        Value ret = toValue(lua, -1);
        lua_pop(lua, 1);
        return ret;
    });
    return true;
}

bool Session::registerLuaFilterFile(const std::string& name, const std::string& path) {
    MapView script(path);
    if (!script.isValid()) {
        fprintf(stderr, ERROR "Can't read Lua filter %s from %s: %s\n", name.c_str(), path.c_str(), script.error().c_str());
        return false;
    }
    return registerLuaFilter(name, script.toString());
}

void Session::setErrorHandler(ErrorHandler handler) {
    if (handler) {
        errorHandler = handler;
    }
    else {
        errorHandler = defaultErrorHandler;
    }
}

void Session::resetErrorHandler() {
    errorHandler = defaultErrorHandler;
}

std::string Session::handleError(const std::string& message) const {
    return errorHandler(message);
}

TemplateCache& Session::templateCache() {
    return cache;
}

CacheStats Session::cacheStats() {
    return cache.stats();
}

void Session::clearCache() {
    cache.clear();
}

void Session::setCacheEnabled(bool on) {
    cache.setEnabled(on);
}

void Session::setMaxCacheSize(size_t size) {
    cache.setMaxSize(size);
}

std::shared_ptr<Template> Session::load(const std::string& path, std::string& error) {
    return cache.getOrParse(path, error);
}

std::shared_ptr<Template> Session::compile(const char* source, std::string* error) {
    if (source == NULL) {
        if (error != NULL) {
            *error = "Cannot compile a nil template string";
        }
        return std::shared_ptr<Template>();
    }
    return parseTemplate(std::string(source));
}

std::string Session::renderRoot(const Template& tmpl, const Context& context, const std::string& dir,
                                const std::string& rootPath, std::vector<std::string>* diagnostics) {
    Context scope = context;
    time_t now = time(NULL);
    struct tm parts;
    char year[16] = "";
    char date[32] = "";
    if (localtime_r(&now, &parts) != NULL) {
        strftime(year, sizeof(year), "%Y", &parts);
        strftime(date, sizeof(date), "%Y-%m-%d", &parts);
    }
    // ambient keys go in after the caller's context is captured, so they win over caller keys of the same name
    scope["current_year"] = Value(year);
    scope["current_date"] = Value(date);
    scope["_template_dir"] = Value(dir);

    RenderState state;
    state.session = this;
    state.templateDir = dir;
    state.rootPath = rootPath;
    state.maxNesting = maxNesting;

    StringWriteOutput output;
    StencilWriter writer(output);
    try {
        renderNodes(tmpl.nodes, &writer, scope, state);
    }
    catch (const std::exception& e) {
        return handleError(std::string("Error rendering template: ") + e.what());
    }
    if (diagnostics != NULL) {
        *diagnostics = writer.diagnostics;
    }
    return output.content;
}

std::string Session::render(const std::shared_ptr<Template>& tmpl, const Context& context, std::vector<std::string>* diagnostics) {
    if (!tmpl) {
        return handleError("Nothing to render, the template is not compiled");
    }
    std::string dir = templateDir;
    if (dir.size() == 0 && tmpl -> path.size() > 0) {
        dir = trim2dir(tmpl -> path);
    }
    return renderRoot(*tmpl, context, dir, tmpl -> path.size() > 0 ? canonicalPath(tmpl -> path) : "", diagnostics);
}

std::string Session::renderString(const char* source, const Context& context, std::vector<std::string>* diagnostics) {
    std::string error;
    std::shared_ptr<Template> tmpl = compile(source, &error);
    if (!tmpl) {
        return handleError(error);
    }
    return render(tmpl, context, diagnostics);
}

std::string Session::renderString(const std::string& source, const Context& context, std::vector<std::string>* diagnostics) {
    return render(parseTemplate(source), context, diagnostics);
}

std::string Session::renderFile(const std::string& path, const Context& context, std::vector<std::string>* diagnostics) {
    std::string error;
    std::shared_ptr<Template> tmpl = load(path, error);
    if (!tmpl) {
        return handleError("Cannot open template file: " + path + " (" + error + ")");
    }
    return render(tmpl, context, diagnostics);
}

std::string Session::renderTemplate(const std::string& name, const Context& context, std::vector<std::string>* diagnostics) {
    if (templateDir.size() == 0) {
        return handleError("Cannot render " + name + ": template directory not set");
    }
    return renderFile(fconcat(templateDir, name), context, diagnostics);
}

void Session::lock() {
    m_mutex.lock();
}

void Session::unlock() {
    m_mutex.unlock();
}
