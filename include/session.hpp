// Session is the template engine: a template directory, a parsed-template cache, a filter registry, an error handler and a Lua state.
// Sessions are independent of each other, so several configurations (different roots, different filters) can coexist.
// Configure a session before rendering with it; once configured, any number of threads can render through it at once.
#pragma once
#include <defs.h>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <functional>
#include <value.hpp>
#include <filters.hpp>
#include <templatecache.hpp>
#include <template.hpp>
#include <lua.hpp>


typedef std::function<std::string(const std::string& message)> ErrorHandler;

std::string defaultErrorHandler(const std::string& message); // logs, and returns <!-- Template error: message -->


class Session {
    std::recursive_mutex m_mutex; // serialises the Lua state. recursive, because Lua filters can call stencil.filter()
    std::string templateDir;
    TemplateCache cache;
    FilterRegistry filterRegistry;
    ErrorHandler errorHandler;
    bool debugMode = false;
    int maxNesting = STENCIL_DEFAULT_MAX_NESTING;
    lua_State* lua = NULL;
    std::map<std::string, int> luaRefs; // registry references of the Lua filter functions, by filter name

    std::string renderRoot(const Template& tmpl, const Context& context, const std::string& dir,
                           const std::string& rootPath, std::vector<std::string>* diagnostics);

public:
    Session(std::string dir = "");

    Session(const Session&) = delete;

    ~Session();

    // configuration
    void setTemplateDir(std::string dir); // back-slashes become slashes, a trailing slash is dropped. a missing directory is only a warning

    const std::string& getTemplateDir() const;

    void setDebug(bool on); // traces includes and cache activity to stderr

    bool debug() const;

    void setMaxNesting(int depth);

    int getMaxNesting() const;

    // filters
    void registerFilter(const std::string& name, FilterFunction filter); // replaces any filter with the same name

    bool hasFilter(const std::string& name) const;

    const FilterRegistry& filters() const;

    bool registerLuaFilter(const std::string& name, const std::string& source); // false (and a log line) if the chunk doesn't compile or return a function

    bool registerLuaFilterFile(const std::string& name, const std::string& path);

    // errors
    void setErrorHandler(ErrorHandler handler); // an empty handler restores the default

    void resetErrorHandler();

    std::string handleError(const std::string& message) const;

    // cache
    TemplateCache& templateCache();

    CacheStats cacheStats();

    void clearCache();

    void setCacheEnabled(bool on);

    void setMaxCacheSize(size_t size);

    std::shared_ptr<Template> load(const std::string& path, std::string& error); // through the cache

    // templates. the render functions never throw: top-level failures come back as the error handler's output,
    // everything else as inline <!-- --> markers (also listed in *diagnostics, when it's given)
    std::shared_ptr<Template> compile(const char* source, std::string* error = NULL); // NULL source gives an empty pointer

    std::string render(const std::shared_ptr<Template>& tmpl, const Context& context, std::vector<std::string>* diagnostics = NULL);

    std::string renderString(const char* source, const Context& context, std::vector<std::string>* diagnostics = NULL);

    std::string renderString(const std::string& source, const Context& context, std::vector<std::string>* diagnostics = NULL);

    std::string renderFile(const std::string& path, const Context& context, std::vector<std::string>* diagnostics = NULL);

    std::string renderTemplate(const std::string& name, const Context& context, std::vector<std::string>* diagnostics = NULL);
    // name is relative to the template directory

    void lock(); // forwards to m_mutex

    void unlock(); // ditto
};
