// LRU cache of parsed templates, keyed by resolved file path. the cache stores trees, not rendered output, so one entry serves
// every context it's rendered with. all operations take the cache lock, and a miss holds it through read + parse + insert + eviction.
#pragma once
#include <string>
#include <list>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <ctime>
#include <defs.h>
#include <template.hpp>


struct CacheStats {
    size_t hits;
    size_t misses;
    size_t size;
    size_t maxSize;
    bool enabled;
    double hitRatio; // hits / (hits + misses), 0 before the first lookup
};


class TemplateCache {
    struct Entry {
        std::string key;
        std::shared_ptr<Template> value;
        time_t lastUsed;
    };

    std::mutex m_mutex;
    std::list<Entry> entries; // least recently used at the front
    std::map<std::string, std::list<Entry>::iterator> index;
    size_t maxSize;
    bool enabled = true;
    bool tracing = false;
    size_t hits = 0;
    size_t misses = 0;

    void evict(); // caller holds the lock

    void reset(); // ditto

public:
    TemplateCache(size_t max = STENCIL_DEFAULT_CACHE_SIZE);

    std::shared_ptr<Template> getOrParse(const std::string& path, std::string& error);
    // an empty pointer means the file couldn't be read; error says why

    bool contains(const std::string& path);

    void uncache(const std::string& path); // drop one entry, e.g. after the file changed

    CacheStats stats();

    void clear(); // empties the cache and zeroes the counters

    void setEnabled(bool on); // disabling also clears

    bool isEnabled();

    void setMaxSize(size_t max); // shrinking evicts immediately

    void setTracing(bool on);
};
