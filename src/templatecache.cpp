#include <templatecache.hpp>
#include <mapview.hpp>


TemplateCache::TemplateCache(size_t max) : maxSize(max) {}

static std::shared_ptr<Template> readTemplate(const std::string& path, std::string& error) {
    MapView map(path);
    if (!map.isValid()) {
        error = map.error();
        return std::shared_ptr<Template>();
    }
    std::shared_ptr<Template> ret = parseTemplate(map);
    ret -> path = path;
    return ret;
}

std::shared_ptr<Template> TemplateCache::getOrParse(const std::string& path, std::string& error) {
    std::lock_guard<std::mutex> guard(m_mutex);
    if (!enabled) {
        return readTemplate(path, error);
    }
    auto found = index.find(path);
    if (found != index.end()) {
        hits ++;
        entries.splice(entries.end(), entries, found -> second); // promote to most recently used
        found -> second -> lastUsed = time(NULL);
        if (tracing) {
            fprintf(stderr, CACHE "Hit: %s\n", path.c_str());
        }
        return found -> second -> value;
    }
    misses ++;
    if (tracing) {
        fprintf(stderr, CACHE "Miss: %s\n", path.c_str());
    }
    std::shared_ptr<Template> parsed = readTemplate(path, error);
    if (!parsed) {
        return parsed;
    }
    entries.push_back(Entry{ path, parsed, time(NULL) });
    index[path] = std::prev(entries.end());
    evict();
    return parsed;
}

void TemplateCache::evict() {
    while (entries.size() > maxSize) {
        if (tracing) {
            fprintf(stderr, CACHE "Evicting %s\n", entries.front().key.c_str());
        }
        index.erase(entries.front().key);
        entries.pop_front(); // trees still being rendered stay alive through their shared_ptr
    }
}

void TemplateCache::reset() {
    entries.clear();
    index.clear();
    hits = 0;
    misses = 0;
}

bool TemplateCache::contains(const std::string& path) {
    std::lock_guard<std::mutex> guard(m_mutex);
    return index.contains(path);
}

void TemplateCache::uncache(const std::string& path) {
    std::lock_guard<std::mutex> guard(m_mutex);
    auto found = index.find(path);
    if (found != index.end()) {
        entries.erase(found -> second);
        index.erase(found);
    }
}

CacheStats TemplateCache::stats() {
    std::lock_guard<std::mutex> guard(m_mutex);
    CacheStats ret;
    ret.hits = hits;
    ret.misses = misses;
    ret.size = entries.size();
    ret.maxSize = maxSize;
    ret.enabled = enabled;
    ret.hitRatio = hits + misses > 0 ? (double)hits / (hits + misses) : 0;
    return ret;
}

void TemplateCache::clear() {
    std::lock_guard<std::mutex> guard(m_mutex);
    reset();
    if (tracing) {
        fprintf(stderr, CACHE "Cleared\n");
    }
}

void TemplateCache::setEnabled(bool on) {
    std::lock_guard<std::mutex> guard(m_mutex);
    enabled = on;
    if (!on) {
        reset();
    }
}

bool TemplateCache::isEnabled() {
    std::lock_guard<std::mutex> guard(m_mutex);
    return enabled;
}

void TemplateCache::setMaxSize(size_t max) {
    std::lock_guard<std::mutex> guard(m_mutex);
    maxSize = max;
    evict();
}

void TemplateCache::setTracing(bool on) {
    std::lock_guard<std::mutex> guard(m_mutex);
    tracing = on;
}
