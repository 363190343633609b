// "view" a memory map
// provides reference counted unmapping, fancy buffer-ey functions, view slicing, etc

#include <mapview.hpp>
#include <fcntl.h>
#include <defs.h>
#include <sys/stat.h>
#include <sys/mman.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>


void MapView::init(int file, char* mm, size_t size, bool isMapped) {
    map = mm;
    length = size;
    start = 0;
    end = length;
    fd = file;
    mapped = isMapped;
}

MapView::MapView(std::string filename) {
    rCount = new int(1);
    init(-1, NULL, 0, false);
    valid = false;
    int file = open(filename.c_str(), O_RDONLY);
    if (file == -1) {
        reason = strerror(errno);
        return;
    }
    fd = file; // so when the destructor runs it gets closed properly
    struct stat sb;
    if (fstat(file, &sb)) {
        reason = strerror(errno);
        return;
    }
    if (S_ISDIR(sb.st_mode)) {
        reason = strerror(EISDIR);
        return;
    }
    if (sb.st_size == 0) { // empty templates are legal, they just render to nothing. mmap refuses zero-length maps
        valid = true;
        return;
    }
    char* mm = (char*)mmap(0, sb.st_size, PROT_READ, MAP_SHARED, file, 0);
    if (mm == MAP_FAILED) {
        reason = strerror(errno);
        fprintf(stderr, ERROR "Can't load %s for memory mapping!\n", filename.c_str());
        return;
    }
    init(file, mm, sb.st_size, true);
    valid = true;
}

MapView::MapView(char* buffer, size_t size) : valid(true) {
    rCount = new int(1);
    init(-1, buffer, size, false);
}

MapView MapView::fromString(const std::string& data) {
    char* copy = NULL;
    if (data.size() > 0) {
        copy = new char[data.size()];
        memcpy(copy, data.data(), data.size());
    }
    return MapView(copy, data.size());
}

MapView::MapView(const MapView& m) : map(m.map), length(m.length), start(m.start), end(m.end), rCount(m.rCount),
                                     fd(m.fd), mapped(m.mapped), valid(m.valid), reason(m.reason) {
    (*rCount) ++;
}

MapView& MapView::operator=(const MapView& m) {
    if (this == &m) {
        return *this;
    }
    (*m.rCount) ++;
    release();
    map = m.map;
    length = m.length;
    start = m.start;
    end = m.end;
    rCount = m.rCount;
    fd = m.fd;
    mapped = m.mapped;
    valid = m.valid;
    reason = m.reason;
    return *this;
}

void MapView::release() {
    (*rCount) --;
    if (*rCount == 0) {
        delete rCount;
        if (map != NULL) {
            if (mapped) {
                munmap(map, length);
            }
            else {
                delete[] map;
            }
        }
        if (fd != -1) {
            close(fd);
        }
    }
    rCount = NULL;
}

MapView::~MapView() {
    release();
}

bool MapView::isValid() const {
    return valid;
}

const std::string& MapView::error() const {
    return reason;
}

char MapView::operator[](int64_t n) const {
    if (len() == 0) {
        return 0;
    }
    if (n < 0) {
        n = len() + (n % len());
        if (n == len()) {
            n = 0;
        }
    }
    if (n >= len()) {
        return 0;
    }
    return map[start + n];
}

void MapView::operator++(int) {
    if (start < end) {
        start ++;
    }
}

void MapView::operator+=(size_t n) {
    start += n;
    if (start > end) {
        start = end;
    }
}

int64_t MapView::len() const {
    return end - start;
}

MapView MapView::slice(size_t from, size_t len) const {
    MapView ret(*this);
    ret.start = start + from;
    if (ret.start > end) {
        ret.start = end;
    }
    ret.end = ret.start + len;
    if (ret.end > end) {
        ret.end = end;
    }
    return ret;
}

std::string MapView::toString() const {
    if (map == NULL) {
        return "";
    }
    return std::string(map + start, end - start);
}

bool MapView::cmp(const char* cmp, size_t at) const {
    size_t cmpLen = strlen(cmp);
    if (at > (size_t)len() || (size_t)len() - at < cmpLen) {
        return false;
    }
    return memcmp(map + start + at, cmp, cmpLen) == 0;
}

int64_t MapView::find(const char* needle, size_t from) const {
    size_t needleLen = strlen(needle);
    if (needleLen == 0 || (size_t)len() < needleLen) {
        return -1;
    }
    for (size_t i = from; i + needleLen <= (size_t)len(); i ++) {
        if (map[start + i] == needle[0] && memcmp(map + start + i, needle, needleLen) == 0) {
            return i;
        }
    }
    return -1;
}

const char* MapView::cbuf() const {
    return map == NULL ? "" : (map + start);
}
