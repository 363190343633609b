// "view" a memory map
// provides reference counted unmapping, fancy buffer-ey functions, view slicing, etc
// a MapView can also wrap a private copy of a string, which is how template strings get lexed the same way template files do
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>


class MapView {
    char* map;
    size_t length; // authoritative length of the WHOLE buffer
    size_t start; // starting position of this MapView's slice of the buffer
    size_t end; // ending position of this MapView's slice of the buffer
    int* rCount; // counts references to the underlying buffer
    int fd; // file descriptor of the map, -1 if this view wraps a string
    bool mapped; // true if map came from mmap (false for strings and empty files)
    bool valid;
    std::string reason; // why this view is invalid, if it is

    void init(int file, char* mm, size_t size, bool isMapped);

    void release();

    MapView(char* buffer, size_t size); // takes ownership of a new[]'d buffer
public:
    MapView(std::string filename); // memory map a file. check isValid()!

    static MapView fromString(const std::string& data);

    MapView(const MapView& m);

    MapView& operator=(const MapView& m);

    ~MapView();

    bool isValid() const;

    const std::string& error() const; // the strerror text for a failed open/stat/mmap

    char operator[](int64_t n) const; // negative indices count from the end. returns 0 when empty

    void operator++(int);

    void operator+=(size_t n);

    int64_t len() const;

    MapView slice(size_t from, size_t len) const;

    std::string toString() const; // COPIES!

    bool cmp(const char* cmp, size_t at = 0) const; // does the view contain cmp at `at`?

    int64_t find(const char* needle, size_t from = 0) const; // offset of needle relative to the start of the view, -1 if it's not there

    const char* cbuf() const; // get the "underlying c buffer"
};
