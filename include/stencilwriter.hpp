// StencilWriter is where rendered fragments go. It writes to a WriteOutput (a string or a file) and keeps track of the inline
// diagnostics a render produced, so callers can tell a clean render from one that degraded.
#pragma once
#include <string>
#include <vector>
#include <defs.h>


struct WriteOutput {
    virtual ~WriteOutput() {}

    virtual void write(const char* data, size_t length) = 0;
};


struct FileWriteOutput : WriteOutput {
    const static int BufferSize = 4096; // 4kb buffer
    int file;
    bool failed = false; // set if any write to the file failed
    char buffer[BufferSize]; // buffer to prevent small writes
    size_t bufferPos = 0;

    FileWriteOutput(int fd);

    FileWriteOutput(const FileWriteOutput&) = delete;

    ~FileWriteOutput(); // Destructing a FileWriteOutput will flush the buffer and close the file (unless it's stdout).

    void write(const char* data, size_t length); // load some data into the buffer, and flush the buffer if the data overfills

    bool flush();
};


struct StringWriteOutput : WriteOutput {
    std::string content;

    void write(const char* data, size_t length);
};


struct StencilWriter {
    WriteOutput& output;
    std::vector<std::string> diagnostics;

    StencilWriter(WriteOutput& out);

    void write(const char* data, size_t length);

    void write(const std::string& data);

    void diagnostic(const std::string& message); // renders <!-- message --> and remembers it
};
