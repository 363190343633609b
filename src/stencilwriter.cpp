#include <stencilwriter.hpp>
#include <unistd.h>
#include <cerrno>
#include <cstring>


FileWriteOutput::FileWriteOutput(int fd) {
    file = fd;
}

void FileWriteOutput::write(const char* data, size_t length) {
    while (length > 0) {
        size_t writeSize = BufferSize - bufferPos; // the space remaining
        if (writeSize > length) {
            writeSize = length;
        }
        if (writeSize == 0) {
            flush();
        }
        else {
            memcpy(buffer + bufferPos, data, writeSize);
            bufferPos += writeSize;
            data += writeSize;
            length -= writeSize;
        }
    }
}

bool FileWriteOutput::flush() {
    size_t done = 0;
    while (done < bufferPos) {
        ssize_t r = ::write(file, buffer + done, bufferPos - done);
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            fprintf(stderr, ERROR "Couldn't write output: %s\n", strerror(errno));
            failed = true;
            break;
        }
        done += r;
    }
    bufferPos = 0;
    return !failed;
}

FileWriteOutput::~FileWriteOutput() {
    flush();
    if (file > STDERR_FILENO) {
        ::close(file);
    }
}

void StringWriteOutput::write(const char* data, size_t length) {
    content.append(data, length);
}


StencilWriter::StencilWriter(WriteOutput& out) : output(out) {}

void StencilWriter::write(const char* data, size_t length) {
    output.write(data, length);
}

void StencilWriter::write(const std::string& data) {
    write(data.c_str(), data.size());
}

void StencilWriter::diagnostic(const std::string& message) {
    diagnostics.push_back(message);
    write("<!-- " + message + " -->");
}
