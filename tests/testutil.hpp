// shared helpers for the tests: a scratch directory that cleans up after itself
#pragma once
#include <string>
#include <cstdio>
#include <cstdlib>
#include <ftw.h>
#include <unistd.h>
#include <sys/stat.h>


inline int iterRemove(const char* fpath, const struct stat* sb, int typeflag, struct FTW* ftwbuf) {
    return remove(fpath);
}


struct TempDir {
    std::string path;

    TempDir() {
        char pattern[] = "/tmp/stencil_testXXXXXX";
        char* made = mkdtemp(pattern);
        path = made != NULL ? made : "";
    }

    ~TempDir() {
        if (path.size() > 0) {
            nftw(path.c_str(), iterRemove, 64, FTW_DEPTH | FTW_PHYS);
        }
    }

    std::string file(const std::string& name) const {
        return path + "/" + name;
    }

    bool write(const std::string& name, const std::string& content) const {
        FILE* f = fopen(file(name).c_str(), "w");
        if (f == NULL) {
            return false;
        }
        bool ok = fwrite(content.data(), 1, content.size(), f) == content.size();
        return fclose(f) == 0 && ok;
    }

    std::string read(const std::string& name) const { // empty if the file can't be opened
        std::string ret;
        FILE* f = fopen(file(name).c_str(), "r");
        if (f == NULL) {
            return ret;
        }
        char buffer[4096];
        size_t got;
        while ((got = fread(buffer, 1, sizeof(buffer), f)) > 0) {
            ret.append(buffer, got);
        }
        fclose(f);
        return ret;
    }
};
