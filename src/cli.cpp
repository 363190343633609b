#include <cli.hpp>
#include <defs.h>
#include <fcntl.h>
#include <unistd.h>
#include <string.h>
#include <stdlib.h>
#include <string>
#include <vector>
#include <session.hpp>
#include <stencilwriter.hpp>
#include <util.hpp>


struct ConfigEntry {
    std::string name;
    std::string content;
    bool hasContent;
};

struct LuaEntry {
    std::string name;
    std::string file;
};


static void usage() {
    fprintf(stderr, "Usage: stencil [-d templateDir] [-o outputFile] [-c name [value]]... [-l name script.lua]... [-n cacheSize] [--no-cache] [-p] [-v] template\n");
}


int stencilMain(int argc, char** argv) {
    std::string templateDir;
    std::string outputFile;
    std::string templateFile;
    std::vector<ConfigEntry> config;
    std::vector<LuaEntry> luaFilters;
    long cacheSize = -1;
    bool noCache = false;
    bool printTree = false;
    bool verbose = false;
    bool wasConf = false;
    for (int i = 1; i < argc; i ++) {
        bool needsValue = strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "-o") == 0 || strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "-n") == 0;
        if (needsValue && i + 1 >= argc) {
            fprintf(stderr, ERROR "%s needs an argument\n", argv[i]);
            usage();
            return 2;
        }
        if (strcmp(argv[i], "-d") == 0) {
            i ++;
            templateDir = argv[i];
            wasConf = false;
        }
        else if (strcmp(argv[i], "-o") == 0) {
            i ++;
            outputFile = argv[i];
            wasConf = false;
        }
        else if (strcmp(argv[i], "-c") == 0) {
            i ++;
            config.push_back(ConfigEntry{ argv[i], "", false });
            wasConf = true;
        }
        else if (strcmp(argv[i], "-l") == 0) {
            if (i + 2 >= argc) {
                fprintf(stderr, ERROR "-l needs a filter name and a script\n");
                usage();
                return 2;
            }
            luaFilters.push_back(LuaEntry{ argv[i + 1], argv[i + 2] });
            i += 2;
            wasConf = false;
        }
        else if (strcmp(argv[i], "-n") == 0) {
            i ++;
            double n;
            if (!parseNumber(argv[i], n) || n < 0) {
                fprintf(stderr, ERROR "Bad cache size %s\n", argv[i]);
                return 2;
            }
            cacheSize = n > 1e15 ? 1000000000000000L : (long)n; // far past anything that fits in memory anyway
            wasConf = false;
        }
        else if (strcmp(argv[i], "--no-cache") == 0) {
            noCache = true;
            wasConf = false;
        }
        else if (strcmp(argv[i], "-p") == 0) {
            printTree = true;
            wasConf = false;
        }
        else if (strcmp(argv[i], "-v") == 0) {
            verbose = true;
            wasConf = false;
        }
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            usage();
            return 0;
        }
        else if (templateFile.size() == 0 && !wasConf) {
            templateFile = argv[i];
        }
        else if (wasConf) {
            config[config.size() - 1].content = argv[i];
            config[config.size() - 1].hasContent = true;
            wasConf = false;
        }
        else {
            wasConf = false;
            fprintf(stderr, ERROR "Unexpected argument %s\n", argv[i]);
        }
    }
    if (templateFile.size() == 0) {
        usage();
        return 2;
    }

    Session session(templateDir);
    session.setDebug(verbose);
    if (cacheSize >= 0) {
        session.setMaxCacheSize(cacheSize);
    }
    if (noCache) {
        session.setCacheEnabled(false);
    }
    for (LuaEntry& entry : luaFilters) {
        if (!session.registerLuaFilterFile(entry.name, entry.file)) {
            return 1;
        }
    }
    bool failed = false;
    session.setErrorHandler([&](const std::string& message) {
        failed = true;
        return defaultErrorHandler(message);
    });

    Context context;
    for (ConfigEntry& conf : config) {
        double number;
        if (!conf.hasContent) {
            context[conf.name] = Value(true);
        }
        else if (parseNumber(conf.content, number)) {
            context[conf.name] = Value(number);
        }
        else {
            context[conf.name] = Value(conf.content);
        }
    }

    std::string path = templateDir.size() > 0 && templateFile[0] != '/' && access(templateFile.c_str(), F_OK) != 0
                       ? fconcat(session.getTemplateDir(), templateFile) : templateFile; // bare names are looked up in -d
    if (printTree) {
        std::string error;
        std::shared_ptr<Template> tmpl = session.load(path, error);
        if (!tmpl) {
            fprintf(stderr, ERROR "Can't open %s: %s\n", path.c_str(), error.c_str());
            return 1;
        }
        tmpl -> pTree();
        return 0;
    }

    if (verbose) {
        fprintf(stderr, INFO "Rendering %s to %s.\n", path.c_str(), outputFile.size() > 0 ? outputFile.c_str() : "stdout");
    }
    std::vector<std::string> diagnostics;
    std::string rendered = session.renderFile(path, context, &diagnostics);
    int fd = STDOUT_FILENO;
    if (outputFile.size() > 0) {
        fd = open(outputFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (fd == -1) {
            fprintf(stderr, ERROR "Couldn't open output file %s.\n", outputFile.c_str());
            perror("\topen");
            return 1;
        }
    }
    bool writeFailed;
    {
        FileWriteOutput out(fd);
        StencilWriter writer(out);
        writer.write(rendered);
        writeFailed = !out.flush();
    }
    if (fd != STDOUT_FILENO) {
        close(fd);
    }
    if (diagnostics.size() > 0) {
        fprintf(stderr, WARNING "%s rendered with %zu problem(s):\n", path.c_str(), diagnostics.size());
        for (std::string& d : diagnostics) {
            fprintf(stderr, "\t%s\n", d.c_str());
        }
    }
    return failed || writeFailed ? 1 : 0;
}
