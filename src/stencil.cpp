/* stencil: render a template file from the command line.

    stencil [-d templateDir] [-o outputFile] [-c name [value]]... [-l name script.lua]... [-n cacheSize] [--no-cache] [-p] [-v] template

    -c adds a context variable (numbers stay numbers, a name with no value is true), -l registers a Lua filter,
    -p prints the parsed block tree instead of rendering, -v traces includes and cache activity to stderr.
    Output goes to stdout unless -o names a file.
*/

#include <cli.hpp>


int main(int argc, char** argv) {
    return stencilMain(argc, argv);
}
