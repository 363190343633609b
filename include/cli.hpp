// the stencil command line tool, callable without a process of its own.
#pragma once


int stencilMain(int argc, char** argv);
// parses argv (argv[0] is the program name) and renders. returns the exit code:
// 0 on success, 1 when rendering or output fails, 2 on bad usage
