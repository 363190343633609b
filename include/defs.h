#pragma once
#include <vector>
#include <cstdio>

#define INFO      "\033[32m[   INFO   ]\033[0m "
#define ERROR     "\033[1;31m[   ERROR  ]\033[0m "
#define WARNING   "\033[33m[  WARNING ]\033[0m "
#define CACHE     "\033[34m[   CACHE  ]\033[0m "

#define STENCIL_MAX_INCLUDE_DEPTH  10
#define STENCIL_DEFAULT_CACHE_SIZE 50
#define STENCIL_DEFAULT_MAX_NESTING 100


struct Value; // forward-declarations for everything, so headers don't have to drag each other in
struct Token;
struct Node;
struct BlockNode;
struct Template;
struct RenderState;
struct WriteOutput;
struct StringWriteOutput;
struct FileWriteOutput;
struct StencilWriter;
class MapView;
class FilterRegistry;
class TemplateCache;
class Session;
