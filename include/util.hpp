#pragma once
#include <string>
#include <cstdint>
#include <defs.h>

bool isWhitespace(char thing);

std::string trim(const std::string& thing); // strip whitespace off both ends

bool startsWith(const std::string& thing, const std::string& prefix, size_t at = 0);

bool endsWith(const std::string& thing, const std::string& suffix);

bool isQuoted(const std::string& thing); // "..." or '...'

std::string unquote(const std::string& thing); // strips one layer of matching quotes, if there is one

bool parseNumber(const std::string& thing, double& out); // the whole string (minus surrounding whitespace) must be a number

std::string formatNumber(double number); // shortest sensible form: 25, 2.5, -0.125

std::string fconcat(std::string one, std::string two); // sanely glue two filenames together

std::string trim2dir(std::string file); // strip off a filename from a path
// if there's no directory component, returns "."

std::string canonicalPath(const std::string& path); // realpath(), or the path untouched if it can't be resolved
