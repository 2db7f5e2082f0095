#pragma once

#include <istream>
#include <string>
#include <string_view>
#include <vector>

// Whitespace-separated keys, in input order.
std::vector<std::string> ReadKeys(std::istream& in);

bool IsGzipped(std::string_view path);

// Reads keys from a plain or gzip-compressed file. Compression is detected from the
// file's magic bytes, not its extension.
std::vector<std::string> LoadKeys(std::string_view path);
