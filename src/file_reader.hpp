#pragma once
/*
 * FileReader
 *
 * Purpose: read a file via mmap and split it into lines; normalize CRLF.
 * Usage: mmap_readlines(path, out_lines, msg); returns false with msg on failure.
 * Note: a trailing '\n' yields a final empty line, so write_file round-trips it.
 */
#include <filesystem>
#include <string>
#include <vector>

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg);
