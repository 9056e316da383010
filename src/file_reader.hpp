#pragma once
/*
 * FileReader
 *
 * Purpose: read a small text file (the rc file) via mmap and split it into lines; normalize CRLF.
 * Usage: mmap_read_lines(path, out_lines, msg); returns false with msg on failure.
 */
#include <vector>
#include <string>
#include <filesystem>

bool mmap_read_lines(const std::filesystem::path& path,
                     std::vector<std::string>& out_lines,
                     std::string& msg);
