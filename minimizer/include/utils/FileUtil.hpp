#pragma once
#include <string>

// Creates missing parent directories, then replaces the file's content.
// Throws std::runtime_error on failure.
void writeTextFile(const std::string& path, const std::string& content);
