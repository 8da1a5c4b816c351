#include "utils/FileUtil.hpp"

#include <fstream>
#include <stdexcept>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>

// mkdir -p for everything before the last '/'
static void ensureParentDirs(const std::string& path) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) return;

    std::string dir = path.substr(0, slash);
    std::string current;
    std::size_t pos = 0;
    while (pos <= dir.size()) {
        std::size_t next = dir.find('/', pos);
        if (next == std::string::npos) next = dir.size();
        current = dir.substr(0, next);
        pos = next + 1;
        if (current.empty()) continue;

        if (::mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
            throw std::runtime_error("Cannot create directory " + current + ": " + std::strerror(errno));
        }
    }
}

void writeTextFile(const std::string& path, const std::string& content) {
    ensureParentDirs(path);

    std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open " + path + " for writing");
    }
    out << content;
    if (!out) {
        throw std::runtime_error("Failed writing " + path);
    }
}
