#include "DirectoryScanner.hpp"
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

std::vector<std::string> DirectoryScanner::listSiblings(const fs::path& parent) const {
    std::vector<std::string> names;

    std::error_code ec;
    if (parent.empty() || !fs::is_directory(parent, ec)) {
        return names;
    }

    fs::directory_iterator it(parent, fs::directory_options::skip_permission_denied, ec);
    while (!ec && it != fs::directory_iterator()) {
        std::error_code entryEc;
        if (it->is_directory(entryEc)) {
            names.push_back(it->path().filename().string());
        }
        it.increment(ec);
    }

    std::sort(names.begin(), names.end());
    return names;
}
