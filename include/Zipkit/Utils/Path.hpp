// include/Zipkit/Utils/Path.hpp
#ifndef ZIPKIT_PATH_UTIL_HPP
#define ZIPKIT_PATH_UTIL_HPP

#include <algorithm>
#include <filesystem>
#include <string>

namespace Zipkit::Utils {

    inline std::string normalizeSlashes(std::string path) {
        std::replace(path.begin(), path.end(), '\\', '/');
        return path;
    }

    inline std::string trimTrailingSlash(std::string name) {
        while (!name.empty() && name.back() == '/') {
            name.pop_back();
        }
        return name;
    }

    // Maps a slash separated entry name below root. "a/b/" and "a/b" resolve to the same directory.
    inline std::filesystem::path entryPath(const std::filesystem::path &root, const std::string &name) {
        return root / std::filesystem::path(trimTrailingSlash(name)).make_preferred();
    }

    // Rejects absolute names and any ".." component so an entry can never land outside its root
    inline bool isSafeEntryName(const std::string &name) {
        std::filesystem::path path(name);
        if (name.empty() || name.front() == '/' || path.is_absolute() || path.has_root_name()) {
            return false;
        }
        for (const auto &part : path) {
            if (part.string() == "..") {
                return false;
            }
        }
        return true;
    }

} // namespace Zipkit::Utils

#endif // ZIPKIT_PATH_UTIL_HPP
