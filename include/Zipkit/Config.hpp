// include/Zipkit/Config.hpp
#ifndef ZIPKIT_CONFIG_HPP
#define ZIPKIT_CONFIG_HPP

#include <Zipkit/Utils/Logger.hpp>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace Zipkit {

    struct Config {
        // Drives the default extract/pack visitors
        bool verbose = true;

        // Parent of the per-session scratch trees used while flushing
        std::filesystem::path scratchRoot = defaultScratchRoot();

        // Base names never packed or added from disk
        std::vector<std::string> excludeNames = {".DS_Store", ".git", ".svn", ".hg"};

        // Mode given to an archive re-written by a flush
        std::filesystem::perms defaultPermission =
                std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
                std::filesystem::perms::group_read | std::filesystem::perms::others_read;

        Utils::LogSettings log;

        bool isExcluded(const std::string &name) const;

        // Keys that are missing or hold the wrong type keep their defaults. Each rejected key is
        // described in problems when it is given.
        static Config from_json(const json &j, std::vector<std::string> *problems = nullptr);

        // The system temp directory, or the working directory when the system has none.
        static std::filesystem::path defaultScratchRoot();

        // Returns false (with a message in outError) when the file is unreadable, not valid JSON,
        // or has a key from_json rejects.
        static bool loadFromFile(const std::filesystem::path &path, Config &out, std::string *outError = nullptr);
    };

} // namespace Zipkit

#endif // ZIPKIT_CONFIG_HPP
