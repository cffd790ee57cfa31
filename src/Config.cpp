// src/Config.cpp
#include <Zipkit/Config.hpp>
#include <algorithm>
#include <fstream>
#include <optional>
#include <stdexcept>

namespace Zipkit {

namespace {

    spdlog::level::level_enum levelFromJson(const json &j, const char *key, spdlog::level::level_enum fallback) {
        if (!j.contains(key) || !j.at(key).is_string()) {
            return fallback;
        }
        // spdlog maps unknown names to "off"
        return spdlog::level::from_str(j.at(key).get<std::string>());
    }

} // namespace

bool Config::isExcluded(const std::string &name) const {
    std::string base = std::filesystem::path(name).filename().string();
    if (base.empty()) {
        // "foo/" has an empty filename component
        base = std::filesystem::path(name).parent_path().filename().string();
    }
    return std::find(excludeNames.begin(), excludeNames.end(), base) != excludeNames.end();
}

Config Config::from_json(const json &j, std::vector<std::string> *problems) {
    Config config;
    std::vector<std::string> rejected;
    auto reject = [&rejected](const std::string &key, const std::string &why) {
        rejected.push_back("\"" + key + "\" " + why);
    };

    if (!j.is_object()) {
        reject("(root)", "is not an object");
    }

    if (j.contains("verbose")) {
        if (j.at("verbose").is_boolean()) config.verbose = j.at("verbose").get<bool>();
        else reject("verbose", "must be a boolean");
    }
    if (j.contains("scratchRoot")) {
        if (j.at("scratchRoot").is_string()) config.scratchRoot = j.at("scratchRoot").get<std::string>();
        else reject("scratchRoot", "must be a string");
    }

    if (j.contains("excludeNames")) {
        const auto &names = j.at("excludeNames");
        bool allStrings = names.is_array() &&
                          std::all_of(names.begin(), names.end(), [](const json &item) { return item.is_string(); });
        if (allStrings) {
            config.excludeNames.clear();
            for (const auto &item : names) {
                config.excludeNames.push_back(item.get<std::string>());
            }
        } else {
            reject("excludeNames", "must be an array of strings");
        }
    }

    // Octal mode given either as a number (420) or a string ("0644")
    if (j.contains("permission")) {
        const auto &perm = j.at("permission");
        std::optional<unsigned long> mode;
        if (perm.is_number_integer() && perm.get<long long>() >= 0) {
            mode = static_cast<unsigned long>(perm.get<long long>());
        } else if (perm.is_string()) {
            const std::string text = perm.get<std::string>();
            std::size_t used = 0;
            try {
                mode = std::stoul(text, &used, 8);
            } catch (const std::logic_error &) {
                mode.reset();
            }
            if (used != text.size()) mode.reset();
        }
        if (mode && *mode <= 07777) {
            config.defaultPermission = static_cast<std::filesystem::perms>(*mode) & std::filesystem::perms::mask;
        } else {
            reject("permission", "must be an octal mode such as \"0644\" or 420");
        }
    }

    if (j.contains("log")) {
        const auto &log = j.at("log");
        if (log.is_object()) {
            if (log.contains("dir")) {
                if (log.at("dir").is_string()) config.log.logDir = log.at("dir").get<std::string>();
                else reject("log.dir", "must be a string");
            }
            if (log.contains("file")) {
                if (log.at("file").is_string()) config.log.logFileName = log.at("file").get<std::string>();
                else reject("log.file", "must be a string");
            }
            config.log.consoleLevel = levelFromJson(log, "consoleLevel", config.log.consoleLevel);
            config.log.fileLevel = levelFromJson(log, "fileLevel", config.log.fileLevel);
        } else {
            reject("log", "must be an object");
        }
    }

    if (problems) {
        problems->insert(problems->end(), rejected.begin(), rejected.end());
    } else if (!rejected.empty()) {
        auto logger = Utils::Logger::GetOrCreateLogger("Config");
        for (const auto &problem : rejected) {
            logger->warn("Ignoring config key {}", problem);
        }
    }
    return config;
}

std::filesystem::path Config::defaultScratchRoot() {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec || dir.empty()) {
        dir = std::filesystem::current_path(ec);
    }
    return (ec || dir.empty()) ? std::filesystem::path(".") : dir;
}

bool Config::loadFromFile(const std::filesystem::path &path, Config &out, std::string *outError) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (outError) {
            *outError = "Cannot open config file: " + path.string();
        }
        return false;
    }

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        if (outError) {
            *outError = "Invalid config file " + path.string() + ": not valid JSON";
        }
        return false;
    }

    std::vector<std::string> problems;
    Config parsed = from_json(j, &problems);
    if (!problems.empty()) {
        if (outError) {
            *outError = "Invalid config file " + path.string() + ": key " + problems.front();
            for (std::size_t i = 1; i < problems.size(); ++i) {
                *outError += ", key " + problems[i];
            }
        }
        return false;
    }
    out = std::move(parsed);
    return true;
}

} // namespace Zipkit
