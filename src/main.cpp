// src/main.cpp
#include <Zipkit/Archive.hpp>
#include <Zipkit/Config.hpp>
#include <Zipkit/Transfer.hpp>
#include <Zipkit/Utils/Logger.hpp>
#include <spdlog/spdlog.h> // For spdlog::shutdown()

#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

    void printUsage() {
        std::cerr << "Usage: zipkit [--config FILE] [--quiet] <command> [args]\n"
                  << "  extract ARCHIVE DEST [ENTRY...]\n"
                  << "  pack [--root] SRC ARCHIVE\n"
                  << "  list ARCHIVE\n"
                  << "  add ARCHIVE NAME PATH\n"
                  << "  delete ARCHIVE NAME\n";
    }

    int finish(const Zipkit::Error &err) {
        if (!err.ok()) {
            ZIPKIT_LOG_ERROR("{}", err.describe());
        }
        spdlog::shutdown();
        return err.ok() ? 0 : 1;
    }

    Zipkit::Error runExtract(const Zipkit::Config &config, const std::vector<std::string> &args) {
        if (args.size() < 2) {
            return Zipkit::Error::invalidArgument("extract needs ARCHIVE and DEST");
        }
        Zipkit::Archive archive(config);
        Zipkit::Error err = archive.open(args[0]);
        if (!err.ok()) {
            return err;
        }
        std::vector<std::string> selected(args.begin() + 2, args.end());
        err = archive.extractTo(args[1], selected);
        if (!err.ok()) {
            return err;
        }
        return archive.close();
    }

    Zipkit::Error runPack(const Zipkit::Config &config, std::vector<std::string> args) {
        bool includeRootDir = false;
        if (!args.empty() && args.front() == "--root") {
            includeRootDir = true;
            args.erase(args.begin());
        }
        if (args.size() != 2) {
            return Zipkit::Error::invalidArgument("pack needs SRC and ARCHIVE");
        }
        return Zipkit::packTo(args[0], args[1], includeRootDir, config);
    }

    Zipkit::Error runList(const Zipkit::Config &config, const std::vector<std::string> &args) {
        if (args.size() != 1) {
            return Zipkit::Error::invalidArgument("list needs ARCHIVE");
        }
        Zipkit::Archive archive(config);
        Zipkit::Error err = archive.open(args[0]);
        if (!err.ok()) {
            return err;
        }
        for (const auto &entry : archive.entries()) {
            std::cout << entry.uncompressedSize << "\t" << entry.name << "\n";
        }
        return archive.close();
    }

    Zipkit::Error runAdd(const Zipkit::Config &config, const std::vector<std::string> &args) {
        if (args.size() != 3) {
            return Zipkit::Error::invalidArgument("add needs ARCHIVE, NAME and PATH");
        }
        Zipkit::Archive archive(config);
        Zipkit::Error err = std::filesystem::exists(args[0]) ? archive.open(args[0]) : archive.create(args[0]);
        if (!err.ok()) {
            return err;
        }

        std::error_code ec;
        err = std::filesystem::is_directory(args[2], ec) ? archive.addDir(args[1], args[2])
                                                        : archive.addFile(args[1], args[2]);
        if (!err.ok()) {
            return err;
        }
        return archive.close();
    }

    Zipkit::Error runDelete(const Zipkit::Config &config, const std::vector<std::string> &args) {
        if (args.size() != 2) {
            return Zipkit::Error::invalidArgument("delete needs ARCHIVE and NAME");
        }
        Zipkit::Archive archive(config);
        Zipkit::Error err = archive.open(args[0]);
        if (!err.ok()) {
            return err;
        }
        err = archive.deleteName(args[1]);
        if (!err.ok()) {
            return err;
        }
        return archive.close();
    }

} // namespace

int main(int argc, char* argv[]) {
    Zipkit::Config config;
    std::filesystem::path configPath;
    bool quiet = false;

    int argi = 1;
    for (; argi < argc; ++argi) {
        if (std::strcmp(argv[argi], "--config") == 0 && argi + 1 < argc) {
            configPath = argv[++argi];
        } else if (std::strcmp(argv[argi], "--quiet") == 0) {
            quiet = true;
        } else {
            break;
        }
    }

    std::string configError;
    if (!configPath.empty() && !Zipkit::Config::loadFromFile(configPath, config, &configError)) {
        Zipkit::Utils::Logger::Init(config.log);
        ZIPKIT_LOG_CRITICAL("{}", configError);
        spdlog::shutdown();
        return 1;
    }
    if (quiet) {
        config.verbose = false;
        config.log.consoleLevel = spdlog::level::warn;
    }
    Zipkit::Utils::Logger::Init(config.log);

    if (argi >= argc) {
        printUsage();
        spdlog::shutdown();
        return 1;
    }

    const std::string command = argv[argi];
    std::vector<std::string> args(argv + argi + 1, argv + argc);
    ZIPKIT_LOG_TRACE("Running '{}' with {} argument(s)", command, args.size());

    if (command == "extract") return finish(runExtract(config, args));
    if (command == "pack") return finish(runPack(config, args));
    if (command == "list") return finish(runList(config, args));
    if (command == "add") return finish(runAdd(config, args));
    if (command == "delete") return finish(runDelete(config, args));

    ZIPKIT_LOG_ERROR("Unknown command '{}'", command);
    printUsage();
    spdlog::shutdown();
    return 1;
}
