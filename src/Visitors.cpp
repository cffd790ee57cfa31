// src/Visitors.cpp
#include <Zipkit/Visitors.hpp>
#include <Zipkit/Utils/Logger.hpp>

namespace Zipkit {

Visitor makeExtractLogVisitor(bool verbose) {
    if (!verbose) {
        return [](const std::string &, const EntryInfo &) { return Error{}; };
    }
    auto logger = Utils::Logger::GetOrCreateLogger("Extract");
    return [logger](const std::string &fullName, const EntryInfo &) {
        logger->info("Unzipping file...{}", fullName);
        return Error{};
    };
}

Visitor makePackLogVisitor(bool verbose) {
    if (!verbose) {
        return [](const std::string &, const EntryInfo &) { return Error{}; };
    }
    auto logger = Utils::Logger::GetOrCreateLogger("Pack");
    return [logger](const std::string &fullName, const EntryInfo &info) {
        if (info.isDirectory) {
            logger->info("Adding dir...{}", fullName);
        } else {
            logger->info("Adding file...{}", fullName);
        }
        return Error{};
    };
}

} // namespace Zipkit
