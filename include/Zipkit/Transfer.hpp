// include/Zipkit/Transfer.hpp
#ifndef ZIPKIT_TRANSFER_HPP
#define ZIPKIT_TRANSFER_HPP

#include <Zipkit/Config.hpp>
#include <Zipkit/Error.hpp>
#include <Zipkit/Types/ArchiveEntry.hpp>
#include <Zipkit/Utils/ZipFile.hpp>
#include <Zipkit/Utils/ZipWriter.hpp>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Zipkit {

    // Returns true for base names that must never be packed.
    using ExcludeFilter = std::function<bool(const std::string &name)>;

    // Stats a filesystem path (symlinks followed). Fills size, directory flag and modification time.
    Error statPath(const std::filesystem::path &path, EntryInfo &info);

    // Entry -> file. Creates the parent directories of destRoot/<name>, then streams the member's bytes
    // into a freshly truncated file and restores its stored attributes and modification time.
    // Directory members are the caller's business.
    Error extractEntry(Utils::ZipFile &archive, const Utils::ZipMember &member, const std::filesystem::path &destRoot);

    // Walks the archive in stored order. With an empty selection every member is materialized;
    // otherwise only members whose normalized name is listed. The visitor runs before each
    // materialization and its first failure is returned as is. Created directories get their
    // stored modification time back once everything below them is written.
    Error extractMembers(Utils::ZipFile &archive, const std::filesystem::path &destRoot, const Visitor &visit,
                         const std::vector<std::string> &selectedNames = {});

    // File -> entry. Directories get a zero size "<name>/" header and no content. Files declare
    // info.size up front; a different streamed byte count is reported as SizeMismatch.
    // Attributes come from srcPath unless stored ones are given; info.modified is recorded as is.
    Error packFile(const std::filesystem::path &srcPath, const std::string &recordedName, Utils::ZipWriter &writer,
                   const EntryInfo &info, const std::optional<StoredAttributes> &stored = std::nullopt);

    // Packs the children of srcPath below recordedPrefix, recursing into directories. Iteration
    // order is whatever the filesystem returns.
    Error packDirectory(const std::filesystem::path &srcPath, const std::string &recordedPrefix, Utils::ZipWriter &writer,
                        const Visitor &visit, const ExcludeFilter &exclude);

    // A single file is packed at the archive root. A directory is packed flattened, or under its
    // own base name when includeRootDir is set.
    Error packTreeToWriter(const std::filesystem::path &srcPath, Utils::ZipWriter &writer, const Visitor &visit,
                           bool includeRootDir, const ExcludeFilter &exclude);

    // Creates (or truncates) destPath and packs srcPath into it.
    Error packToFunc(const std::filesystem::path &srcPath, const std::filesystem::path &destPath, const Visitor &visit,
                     bool includeRootDir = false, const Config &config = Config{});

    // packToFunc with the logging visitor chosen by config.verbose.
    Error packTo(const std::filesystem::path &srcPath, const std::filesystem::path &destPath,
                 bool includeRootDir = false, const Config &config = Config{});

} // namespace Zipkit

#endif // ZIPKIT_TRANSFER_HPP
