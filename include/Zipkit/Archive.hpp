// include/Zipkit/Archive.hpp
#ifndef ZIPKIT_ARCHIVE_HPP
#define ZIPKIT_ARCHIVE_HPP

#include <Zipkit/Config.hpp>
#include <Zipkit/Error.hpp>
#include <Zipkit/Repacker.hpp>
#include <Zipkit/Types/ArchiveEntry.hpp>
#include <Zipkit/Utils/ZipFile.hpp>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace Zipkit {

    /**
     * A mutable view over one ZIP archive.
     *
     * The entry list can be edited freely in memory (addFile, addDir, addEmptyDir, delete*).
     * Nothing reaches the archive until flush(), which rebuilds the whole archive from the
     * current entry list. close() flushes and then releases the archive.
     *
     * A session is either path-backed (open/create) or stream-backed (constructed with an
     * std::ostream, write only). Sessions are not thread safe.
     */
    class Archive {
    public:
        explicit Archive(Config config = Config{});
        // Stream-backed session. The stream must outlive the session.
        explicit Archive(std::ostream &writer, Config config = Config{});
        ~Archive();

        Archive(const Archive &) = delete;
        Archive &operator=(const Archive &) = delete;

        // Opens an existing archive. The entry list mirrors its members. permission is the mode
        // given to the file when a flush rewrites it (config().defaultPermission if omitted).
        Error open(const std::filesystem::path &path);
        Error open(const std::filesystem::path &path, std::filesystem::perms permission);

        // Writes an empty archive at path (creating parent directories) and opens it.
        Error create(const std::filesystem::path &path);
        Error create(const std::filesystem::path &path, std::filesystem::perms permission);

        // Entry names in member order, limited to those starting with one of prefixes if any are given.
        std::vector<std::string> listNames(const std::vector<std::string> &prefixes = {}) const;

        const std::vector<ArchiveEntry> &entries() const { return m_files; }
        size_t entryCount() const { return m_files.size(); }

        // Adds a directory marker and any missing parent markers. Returns false if it already exists.
        bool addEmptyDir(const std::string &dirPath);

        // Adds or rebinds the entry name to the regular file at absPath. Excluded names are skipped.
        Error addFile(const std::string &name, const std::filesystem::path &absPath);

        // Adds dirPath and, recursively, everything below absPath.
        Error addDir(const std::string &dirPath, const std::filesystem::path &absPath);

        Error deleteIndex(size_t index);
        Error deleteName(const std::string &name);

        // Extract the archive as it is on disk (pending changes need a flush() first).
        Error extractTo(const std::filesystem::path &destRoot, const std::vector<std::string> &selectedNames = {});
        Error extractToFunc(const std::filesystem::path &destRoot, const Visitor &visit,
                            const std::vector<std::string> &selectedNames = {});

        // Rebuilds the archive from the entry list if anything changed.
        Error flush();

        // flush(), then release the archive. On a failed flush the session stays open and dirty.
        Error close();

        bool isOpen() const;
        bool hasChanged() const { return m_hasChanged; }
        bool isStreamBacked() const { return std::holds_alternative<StreamBacked>(m_backing); }

        // Backing archive path; empty for stream-backed sessions.
        std::filesystem::path fileName() const;

        const Config &config() const { return m_config; }
        std::string getLastError() const { return m_lastErrorMsg; }

    private:
        Config m_config;
        Backing m_backing;
        std::unique_ptr<Utils::ZipFile> m_reader;
        std::unique_ptr<Repacker> m_repacker;
        std::vector<ArchiveEntry> m_files;
        bool m_hasChanged = false;
        std::shared_ptr<spdlog::logger> m_logger;
        std::string m_lastErrorMsg;

        bool hasLiveSource() const;
        Error openReader(const std::filesystem::path &path);
        Error reload();
        Error fail(Error err);
        std::vector<ArchiveEntry>::iterator findEntry(const std::string &name);
    };

} // namespace Zipkit

#endif // ZIPKIT_ARCHIVE_HPP
