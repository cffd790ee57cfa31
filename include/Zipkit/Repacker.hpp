// include/Zipkit/Repacker.hpp
#ifndef ZIPKIT_REPACKER_HPP
#define ZIPKIT_REPACKER_HPP

#include <Zipkit/Config.hpp>
#include <Zipkit/Error.hpp>
#include <Zipkit/Types/ArchiveEntry.hpp>
#include <Zipkit/Utils/ZipFile.hpp>
#include <Zipkit/Utils/ZipWriter.hpp>
#include <filesystem>
#include <memory>
#include <ostream>
#include <variant>
#include <vector>
#include <spdlog/logger.h>

namespace Zipkit {

    // Where a session's archive lives.
    struct PathBacked {
        std::filesystem::path path;
        std::filesystem::perms permission;
    };

    struct StreamBacked {
        std::ostream *writer; // not owned; null once the session is closed
    };

    using Backing = std::variant<PathBacked, StreamBacked>;

    // Turns a session's logical entry list into a finished archive at the session's destination.
    class Repacker {
    public:
        virtual ~Repacker() = default;

        // entries: the full member list, in order. source: the archive the session was opened
        // from, or null. An implementation may close source; the caller reopens it afterwards.
        // On success a path-backed destination holds exactly entries; on failure it is untouched.
        virtual Error repack(const std::vector<ArchiveEntry> &entries, Utils::ZipFile *source,
                             const Backing &backing) = 0;
    };

    // Whole-archive strategy: stage every entry under a private scratch directory, pack the
    // staged tree in entry order, and swap the result in with an atomic rename.
    class ScratchRepacker : public Repacker {
    public:
        // label names the scratch directory, usually the archive's base name
        ScratchRepacker(const Config &config, const std::string &label);

        Error repack(const std::vector<ArchiveEntry> &entries, Utils::ZipFile *source,
                     const Backing &backing) override;

        const std::filesystem::path &scratchPath() const { return m_scratchPath; }

    private:
        Config m_config;
        std::filesystem::path m_scratchPath;
        std::shared_ptr<spdlog::logger> m_logger;

        // Writes one entry's content below root, from its bound path or from source.
        Error materialize(const ArchiveEntry &entry, Utils::ZipFile *source, const std::filesystem::path &root);
        Error packStaged(const std::vector<ArchiveEntry> &entries, const std::filesystem::path &root,
                         Utils::ZipWriter &writer);
        Error replaceFile(const std::vector<ArchiveEntry> &entries, Utils::ZipFile *source, const PathBacked &target);
        Error writeStream(const std::vector<ArchiveEntry> &entries, const StreamBacked &target);
    };

} // namespace Zipkit

#endif // ZIPKIT_REPACKER_HPP
