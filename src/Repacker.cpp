// src/Repacker.cpp
#include <Zipkit/Repacker.hpp>
#include <Zipkit/Transfer.hpp>
#include <Zipkit/Utils/Logger.hpp>
#include <Zipkit/Utils/Path.hpp>
#include <Zipkit/Visitors.hpp>

extern "C" {
    #include "mz.h"
    #include "mz_os.h"
}

#include <atomic>
#include <type_traits>

#ifdef _WIN32
#include <process.h>
#define ZIPKIT_GETPID() _getpid()
#else
#include <unistd.h>
#define ZIPKIT_GETPID() getpid()
#endif

namespace Zipkit {

namespace {

    // "<pid>-<n>", distinct for every call within the process
    std::string uniqueSuffix() {
        static std::atomic<unsigned long> counter{0};
        return std::to_string(static_cast<long>(ZIPKIT_GETPID())) + "-" + std::to_string(++counter);
    }

    // Owns the scratch tree for one repack. The tree is removed when the guard goes out of scope.
    class ScratchDirectory {
    public:
        ScratchDirectory(std::filesystem::path path, std::shared_ptr<spdlog::logger> logger)
            : m_path(std::move(path)), m_logger(std::move(logger)) {}

        ~ScratchDirectory() {
            std::error_code ec;
            std::filesystem::remove_all(m_path, ec);
            if (ec) {
                m_logger->warn("Could not remove scratch directory {}: {}", m_path.string(), ec.message());
            } else {
                m_logger->trace("Removed scratch directory {}", m_path.string());
            }
        }

        ScratchDirectory(const ScratchDirectory &) = delete;
        ScratchDirectory &operator=(const ScratchDirectory &) = delete;

        // Clears any leftover from an earlier run and recreates the directory empty.
        Error prepare() {
            std::error_code ec;
            std::filesystem::remove_all(m_path, ec);
            if (ec) {
                return Error::io("Cannot clear scratch directory " + m_path.string() + ": " + ec.message());
            }
            std::filesystem::create_directories(m_path, ec);
            if (ec) {
                return Error::io("Cannot create scratch directory " + m_path.string() + ": " + ec.message());
            }
            return Error{};
        }

    private:
        std::filesystem::path m_path;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace

ScratchRepacker::ScratchRepacker(const Config &config, const std::string &label) : m_config(config) {
    m_logger = Utils::Logger::GetOrCreateLogger("Repacker");
    std::string name = label.empty() ? std::string("archive") : label;
    m_scratchPath = m_config.scratchRoot / "zipkit" / (name + "-" + uniqueSuffix());
}

Error ScratchRepacker::repack(const std::vector<ArchiveEntry> &entries, Utils::ZipFile *source,
                              const Backing &backing) {
    ScratchDirectory scratch(m_scratchPath, m_logger);
    Error err = scratch.prepare();
    if (!err.ok()) {
        return err;
    }

    m_logger->trace("Staging {} entries in {}", entries.size(), m_scratchPath.string());
    for (const auto &entry : entries) {
        err = materialize(entry, source, m_scratchPath);
        if (!err.ok()) {
            return err;
        }
    }

    return std::visit(
            [&](const auto &target) -> Error {
                using T = std::decay_t<decltype(target)>;
                if constexpr (std::is_same_v<T, PathBacked>) {
                    return replaceFile(entries, source, target);
                } else {
                    return writeStream(entries, target);
                }
            },
            backing);
}

Error ScratchRepacker::materialize(const ArchiveEntry &entry, Utils::ZipFile *source,
                                   const std::filesystem::path &root) {
    if (!Utils::isSafeEntryName(entry.name)) {
        return Error::invalidArgument("Entry name escapes the archive root: " + entry.name);
    }

    std::error_code ec;
    std::filesystem::path dest = Utils::entryPath(root, entry.name);
    if (entry.isDirectory()) {
        std::filesystem::create_directories(dest, ec);
        if (ec) {
            return Error::io("Cannot create " + dest.string() + ": " + ec.message());
        }
        return Error{};
    }

    if (entry.isBound()) {
        std::filesystem::create_directories(dest.parent_path(), ec);
        if (ec) {
            return Error::io("Cannot create " + dest.parent_path().string() + ": " + ec.message());
        }
        std::filesystem::copy_file(entry.absPath, dest, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            return Error::io("Cannot copy " + entry.absPath.string() + ": " + ec.message());
        }

        // copy_file leaves the copy with the current time
        time_t modified = 0;
        time_t accessed = 0;
        time_t created = 0;
        if (mz_os_get_file_date(entry.absPath.string().c_str(), &modified, &accessed, &created) != MZ_OK ||
            mz_os_set_file_date(dest.string().c_str(), modified, accessed, created) != MZ_OK) {
            m_logger->warn("Could not carry the modification time of {} over", entry.absPath.string());
        }
        return Error{};
    }

    if (source && source->isOpen()) {
        Utils::ZipMember member;
        member.storedName = entry.storedName.empty() ? entry.name : entry.storedName;
        member.name = entry.name;
        member.uncompressedSize = entry.uncompressedSize;
        member.modified = entry.modified;
        return extractEntry(*source, member, root);
    }

    return Error::invalidState("Entry " + entry.name + " has no content source");
}

Error ScratchRepacker::packStaged(const std::vector<ArchiveEntry> &entries, const std::filesystem::path &root,
                                  Utils::ZipWriter &writer) {
    Visitor visit = makePackLogVisitor(m_config.verbose);
    for (const auto &entry : entries) {
        std::filesystem::path staged = Utils::entryPath(root, entry.name);

        EntryInfo info;
        Error err = statPath(staged, info);
        if (!err.ok()) {
            return err;
        }
        err = visit(staged.generic_string(), info);
        if (!err.ok()) {
            return err;
        }
        // Members carried over from the archive keep their recorded time and attributes; the
        // staged copies only hold their content
        if ((entry.isDirectory() || !entry.isBound()) && entry.modified != 0) {
            info.modified = entry.modified;
        }
        err = packFile(staged, Utils::trimTrailingSlash(entry.name), writer, info,
                       entry.isBound() ? std::nullopt : entry.stored);
        if (!err.ok()) {
            return err;
        }
    }
    return Error{};
}

Error ScratchRepacker::replaceFile(const std::vector<ArchiveEntry> &entries, Utils::ZipFile *source,
                                   const PathBacked &target) {
    std::filesystem::path staging = target.path;
    staging += ".zipkit-" + uniqueSuffix();

    std::error_code ec;
    {
        Utils::ZipWriter writer;
        if (!writer.openFile(staging)) {
            std::filesystem::remove(staging, ec);
            return Error::io(writer.getLastError());
        }
        Error err = packStaged(entries, m_scratchPath, writer);
        if (!writer.close() && err.ok()) {
            err = Error::io(writer.getLastError());
        }
        if (!err.ok()) {
            std::filesystem::remove(staging, ec);
            return err;
        }
    }

    // The reader must let go of the old file before it is replaced
    if (source) {
        source->close();
    }
    std::filesystem::rename(staging, target.path, ec);
    if (ec) {
        Error err = Error::io("Cannot replace " + target.path.string() + ": " + ec.message());
        std::filesystem::remove(staging, ec);
        return err;
    }

    std::filesystem::permissions(target.path, target.permission, ec);
    if (ec) {
        m_logger->warn("Could not apply permissions to {}: {}", target.path.string(), ec.message());
    }
    m_logger->info("Rewrote {} with {} entries", target.path.string(), entries.size());
    return Error{};
}

Error ScratchRepacker::writeStream(const std::vector<ArchiveEntry> &entries, const StreamBacked &target) {
    if (!target.writer) {
        return Error::invalidState("Destination stream is no longer available");
    }

    Utils::ZipWriter writer;
    if (!writer.openStream(*target.writer)) {
        return Error::io(writer.getLastError());
    }
    Error err = packStaged(entries, m_scratchPath, writer);
    if (!err.ok()) {
        // A partial archive never reaches the stream
        writer.abandon();
        return err;
    }
    if (!writer.close()) {
        return Error::io(writer.getLastError());
    }
    m_logger->info("Wrote {} entries to the destination stream", entries.size());
    return Error{};
}

} // namespace Zipkit
