// src/Archive.cpp
#include <Zipkit/Archive.hpp>
#include <Zipkit/Transfer.hpp>
#include <Zipkit/Utils/Logger.hpp>
#include <Zipkit/Utils/Path.hpp>
#include <Zipkit/Utils/ZipWriter.hpp>
#include <Zipkit/Visitors.hpp>

#include <algorithm>
#include <type_traits>

namespace Zipkit {

Archive::Archive(Config config)
    : m_config(std::move(config)), m_backing(PathBacked{{}, m_config.defaultPermission}) {
    m_logger = Utils::Logger::GetOrCreateLogger("Archive");
}

Archive::Archive(std::ostream &writer, Config config)
    : m_config(std::move(config)), m_backing(StreamBacked{&writer}) {
    m_logger = Utils::Logger::GetOrCreateLogger("Archive");
    m_repacker = std::make_unique<ScratchRepacker>(m_config, "stream");
}

Archive::~Archive() {
    if (m_hasChanged && hasLiveSource()) {
        m_logger->warn("Session for {} destroyed with unflushed changes; they are discarded.",
                       isStreamBacked() ? std::string("<stream>") : fileName().string());
    }
}

Error Archive::fail(Error err) {
    m_lastErrorMsg = err.describe();
    if (err.kind() == ErrorKind::VisitorAbort) {
        m_logger->info("Stopped by visitor: {}", err.message());
    } else {
        m_logger->error("{}", m_lastErrorMsg);
    }
    return err;
}

bool Archive::hasLiveSource() const {
    return std::visit(
            [this](const auto &backing) -> bool {
                using T = std::decay_t<decltype(backing)>;
                if constexpr (std::is_same_v<T, PathBacked>) {
                    return m_reader && m_reader->isOpen();
                } else {
                    return backing.writer != nullptr;
                }
            },
            m_backing);
}

bool Archive::isOpen() const { return hasLiveSource(); }

std::filesystem::path Archive::fileName() const {
    if (const auto *backing = std::get_if<PathBacked>(&m_backing)) {
        return backing->path;
    }
    return {};
}

Error Archive::openReader(const std::filesystem::path &path) {
    auto reader = std::make_unique<Utils::ZipFile>(path);
    if (!reader->open()) {
        return Error::io(reader->getLastError());
    }
    m_reader = std::move(reader);
    return Error{};
}

Error Archive::reload() {
    std::vector<Utils::ZipMember> members;
    if (!m_reader || !m_reader->members(members)) {
        return Error::io(m_reader ? m_reader->getLastError() : std::string("No archive is open"));
    }

    m_files.clear();
    m_files.reserve(members.size());
    for (auto &member : members) {
        ArchiveEntry entry;
        entry.name = std::move(member.name);
        entry.storedName = std::move(member.storedName);
        entry.uncompressedSize = member.uncompressedSize;
        entry.modified = member.modified;
        entry.stored = member.attributes;
        m_files.push_back(std::move(entry));
    }
    return Error{};
}

Error Archive::open(const std::filesystem::path &path) { return open(path, m_config.defaultPermission); }

Error Archive::open(const std::filesystem::path &path, std::filesystem::perms permission) {
    if (isOpen()) {
        return fail(Error::invalidState("Session is already open"));
    }

    Error err = openReader(path);
    if (!err.ok()) {
        return fail(err);
    }
    err = reload();
    if (!err.ok()) {
        m_reader.reset();
        return fail(err);
    }

    m_backing = PathBacked{path, permission};
    m_repacker = std::make_unique<ScratchRepacker>(m_config, path.filename().string());
    m_hasChanged = false;
    m_logger->info("Opened {} ({} entries)", path.string(), m_files.size());
    return Error{};
}

Error Archive::create(const std::filesystem::path &path) { return create(path, m_config.defaultPermission); }

Error Archive::create(const std::filesystem::path &path, std::filesystem::perms permission) {
    if (isOpen()) {
        return fail(Error::invalidState("Session is already open"));
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return fail(Error::io("Cannot create " + path.parent_path().string() + ": " + ec.message()));
        }
    }

    {
        // An archive with no members is just an end of central directory record
        Utils::ZipWriter writer;
        if (!writer.openFile(path) || !writer.close()) {
            return fail(Error::io(writer.getLastError()));
        }
    }
    std::filesystem::permissions(path, permission, ec);
    if (ec) {
        m_logger->warn("Could not apply permissions to {}: {}", path.string(), ec.message());
    }
    return open(path, permission);
}

std::vector<std::string> Archive::listNames(const std::vector<std::string> &prefixes) const {
    std::vector<std::string> names;
    names.reserve(m_files.size());
    for (const auto &entry : m_files) {
        if (!prefixes.empty() &&
            std::none_of(prefixes.begin(), prefixes.end(), [&entry](const std::string &prefix) {
                return entry.name.compare(0, prefix.size(), prefix) == 0;
            })) {
            continue;
        }
        names.push_back(entry.name);
    }
    return names;
}

std::vector<ArchiveEntry>::iterator Archive::findEntry(const std::string &name) {
    return std::find_if(m_files.begin(), m_files.end(),
                        [&name](const ArchiveEntry &entry) { return entry.name == name; });
}

bool Archive::addEmptyDir(const std::string &dirPath) {
    std::string dir = Utils::trimTrailingSlash(Utils::normalizeSlashes(dirPath));
    if (dir.empty() || !Utils::isSafeEntryName(dir)) {
        return false;
    }
    if (findEntry(dir + "/") != m_files.end()) {
        return false;
    }

    // Parents first so markers precede their children
    auto slash = dir.rfind('/');
    if (slash != std::string::npos) {
        addEmptyDir(dir.substr(0, slash));
    }

    ArchiveEntry entry;
    entry.name = dir + "/";
    entry.modified = std::time(nullptr);
    m_files.push_back(std::move(entry));
    m_hasChanged = true;
    return true;
}

Error Archive::addFile(const std::string &name, const std::filesystem::path &absPath) {
    if (m_config.isExcluded(absPath.filename().string())) {
        m_logger->trace("Skipping excluded file {}", absPath.string());
        return Error{};
    }

    std::string entryName = Utils::normalizeSlashes(name);
    if (entryName.empty() || entryName.back() == '/' || !Utils::isSafeEntryName(entryName)) {
        return fail(Error::invalidArgument("Invalid entry name for a file: '" + name + "'"));
    }

    std::error_code ec;
    auto status = std::filesystem::status(absPath, ec);
    if (!std::filesystem::exists(status)) {
        return fail(Error::notFound("Source file does not exist: " + absPath.string()));
    }
    if (!std::filesystem::is_regular_file(status)) {
        return fail(Error::invalidArgument("Source is not a regular file: " + absPath.string()));
    }

    EntryInfo info;
    Error err = statPath(absPath, info);
    if (!err.ok()) {
        return fail(err);
    }

    auto slash = entryName.rfind('/');
    if (slash != std::string::npos) {
        addEmptyDir(entryName.substr(0, slash));
    }

    auto it = findEntry(entryName);
    if (it != m_files.end()) {
        // Rebind in place, keeping the member's position
        it->absPath = absPath;
        it->uncompressedSize = info.size;
        it->modified = info.modified;
    } else {
        ArchiveEntry entry;
        entry.name = entryName;
        entry.uncompressedSize = info.size;
        entry.modified = info.modified;
        entry.absPath = absPath;
        m_files.push_back(std::move(entry));
    }
    m_hasChanged = true;
    return Error{};
}

Error Archive::addDir(const std::string &dirPath, const std::filesystem::path &absPath) {
    std::error_code ec;
    auto status = std::filesystem::status(absPath, ec);
    if (!std::filesystem::exists(status)) {
        return fail(Error::notFound("Source directory does not exist: " + absPath.string()));
    }
    if (!std::filesystem::is_directory(status)) {
        return fail(Error::invalidArgument("Source is not a directory: " + absPath.string()));
    }

    std::string prefix = Utils::trimTrailingSlash(Utils::normalizeSlashes(dirPath));
    if (!prefix.empty()) {
        addEmptyDir(prefix);
    }

    std::filesystem::directory_iterator it(absPath, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (m_config.isExcluded(name)) {
            continue;
        }
        const std::string recPath = prefix.empty() ? name : prefix + "/" + name;

        std::error_code typeEc;
        Error err = it->is_directory(typeEc) ? addDir(recPath, it->path()) : addFile(recPath, it->path());
        if (!err.ok()) {
            return err;
        }
    }
    if (ec) {
        return fail(Error::io("Cannot list directory " + absPath.string() + ": " + ec.message()));
    }
    return Error{};
}

Error Archive::deleteIndex(size_t index) {
    if (index >= m_files.size()) {
        return fail(Error::invalidArgument("Index " + std::to_string(index) + " out of range of " +
                                           std::to_string(m_files.size()) + " entries"));
    }
    m_files.erase(m_files.begin() + static_cast<std::ptrdiff_t>(index));
    m_hasChanged = true;
    return Error{};
}

Error Archive::deleteName(const std::string &name) {
    auto it = findEntry(Utils::normalizeSlashes(name));
    if (it == m_files.end()) {
        return fail(Error::notFound("Entry with given name not found: " + name));
    }
    return deleteIndex(static_cast<size_t>(it - m_files.begin()));
}

Error Archive::extractTo(const std::filesystem::path &destRoot, const std::vector<std::string> &selectedNames) {
    return extractToFunc(destRoot, makeExtractLogVisitor(m_config.verbose), selectedNames);
}

Error Archive::extractToFunc(const std::filesystem::path &destRoot, const Visitor &visit,
                             const std::vector<std::string> &selectedNames) {
    if (!m_reader || !m_reader->isOpen()) {
        return fail(Error::invalidState("No archive is open for reading"));
    }

    std::filesystem::path dest(Utils::normalizeSlashes(destRoot.string()));
    std::error_code ec;
    std::filesystem::create_directories(dest, ec);
    if (ec) {
        return fail(Error::io("Cannot create " + dest.string() + ": " + ec.message()));
    }

    if (m_config.verbose) {
        m_logger->info("Unzipping {}...", fileName().string());
    }

    std::vector<std::string> selection;
    selection.reserve(selectedNames.size());
    for (const auto &name : selectedNames) {
        selection.push_back(Utils::normalizeSlashes(name));
    }

    Error err = extractMembers(*m_reader, dest, visit, selection);
    if (!err.ok()) {
        return fail(err);
    }
    return Error{};
}

Error Archive::flush() {
    if (!m_hasChanged) {
        return Error{};
    }
    if (!hasLiveSource()) {
        m_logger->warn("Nothing to flush into: the session has no open archive or stream.");
        return Error{};
    }

    m_logger->trace("Flushing {} entries", m_files.size());
    Error err = m_repacker->repack(m_files, m_reader.get(), m_backing);

    return std::visit(
            [&](const auto &target) -> Error {
                using T = std::decay_t<decltype(target)>;
                if constexpr (std::is_same_v<T, PathBacked>) {
                    if (!err.ok()) {
                        // The original archive is intact; make sure it is readable again
                        if (!m_reader || !m_reader->isOpen()) {
                            Error reopen = openReader(target.path);
                            if (!reopen.ok()) {
                                m_logger->error("Could not reopen {}: {}", target.path.string(), reopen.describe());
                            }
                        }
                        return fail(err);
                    }

                    Error reopen = openReader(target.path);
                    if (reopen.ok()) {
                        reopen = reload();
                    }
                    if (!reopen.ok()) {
                        return fail(reopen);
                    }
                } else {
                    if (!err.ok()) {
                        return fail(err);
                    }
                }
                m_hasChanged = false;
                return Error{};
            },
            m_backing);
}

Error Archive::close() {
    Error err = flush();
    if (!err.ok()) {
        return err;
    }

    if (m_reader) {
        m_reader->close();
        m_reader.reset();
    }
    if (auto *stream = std::get_if<StreamBacked>(&m_backing)) {
        stream->writer = nullptr;
    }
    m_logger->trace("Session closed.");
    return Error{};
}

} // namespace Zipkit
