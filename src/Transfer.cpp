// src/Transfer.cpp
#include <Zipkit/Transfer.hpp>
#include <Zipkit/Utils/Logger.hpp>
#include <Zipkit/Utils/Path.hpp>
#include <Zipkit/Visitors.hpp>

extern "C" {
    #include "mz.h"
    #include "mz_os.h"
    #include "mz_zip.h"
}

#include <algorithm>
#include <fstream>
#include <vector>

namespace Zipkit {

namespace {

    constexpr std::size_t kCopyBufferSize = 64 * 1024;

    std::shared_ptr<spdlog::logger> transferLogger() {
        return Utils::Logger::GetOrCreateLogger("Transfer");
    }

    bool isSelected(const std::string &name, const std::vector<std::string> &selectedNames) {
        return std::find(selectedNames.begin(), selectedNames.end(), name) != selectedNames.end();
    }

    std::string baseName(const std::filesystem::path &path) {
        std::filesystem::path normal = path.lexically_normal();
        std::string base = normal.filename().string();
        if (base.empty()) {
            base = normal.parent_path().filename().string();
        }
        return base;
    }

    // Stored attributes converted for this host. False when the archive recorded nothing usable:
    // POSIX-made members keep their mode in the high half, an empty high half means "unknown".
    bool hostAttributes(const StoredAttributes &stored, uint32_t &out) {
        const uint8_t system = MZ_HOST_SYSTEM(stored.versionMadeBy);
        const bool posixMade = system == MZ_HOST_SYSTEM_UNIX || system == MZ_HOST_SYSTEM_OSX_DARWIN ||
                               system == MZ_HOST_SYSTEM_RISCOS;
        if (stored.external == 0 || (posixMade && (stored.external >> 16) == 0)) {
            return false;
        }
        return mz_zip_attrib_convert(system, stored.external, MZ_HOST_SYSTEM(MZ_VERSION_MADEBY), &out) == MZ_OK;
    }

} // namespace

Error statPath(const std::filesystem::path &path, EntryInfo &info) {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return Error::io("Cannot stat " + path.string() + (ec ? ": " + ec.message() : ""));
    }

    info.isDirectory = std::filesystem::is_directory(status);
    info.size = 0;
    if (!info.isDirectory) {
        info.size = std::filesystem::file_size(path, ec);
        if (ec) {
            return Error::io("Cannot read size of " + path.string() + ": " + ec.message());
        }
    }

    time_t modified = 0;
    time_t accessed = 0;
    time_t created = 0;
    if (mz_os_get_file_date(path.string().c_str(), &modified, &accessed, &created) == MZ_OK) {
        info.modified = modified;
    } else {
        info.modified = 0;
    }
    return Error{};
}

Error extractEntry(Utils::ZipFile &archive, const Utils::ZipMember &member, const std::filesystem::path &destRoot) {
    if (!Utils::isSafeEntryName(member.name)) {
        return Error::invalidArgument("Refusing to extract entry outside the destination: " + member.name);
    }

    std::filesystem::path destFile = Utils::entryPath(destRoot, member.name);

    // Create directory before creating the file
    std::error_code ec;
    std::filesystem::create_directories(destFile.parent_path(), ec);
    if (ec) {
        return Error::io("Cannot create directory " + destFile.parent_path().string() + ": " + ec.message());
    }

    std::ofstream out(destFile, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return Error::io("Cannot create file " + destFile.string());
    }

    std::uint64_t copied = 0;
    if (!archive.copyEntry(member.storedName, out, &copied)) {
        return Error::io(archive.getLastError());
    }
    out.close();
    if (out.fail()) {
        return Error::io("Failed to finish writing " + destFile.string());
    }

    uint32_t attributes = 0;
    if (hostAttributes(member.attributes, attributes) &&
        mz_os_set_file_attribs(destFile.string().c_str(), attributes) != MZ_OK) {
        transferLogger()->warn("Could not restore attributes of {}", destFile.string());
    }
    if (member.modified != 0 &&
        mz_os_set_file_date(destFile.string().c_str(), member.modified, member.modified, member.modified) != MZ_OK) {
        transferLogger()->warn("Could not restore modification time of {}", destFile.string());
    }
    transferLogger()->trace("Extracted {} ({} bytes)", member.name, copied);
    return Error{};
}

Error extractMembers(Utils::ZipFile &archive, const std::filesystem::path &destRoot, const Visitor &visit,
                     const std::vector<std::string> &selectedNames) {
    std::vector<Utils::ZipMember> members;
    if (!archive.members(members)) {
        return Error::io(archive.getLastError());
    }

    const bool hasSelection = !selectedNames.empty();
    std::vector<const Utils::ZipMember *> createdDirs;
    for (const auto &member : members) {
        if (hasSelection && !isSelected(member.name, selectedNames)) {
            continue;
        }

        EntryInfo info{member.isDirectory, member.uncompressedSize, member.modified};
        if (visit) {
            Error err = visit(member.name, info);
            if (!err.ok()) {
                return err;
            }
        }

        if (member.isDirectory) {
            if (!Utils::isSafeEntryName(member.name)) {
                return Error::invalidArgument("Refusing to extract entry outside the destination: " + member.name);
            }
            std::error_code ec;
            std::filesystem::path dir = Utils::entryPath(destRoot, member.name);
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                return Error::io("Cannot create directory " + dir.string() + ": " + ec.message());
            }
            createdDirs.push_back(&member);
            continue;
        }

        Error err = extractEntry(archive, member, destRoot);
        if (!err.ok()) {
            return err;
        }
    }

    // Writing the children touched the directory times, so they are restored last
    for (const Utils::ZipMember *created : createdDirs) {
        const Utils::ZipMember &dirMember = *created;
        if (dirMember.modified == 0) {
            continue;
        }
        std::filesystem::path dir = Utils::entryPath(destRoot, dirMember.name);
        if (mz_os_set_file_date(dir.string().c_str(), dirMember.modified, dirMember.modified, dirMember.modified) !=
            MZ_OK) {
            transferLogger()->warn("Could not restore modification time of {}", dir.string());
        }
    }
    return Error{};
}

Error packFile(const std::filesystem::path &srcPath, const std::string &recordedName, Utils::ZipWriter &writer,
               const EntryInfo &info, const std::optional<StoredAttributes> &stored) {
    Utils::EntryHeader header;
    header.isDirectory = info.isDirectory;
    header.modified = info.modified;
    header.declaredSize = info.isDirectory ? 0 : info.size;
    header.name = Utils::normalizeSlashes(recordedName);
    if (info.isDirectory && (header.name.empty() || header.name.back() != '/')) {
        header.name += '/';
    }

    header.stored = stored;
    uint32_t attributes = 0;
    if (!stored && mz_os_get_file_attribs(srcPath.string().c_str(), &attributes) == MZ_OK) {
        header.attributes = attributes;
    }

    if (!writer.beginEntry(header)) {
        return Error::io(writer.getLastError());
    }
    if (info.isDirectory) {
        if (!writer.endEntry()) {
            return Error::io(writer.getLastError());
        }
        return Error{};
    }

    std::ifstream file(srcPath, std::ios::binary);
    if (!file.is_open()) {
        return Error::io("Cannot open " + srcPath.string() + " for reading");
    }

    std::vector<char> buffer(kCopyBufferSize);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = file.gcount();
        if (got > 0 && !writer.writeEntry(buffer.data(), static_cast<std::size_t>(got))) {
            return Error::io(writer.getLastError());
        }
    }
    if (file.bad()) {
        return Error::io("Failed to read " + srcPath.string());
    }

    if (!writer.endEntry()) {
        return Error::io(writer.getLastError());
    }

    if (writer.entryBytesWritten() != header.declaredSize) {
        return Error::sizeMismatch(header.name + ": declared " + std::to_string(header.declaredSize) +
                                   " bytes but streamed " + std::to_string(writer.entryBytesWritten()));
    }
    return Error{};
}

Error packDirectory(const std::filesystem::path &srcPath, const std::string &recordedPrefix, Utils::ZipWriter &writer,
                    const Visitor &visit, const ExcludeFilter &exclude) {
    std::error_code ec;
    std::filesystem::directory_iterator it(srcPath, ec);
    if (ec) {
        return Error::io("Cannot list directory " + srcPath.string() + ": " + ec.message());
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const std::string name = it->path().filename().string();
        if (exclude && exclude(name)) {
            continue;
        }

        const std::filesystem::path curPath = it->path();
        const std::string recPath = recordedPrefix.empty() ? name : recordedPrefix + "/" + name;

        EntryInfo info;
        Error err = statPath(curPath, info);
        if (!err.ok()) {
            return err;
        }
        if (visit) {
            err = visit(curPath.generic_string(), info);
            if (!err.ok()) {
                return err;
            }
        }

        err = packFile(curPath, recPath, writer, info);
        if (!err.ok()) {
            return err;
        }
        if (info.isDirectory) {
            err = packDirectory(curPath, recPath, writer, visit, exclude);
            if (!err.ok()) {
                return err;
            }
        }
    }
    if (ec) {
        return Error::io("Failed while listing " + srcPath.string() + ": " + ec.message());
    }
    return Error{};
}

Error packTreeToWriter(const std::filesystem::path &srcPath, Utils::ZipWriter &writer, const Visitor &visit,
                       bool includeRootDir, const ExcludeFilter &exclude) {
    EntryInfo info;
    Error err = statPath(srcPath, info);
    if (!err.ok()) {
        return err;
    }

    std::string basePath = baseName(srcPath);
    if (!info.isDirectory) {
        return packFile(srcPath, basePath, writer, info);
    }

    if (includeRootDir) {
        err = packFile(srcPath, basePath, writer, info);
        if (!err.ok()) {
            return err;
        }
    } else {
        basePath.clear();
    }
    return packDirectory(srcPath, basePath, writer, visit, exclude);
}

Error packToFunc(const std::filesystem::path &srcPath, const std::filesystem::path &destPath, const Visitor &visit,
                 bool includeRootDir, const Config &config) {
    Utils::ZipWriter writer;
    if (!writer.openFile(destPath)) {
        return Error::io(writer.getLastError());
    }

    Error err = packTreeToWriter(srcPath, writer, visit, includeRootDir,
                                 [&config](const std::string &name) { return config.isExcluded(name); });

    // The archive is finalized even after a failure so the file handle is released
    if (!writer.close() && err.ok()) {
        err = Error::io(writer.getLastError());
    }
    if (!err.ok()) {
        transferLogger()->error("Packing {} into {} failed: {}", srcPath.string(), destPath.string(), err.describe());
    }
    return err;
}

Error packTo(const std::filesystem::path &srcPath, const std::filesystem::path &destPath, bool includeRootDir,
             const Config &config) {
    return packToFunc(srcPath, destPath, makePackLogVisitor(config.verbose), includeRootDir, config);
}

} // namespace Zipkit
