// include/Zipkit/Types/ArchiveEntry.hpp
#ifndef ZIPKIT_ARCHIVE_ENTRY_HPP
#define ZIPKIT_ARCHIVE_ENTRY_HPP

#include <Zipkit/Error.hpp>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace Zipkit {

    // Metadata handed to visitors
    struct EntryInfo {
        bool isDirectory = false;
        std::uint64_t size = 0;
        std::time_t modified = 0;
    };

    // Attribute fields of a member exactly as its central directory header records them
    struct StoredAttributes {
        std::uint16_t versionMadeBy = 0; // high byte is the host system
        std::uint32_t external = 0;
    };

    // Called once per entry before the filesystem action for it. A non-ok
    // result aborts the traversal and is returned to the caller unchanged.
    using Visitor = std::function<Error(const std::string &fullName, const EntryInfo &info)>;

    // One logical member of a Session.
    struct ArchiveEntry {
        std::string name;         // forward slashes, trailing '/' for directory markers
        std::string storedName;   // name as recorded in the open archive; empty if never read back
        std::uint64_t uncompressedSize = 0;
        std::time_t modified = 0;
        std::filesystem::path absPath; // bound content source; empty means "read from the open archive"
        std::optional<StoredAttributes> stored; // set for members read back from the archive

        bool isDirectory() const { return !name.empty() && name.back() == '/'; }
        bool isBound() const { return !absPath.empty(); }

        EntryInfo info() const { return EntryInfo{isDirectory(), uncompressedSize, modified}; }
    };

} // namespace Zipkit

#endif // ZIPKIT_ARCHIVE_ENTRY_HPP
