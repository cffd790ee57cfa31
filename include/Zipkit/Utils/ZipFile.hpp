// include/Zipkit/Utils/ZipFile.hpp
#ifndef ZIPKIT_ZIP_FILE_HPP
#define ZIPKIT_ZIP_FILE_HPP

#include <Zipkit/Types/ArchiveEntry.hpp>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace Zipkit::Utils {

    // A member as listed in the archive's central directory.
    struct ZipMember {
        std::string storedName;  // exactly as recorded, used to locate the member again
        std::string name;        // forward slashes, trailing '/' for directories
        std::uint64_t uncompressedSize = 0;
        bool isDirectory = false;
        std::time_t modified = 0;
        StoredAttributes attributes;
    };

    // Read side of the codec: owns one minizip-ng reader bound to an archive path.
    class ZipFile {
    public:
        explicit ZipFile(const std::filesystem::path &archivePath);
        ~ZipFile();

        ZipFile(const ZipFile &) = delete;
        ZipFile &operator=(const ZipFile &) = delete;

        // Opens the archive. Returns true on success.
        bool open();
        bool isOpen() const;
        void close();

        // Members in stored order. Returns false if the central directory cannot be walked.
        bool members(std::vector<ZipMember> &out);

        // Streams the content of one member into out. bytesOut receives the number of bytes copied.
        // The codec checks the CRC when the entry is closed.
        bool copyEntry(const std::string &storedName, std::ostream &out, std::uint64_t *bytesOut = nullptr);

        const std::filesystem::path &path() const { return m_archivePath; }
        std::string getLastError() const;

    private:
        std::filesystem::path m_archivePath;
        void *m_zipReader; // Opaque pointer to mz_zip_reader
        bool m_isOpen;
        std::shared_ptr<spdlog::logger> m_logger;
        std::string m_lastErrorMsg;

        void logMzError(int32_t err, const std::string &context);
    };

} // namespace Zipkit::Utils

#endif // ZIPKIT_ZIP_FILE_HPP
