// include/Zipkit/Utils/ZipWriter.hpp
#ifndef ZIPKIT_ZIP_WRITER_HPP
#define ZIPKIT_ZIP_WRITER_HPP

#include <Zipkit/Types/ArchiveEntry.hpp>
#include <algorithm>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <spdlog/logger.h>

namespace Zipkit::Utils {

    struct EntryHeader {
        std::string name;               // recorded name; directories end in '/'
        std::uint64_t declaredSize = 0; // uncompressed size announced before the content
        bool isDirectory = false;
        std::time_t modified = 0;
        std::uint32_t attributes = 0;   // host file attributes, 0 if unknown
        std::optional<StoredAttributes> stored; // copied verbatim instead of converting attributes
    };

    // Write side of the codec: owns one minizip-ng writer, targeting a file or a std::ostream.
    // An open writer is finalized by close() or, failing that, by the destructor.
    class ZipWriter {
    public:
        ZipWriter();
        ~ZipWriter();

        ZipWriter(const ZipWriter &) = delete;
        ZipWriter &operator=(const ZipWriter &) = delete;

        // Creates or truncates the file at path.
        bool openFile(const std::filesystem::path &path);

        // Stages the archive in memory; close() copies the finished bytes into out.
        bool openStream(std::ostream &out);

        bool beginEntry(const EntryHeader &header);
        bool writeEntry(const char *data, std::size_t length);
        bool endEntry();

        // Largest archive a stream target may stage in memory. The memory stream indexes with int32_t.
        static constexpr std::uint64_t kMaxStreamArchiveSize = 0x7FFFFFFF;

        // Lowers the stream staging limit (never raises it past kMaxStreamArchiveSize).
        void setStreamLimit(std::uint64_t limit) { m_streamLimit = std::min(limit, kMaxStreamArchiveSize); }

        // Bytes accepted by writeEntry() since the last beginEntry()
        std::uint64_t entryBytesWritten() const { return m_entryBytes; }

        // Writes the central directory. Returns false if the archive could not be finalized.
        bool close();

        // Finishes the archive but keeps the staged bytes out of a destination stream.
        void abandon();

        bool isOpen() const { return m_isOpen; }
        std::string getLastError() const;

    private:
        void *m_zipWriter;  // Opaque pointer to mz_zip_writer
        void *m_memStream;  // mz_stream_mem, only for stream targets
        std::ostream *m_out;
        bool m_isOpen;
        bool m_entryOpen;
        std::uint64_t m_entryBytes;
        std::uint64_t m_streamBytes;   // upper bound of the staged archive size
        std::uint64_t m_streamLimit;
        bool m_discardStream;
        std::string m_target;
        std::shared_ptr<spdlog::logger> m_logger;
        std::string m_lastErrorMsg;

        void logMzError(int32_t err, const std::string &context);
        void releaseMemStream();
        bool reserveStreamBytes(std::uint64_t count);
    };

} // namespace Zipkit::Utils

#endif // ZIPKIT_ZIP_WRITER_HPP
