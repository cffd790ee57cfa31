// src/Utils/ZipWriter.cpp
#include <Zipkit/Utils/Logger.hpp>
#include <Zipkit/Utils/ZipWriter.hpp>

extern "C" {
    #include "mz.h"
    #include "mz_strm.h"
    #include "mz_strm_mem.h"
    #include "mz_zip.h"
    #include "mz_zip_rw.h"
}

#include <algorithm>
#include <limits>

namespace Zipkit::Utils {

    ZipWriter::ZipWriter()
        : m_zipWriter(nullptr), m_memStream(nullptr), m_out(nullptr), m_isOpen(false), m_entryOpen(false),
          m_entryBytes(0), m_streamBytes(0), m_streamLimit(kMaxStreamArchiveSize),
          m_discardStream(false) {
        m_logger = Logger::GetOrCreateLogger("ZipWriter");
        m_zipWriter = mz_zip_writer_create();
        if (!m_zipWriter) {
            m_lastErrorMsg = "Failed to create zip writer instance.";
            m_logger->error("{}", m_lastErrorMsg);
            return;
        }
        mz_zip_writer_set_compress_level(m_zipWriter, MZ_COMPRESS_LEVEL_DEFAULT);
    }

    ZipWriter::~ZipWriter() {
        if (m_isOpen && !close()) {
            m_logger->error("[{}] Archive could not be finalized on destruction: {}", m_target, m_lastErrorMsg);
        }
        if (m_zipWriter) {
            mz_zip_writer_delete(&m_zipWriter);
        }
        releaseMemStream();
    }

    void ZipWriter::logMzError(int32_t err, const std::string &context) {
        m_lastErrorMsg = context + ": minizip-ng error " + std::to_string(err);
        m_logger->error("[{}] {}", m_target, m_lastErrorMsg);
    }

    void ZipWriter::releaseMemStream() {
        if (m_memStream) {
            mz_stream_mem_close(m_memStream);
            mz_stream_mem_delete(&m_memStream);
        }
    }

    std::string ZipWriter::getLastError() const { return m_lastErrorMsg; }

    // Only stream targets are bounded. Deflate may expand incompressible input a little, so the
    // running total is an upper bound rather than the exact staged size.
    bool ZipWriter::reserveStreamBytes(std::uint64_t count) {
        if (!m_memStream) {
            return true;
        }
        std::uint64_t projected = m_streamBytes + count + count / 100 + 16;
        if (projected > m_streamLimit) {
            m_lastErrorMsg = "Archive would exceed the " + std::to_string(m_streamLimit) +
                             " byte limit of a stream destination.";
            m_logger->error("[{}] {}", m_target, m_lastErrorMsg);
            m_discardStream = true;
            return false;
        }
        m_streamBytes = projected;
        return true;
    }

    bool ZipWriter::openFile(const std::filesystem::path &path) {
        if (!m_zipWriter || m_isOpen) {
            m_lastErrorMsg = m_isOpen ? "Writer is already open." : "Zip writer was not created.";
            return false;
        }
        m_target = path.filename().string();
        int32_t err = mz_zip_writer_open_file(m_zipWriter, path.string().c_str(), 0, 0);
        if (err != MZ_OK) {
            logMzError(err, "Failed to create archive " + path.string());
            return false;
        }
        m_isOpen = true;
        m_logger->trace("[{}] Writing archive to {}", m_target, path.string());
        return true;
    }

    bool ZipWriter::openStream(std::ostream &out) {
        if (!m_zipWriter || m_isOpen) {
            m_lastErrorMsg = m_isOpen ? "Writer is already open." : "Zip writer was not created.";
            return false;
        }
        m_target = "<stream>";

        m_memStream = mz_stream_mem_create();
        if (!m_memStream) {
            m_lastErrorMsg = "Failed to create memory stream.";
            m_logger->error("[{}] {}", m_target, m_lastErrorMsg);
            return false;
        }
        mz_stream_mem_set_grow_size(m_memStream, 128 * 1024);
        int32_t err = mz_stream_mem_open(m_memStream, nullptr, MZ_OPEN_MODE_CREATE);
        if (err != MZ_OK) {
            logMzError(err, "Failed to open memory stream");
            releaseMemStream();
            return false;
        }

        err = mz_zip_writer_open(m_zipWriter, m_memStream, 0);
        if (err != MZ_OK) {
            logMzError(err, "Failed to open writer on memory stream");
            releaseMemStream();
            return false;
        }
        m_out = &out;
        m_isOpen = true;
        m_streamBytes = 0;
        m_discardStream = false;
        return true;
    }

    bool ZipWriter::beginEntry(const EntryHeader &header) {
        if (!m_isOpen) {
            m_lastErrorMsg = "Writer is not open.";
            return false;
        }
        if (m_entryOpen && !endEntry()) {
            return false;
        }
        // Local and central headers with their extra fields
        if (!reserveStreamBytes(256 + 2 * header.name.size())) {
            return false;
        }

        mz_zip_file file_info = {};
        file_info.version_madeby = MZ_VERSION_MADEBY;
        file_info.flag = MZ_ZIP_FLAG_UTF8;
        file_info.compression_method = header.isDirectory ? MZ_COMPRESS_METHOD_STORE : MZ_COMPRESS_METHOD_DEFLATE;
        file_info.filename = header.name.c_str();
        file_info.uncompressed_size = header.isDirectory ? 0 : static_cast<int64_t>(header.declaredSize);
        file_info.modified_date = header.modified != 0 ? header.modified : std::time(nullptr);
        if (header.stored) {
            file_info.version_madeby = header.stored->versionMadeBy;
            file_info.external_fa = header.stored->external;
        } else if (header.attributes != 0) {
            // Same layout as mz_zip_writer_add_file: DOS attributes in the low byte, host mode in the high half
            const uint8_t src_sys = MZ_HOST_SYSTEM(file_info.version_madeby);
            if (src_sys != MZ_HOST_SYSTEM_MSDOS && src_sys != MZ_HOST_SYSTEM_WINDOWS_NTFS) {
                uint32_t dos_attrib = 0;
                if (mz_zip_attrib_convert(src_sys, header.attributes, MZ_HOST_SYSTEM_MSDOS, &dos_attrib) == MZ_OK) {
                    file_info.external_fa = dos_attrib;
                }
                file_info.external_fa |= (header.attributes << 16);
            } else {
                file_info.external_fa = header.attributes;
            }
        }

        int32_t err = mz_zip_writer_entry_open(m_zipWriter, &file_info);
        if (err != MZ_OK) {
            logMzError(err, "Failed to write header for " + header.name);
            return false;
        }
        m_entryOpen = true;
        m_entryBytes = 0;
        return true;
    }

    bool ZipWriter::writeEntry(const char *data, std::size_t length) {
        if (!m_entryOpen) {
            m_lastErrorMsg = "No entry is open for writing.";
            return false;
        }
        while (length > 0) {
            auto chunk = static_cast<int32_t>(std::min<std::size_t>(length, std::numeric_limits<int32_t>::max()));
            if (!reserveStreamBytes(static_cast<std::uint64_t>(chunk))) {
                return false;
            }
            int32_t written = mz_zip_writer_entry_write(m_zipWriter, data, chunk);
            if (written <= 0) {
                logMzError(written, "Failed to write entry content");
                return false;
            }
            data += written;
            length -= static_cast<std::size_t>(written);
            m_entryBytes += static_cast<std::uint64_t>(written);
        }
        return true;
    }

    bool ZipWriter::endEntry() {
        if (!m_entryOpen) {
            return true;
        }
        m_entryOpen = false;
        int32_t err = mz_zip_writer_entry_close(m_zipWriter);
        if (err != MZ_OK) {
            logMzError(err, "Failed to close entry");
            return false;
        }
        return true;
    }

    void ZipWriter::abandon() {
        if (!m_isOpen) {
            return;
        }
        m_discardStream = true;
        close();
    }

    bool ZipWriter::close() {
        if (!m_isOpen) {
            return true;
        }
        bool ok = endEntry();

        int32_t err = mz_zip_writer_close(m_zipWriter);
        m_isOpen = false;
        if (err != MZ_OK) {
            logMzError(err, "Failed to finalize archive");
            ok = false;
        }

        if (m_out && m_memStream && m_discardStream) {
            m_logger->trace("[{}] Staged archive discarded, nothing written to the destination stream.", m_target);
            ok = false;
        } else if (ok && m_out && m_memStream) {
            const void *buffer = nullptr;
            int32_t length = 0;
            mz_stream_mem_get_buffer(m_memStream, &buffer);
            mz_stream_mem_get_buffer_length(m_memStream, &length);
            if (buffer && length > 0) {
                m_out->write(static_cast<const char *>(buffer), length);
            }
            m_out->flush();
            if (!*m_out) {
                m_lastErrorMsg = "Failed to copy archive bytes into the destination stream.";
                m_logger->error("[{}] {}", m_target, m_lastErrorMsg);
                ok = false;
            } else {
                m_logger->trace("[{}] Copied {} bytes into the destination stream.", m_target, length);
            }
        }
        releaseMemStream();
        m_out = nullptr;
        return ok;
    }

} // namespace Zipkit::Utils
