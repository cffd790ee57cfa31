// src/Utils/ZipFile.cpp
#include <Zipkit/Utils/Logger.hpp> // For GetOrCreateLogger
#include <Zipkit/Utils/Path.hpp>
#include <Zipkit/Utils/ZipFile.hpp>

// Minizip-ng headers
extern "C" {
    #include "mz.h"
    #include "mz_zip.h"
    #include "mz_zip_rw.h"
}

#include <vector>

namespace Zipkit::Utils {

    namespace {
        constexpr int32_t kReadBufferSize = 64 * 1024;
    }

    ZipFile::ZipFile(const std::filesystem::path &archivePath)
        : m_archivePath(archivePath), m_zipReader(nullptr), m_isOpen(false) {
        m_logger = Logger::GetOrCreateLogger("ZipFile");
        m_zipReader = mz_zip_reader_create();
        if (!m_zipReader) {
            m_lastErrorMsg = "Failed to create zip reader instance.";
            m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
        }
    }

    ZipFile::~ZipFile() {
        if (m_zipReader) {
            close();
            mz_zip_reader_delete(&m_zipReader); // m_zipReader will be set to NULL
            m_logger->trace("[{}] Zip reader deleted.", m_archivePath.filename().string());
        }
    }

    void ZipFile::logMzError(int32_t err, const std::string &context) {
        m_lastErrorMsg = context + ": minizip-ng error " + std::to_string(err);
        m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
    }

    bool ZipFile::open() {
        if (!m_zipReader) {
            m_lastErrorMsg = "Zip reader was not created.";
            return false;
        }
        if (m_isOpen) {
            return true;
        }

        m_logger->trace("[{}] Opening archive...", m_archivePath.filename().string());
        int32_t err = mz_zip_reader_open_file(m_zipReader, m_archivePath.string().c_str());
        if (err != MZ_OK) {
            logMzError(err, "Failed to open zip file " + m_archivePath.string());
            return false;
        }
        m_isOpen = true;
        return true;
    }

    bool ZipFile::isOpen() const { return m_zipReader && m_isOpen; }

    void ZipFile::close() {
        if (!isOpen()) {
            return;
        }
        int32_t err = mz_zip_reader_close(m_zipReader);
        if (err != MZ_OK) {
            // Nothing was written through a reader, so a failing close loses no data
            m_logger->warn("[{}] Closing reader returned minizip-ng error {}", m_archivePath.filename().string(), err);
        }
        m_isOpen = false;
        m_logger->trace("[{}] Archive closed.", m_archivePath.filename().string());
    }

    std::string ZipFile::getLastError() const { return m_lastErrorMsg; }

    bool ZipFile::members(std::vector<ZipMember> &out) {
        out.clear();
        if (!isOpen()) {
            m_lastErrorMsg = "Archive is not open: " + m_archivePath.string();
            return false;
        }

        int32_t err = mz_zip_reader_goto_first_entry(m_zipReader);
        while (err == MZ_OK) {
            mz_zip_file *file_info = nullptr; // owned by the reader
            err = mz_zip_reader_entry_get_info(m_zipReader, &file_info);
            if (err != MZ_OK || !file_info) {
                logMzError(err, "Failed to get entry info");
                return false;
            }

            ZipMember member;
            member.storedName = file_info->filename ? file_info->filename : "";
            member.name = normalizeSlashes(member.storedName);
            member.isDirectory = mz_zip_reader_entry_is_dir(m_zipReader) == MZ_OK;
            if (member.isDirectory && (member.name.empty() || member.name.back() != '/')) {
                member.name += '/';
            }
            member.uncompressedSize = member.isDirectory ? 0 : static_cast<std::uint64_t>(file_info->uncompressed_size);
            member.modified = file_info->modified_date;
            member.attributes.versionMadeBy = file_info->version_madeby;
            member.attributes.external = file_info->external_fa;
            out.push_back(std::move(member));

            err = mz_zip_reader_goto_next_entry(m_zipReader);
        }

        if (err != MZ_END_OF_LIST) {
            logMzError(err, "An error occurred during entry traversal");
            return false;
        }
        m_logger->trace("[{}] Listed {} members.", m_archivePath.filename().string(), out.size());
        return true;
    }

    bool ZipFile::copyEntry(const std::string &storedName, std::ostream &out, std::uint64_t *bytesOut) {
        if (bytesOut) {
            *bytesOut = 0;
        }
        if (!isOpen()) {
            m_lastErrorMsg = "Archive is not open: " + m_archivePath.string();
            return false;
        }

        int32_t err = mz_zip_reader_locate_entry(m_zipReader, storedName.c_str(), 0);
        if (err != MZ_OK) {
            logMzError(err, "Entry not found: " + storedName);
            return false;
        }

        err = mz_zip_reader_entry_open(m_zipReader);
        if (err != MZ_OK) {
            logMzError(err, "Failed to open entry " + storedName);
            return false;
        }

        std::vector<char> buffer(kReadBufferSize);
        std::uint64_t total = 0;
        bool ok = true;
        for (;;) {
            int32_t read = mz_zip_reader_entry_read(m_zipReader, buffer.data(), kReadBufferSize);
            if (read < 0) {
                logMzError(read, "Failed to read entry " + storedName);
                ok = false;
                break;
            }
            if (read == 0) {
                break;
            }
            out.write(buffer.data(), read);
            if (!out) {
                m_lastErrorMsg = "Failed to write content of entry " + storedName;
                m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
                ok = false;
                break;
            }
            total += static_cast<std::uint64_t>(read);
        }

        // The entry must be closed on every path; on a complete read this is where a CRC mismatch surfaces
        err = mz_zip_reader_entry_close(m_zipReader);
        if (ok && err != MZ_OK) {
            logMzError(err, "Failed to close entry " + storedName);
            ok = false;
        }

        if (bytesOut) {
            *bytesOut = total;
        }
        return ok;
    }

} // namespace Zipkit::Utils
