#pragma once

/**
 * @file archive.hpp
 * @brief Read-only ZIP container access
 *
 * An ArchiveReader parses the central directory of a ZIP container and hands
 * out entry metadata in physical (local header offset) order. Entry payloads
 * are only read when asked for, so a file-backed archive is never loaded into
 * memory as a whole. Nested archives are opened over an owned memory buffer.
 *
 * @example
 * ```cpp
 * auto reader = nestar::ArchiveReader::open_file("app.zip");
 * if (reader.isOk()) {
 *     reader.value()->for_each([&](const nestar::ArchiveEntry& e) {
 *         std::cout << e.name << " " << e.size << "\n";
 *         return true;
 *     });
 * }
 * ```
 */

#include "nestar/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace nestar {

// ============================================================================
// Byte Sources
// ============================================================================

/**
 * @brief Positional read access to the raw bytes of a container
 *
 * Implementations must allow concurrent read_at() calls.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual uint64_t size() const = 0;

    /// Read exactly `length` bytes at `offset` into `out`
    virtual Result<void> read_at(uint64_t offset, size_t length, uint8_t* out) const = 0;
};

/// ByteSource backed by a file on disk
class FileSource : public ByteSource {
public:
    static Result<std::shared_ptr<FileSource>> open(const std::string& path);
    ~FileSource() override;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    uint64_t size() const override { return size_; }
    Result<void> read_at(uint64_t offset, size_t length, uint8_t* out) const override;

    const std::string& path() const { return path_; }

private:
    FileSource(std::string path, uint64_t size) : path_(std::move(path)), size_(size) {}

    std::string path_;
    uint64_t size_ = 0;
#ifdef _WIN32
    mutable std::mutex mutex_;
    void* handle_ = nullptr;  // std::FILE*
#else
    int fd_ = -1;
#endif
};

/// ByteSource over an owned, immutable buffer
class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::shared_ptr<const Bytes> data) : data_(std::move(data)) {}
    explicit MemorySource(Bytes data)
        : data_(std::make_shared<const Bytes>(std::move(data))) {}

    uint64_t size() const override { return data_->size(); }
    Result<void> read_at(uint64_t offset, size_t length, uint8_t* out) const override;

private:
    std::shared_ptr<const Bytes> data_;
};

// ============================================================================
// Archive Entries
// ============================================================================

/// Compression methods understood by the reader
constexpr uint16_t ZIP_METHOD_STORED = 0;
constexpr uint16_t ZIP_METHOD_DEFLATED = 8;

struct ArchiveEntry {
    std::string name;                 // Entry name as stored ('/' separated)
    bool is_directory = false;        // Name ends with '/'; size is always 0
    uint16_t method = ZIP_METHOD_STORED;
    uint32_t crc32 = 0;
    uint64_t compressed_size = 0;
    uint64_t size = 0;                // Uncompressed byte length
    uint64_t local_header_offset = 0;
};

/// Whether the caller needs name lookups (find) after opening
enum class ArchiveOpenMode {
    Sequential,
    RandomAccess
};

// ============================================================================
// Archive Reader
// ============================================================================

class ArchiveReader {
public:
    /**
     * @brief Parse the central directory of a container
     * @param source Raw container bytes
     * @param locator Identifier used in errors and diagnostics
     * @param mode RandomAccess builds the name index used by find()
     * @return Reader or CORRUPT_ARCHIVE / IO_ERROR naming `locator`
     */
    static Result<std::unique_ptr<ArchiveReader>> open(std::shared_ptr<const ByteSource> source,
                                                       std::string locator,
                                                       ArchiveOpenMode mode = ArchiveOpenMode::Sequential);

    /// Open a container file; the locator is the file path
    static Result<std::unique_ptr<ArchiveReader>> open_file(const std::string& path,
                                                            ArchiveOpenMode mode = ArchiveOpenMode::Sequential);

    /// Open a container held in memory (a nested archive's bytes)
    static Result<std::unique_ptr<ArchiveReader>> open_memory(Bytes data,
                                                              std::string locator,
                                                              ArchiveOpenMode mode = ArchiveOpenMode::Sequential);

    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;

    const std::string& locator() const { return locator_; }

    /// All entries in physical order
    const std::vector<ArchiveEntry>& entries() const { return entries_; }

    size_t entry_count() const { return entries_.size(); }

    /// Visit entries in physical order; return false from `fn` to stop early
    void for_each(const std::function<bool(const ArchiveEntry&)>& fn) const;

    /// Exact name lookup; always nullptr for Sequential readers
    const ArchiveEntry* find(const std::string& name) const;

    bool is_random_access() const { return mode_ == ArchiveOpenMode::RandomAccess; }

    /// Read and decompress an entry's payload, verifying length and CRC-32
    Result<Bytes> read(const ArchiveEntry& entry) const;

    /// Convenience: find() + read(); FILE_NOT_FOUND when absent
    Result<Bytes> read(const std::string& name) const;

private:
    ArchiveReader(std::shared_ptr<const ByteSource> source, std::string locator, ArchiveOpenMode mode)
        : source_(std::move(source)), locator_(std::move(locator)), mode_(mode) {}

    Result<void> parse_central_directory();
    Error corrupt(const std::string& what) const;

    std::shared_ptr<const ByteSource> source_;
    std::string locator_;
    ArchiveOpenMode mode_;
    std::vector<ArchiveEntry> entries_;
    std::unordered_map<std::string, size_t> by_name_;
};

/// Join a parent locator and an entry name into a nested origin identifier
inline std::string nested_locator(const std::string& parent, const std::string& entry_name) {
    return parent + "!/" + entry_name;
}

} // namespace nestar
