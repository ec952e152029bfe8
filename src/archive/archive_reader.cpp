#include "nestar/archive.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include <zlib.h>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace nestar {

// ============================================================================
// ZIP Format Constants
// ============================================================================

static constexpr uint32_t ZIP_LOCAL_HEADER_SIG = 0x04034b50;
static constexpr uint32_t ZIP_CENTRAL_HEADER_SIG = 0x02014b50;
static constexpr uint32_t ZIP_EOCD_SIG = 0x06054b50;

static constexpr size_t ZIP_LOCAL_HEADER_SIZE = 30;
static constexpr size_t ZIP_CENTRAL_HEADER_SIZE = 46;
static constexpr size_t ZIP_EOCD_SIZE = 22;
static constexpr size_t ZIP_MAX_COMMENT = 0xFFFF;

static constexpr uint16_t ZIP_FLAG_ENCRYPTED = 0x0001;

// ============================================================================
// Helper Functions
// ============================================================================

static uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

static uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

static Result<Bytes> read_range(const ByteSource& source, uint64_t offset, size_t length) {
    Bytes buf(length);
    if (length == 0) {
        return Result<Bytes>::ok(std::move(buf));
    }
    auto r = source.read_at(offset, length, buf.data());
    if (r.isErr()) {
        return Result<Bytes>::err(r.error());
    }
    return Result<Bytes>::ok(std::move(buf));
}

// Inflate a raw deflate stream (no zlib/gzip wrapper) of known output size
static bool inflate_raw(const Bytes& compressed, uint64_t expected_size, Bytes& out) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) {
        return false;
    }

    // Keep a non-empty output buffer so zero-length entries still terminate
    out.resize(std::max<uint64_t>(expected_size, 1));

    strm.next_in = const_cast<Bytef*>(compressed.data());
    strm.avail_in = static_cast<uInt>(compressed.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    int ret = inflate(&strm, Z_FINISH);
    uint64_t produced = strm.total_out;
    inflateEnd(&strm);

    if (ret != Z_STREAM_END || produced != expected_size) {
        return false;
    }
    out.resize(static_cast<size_t>(produced));
    return true;
}

// ============================================================================
// Byte Sources
// ============================================================================

Result<std::shared_ptr<FileSource>> FileSource::open(const std::string& path) {
    using R = Result<std::shared_ptr<FileSource>>;

#ifdef _WIN32
    std::FILE* f = nullptr;
    if (fopen_s(&f, path.c_str(), "rb") != 0 || f == nullptr) {
        return R::err(Error(ErrorCode::FILE_NOT_FOUND, "failed to open archive: " + path));
    }
    if (_fseeki64(f, 0, SEEK_END) != 0) {
        std::fclose(f);
        return R::err(Error(ErrorCode::IO_ERROR, "failed to size archive: " + path));
    }
    uint64_t size = static_cast<uint64_t>(_ftelli64(f));
    std::shared_ptr<FileSource> source(new FileSource(path, size));
    source->handle_ = f;
    return R::ok(std::move(source));
#else
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        ErrorCode code = ErrorCode::IO_ERROR;
        if (errno == ENOENT) code = ErrorCode::FILE_NOT_FOUND;
        else if (errno == EACCES) code = ErrorCode::PERMISSION_DENIED;
        return R::err(Error(code, "failed to open archive " + path + ": " + std::strerror(errno)));
    }

    struct stat st;
    if (fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
        ::close(fd);
        return R::err(Error(ErrorCode::IO_ERROR, "not a regular file: " + path));
    }

    std::shared_ptr<FileSource> source(new FileSource(path, static_cast<uint64_t>(st.st_size)));
    source->fd_ = fd;
    return R::ok(std::move(source));
#endif
}

FileSource::~FileSource() {
#ifdef _WIN32
    if (handle_) std::fclose(static_cast<std::FILE*>(handle_));
#else
    if (fd_ >= 0) ::close(fd_);
#endif
}

Result<void> FileSource::read_at(uint64_t offset, size_t length, uint8_t* out) const {
    if (offset > size_ || length > size_ - offset) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
            "read past end of " + path_ + " at offset " + std::to_string(offset)));
    }

#ifdef _WIN32
    std::lock_guard<std::mutex> lock(mutex_);
    std::FILE* f = static_cast<std::FILE*>(handle_);
    if (_fseeki64(f, static_cast<__int64>(offset), SEEK_SET) != 0 ||
        std::fread(out, 1, length, f) != length) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, "failed to read " + path_));
    }
#else
    // pread keeps no shared file position, so concurrent readers are safe
    size_t done = 0;
    while (done < length) {
        ssize_t n = pread(fd_, out + done, length - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<void>::err(Error(ErrorCode::IO_ERROR,
                "failed to read " + path_ + ": " + std::strerror(errno)));
        }
        if (n == 0) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR, "unexpected end of file: " + path_));
        }
        done += static_cast<size_t>(n);
    }
#endif
    return Result<void>::ok();
}

Result<void> MemorySource::read_at(uint64_t offset, size_t length, uint8_t* out) const {
    if (offset > data_->size() || length > data_->size() - offset) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
            "read past end of buffer at offset " + std::to_string(offset)));
    }
    std::memcpy(out, data_->data() + offset, length);
    return Result<void>::ok();
}

// ============================================================================
// Archive Reader
// ============================================================================

Result<std::unique_ptr<ArchiveReader>> ArchiveReader::open(std::shared_ptr<const ByteSource> source,
                                                           std::string locator,
                                                           ArchiveOpenMode mode) {
    using R = Result<std::unique_ptr<ArchiveReader>>;

    std::unique_ptr<ArchiveReader> reader(new ArchiveReader(std::move(source), std::move(locator), mode));
    auto parsed = reader->parse_central_directory();
    if (parsed.isErr()) {
        return R::err(parsed.error());
    }
    return R::ok(std::move(reader));
}

Result<std::unique_ptr<ArchiveReader>> ArchiveReader::open_file(const std::string& path,
                                                                ArchiveOpenMode mode) {
    auto source = FileSource::open(path);
    if (source.isErr()) {
        return Result<std::unique_ptr<ArchiveReader>>::err(source.error());
    }
    return open(source.takeValue(), path, mode);
}

Result<std::unique_ptr<ArchiveReader>> ArchiveReader::open_memory(Bytes data,
                                                                  std::string locator,
                                                                  ArchiveOpenMode mode) {
    return open(std::make_shared<MemorySource>(std::move(data)), std::move(locator), mode);
}

Error ArchiveReader::corrupt(const std::string& what) const {
    return Error(ErrorCode::CORRUPT_ARCHIVE, locator_ + ": " + what);
}

Result<void> ArchiveReader::parse_central_directory() {
    const uint64_t total = source_->size();
    if (total < ZIP_EOCD_SIZE) {
        return Result<void>::err(corrupt("too small to be a ZIP archive"));
    }

    // The EOCD record sits at the end, followed only by an optional comment
    size_t tail_len = static_cast<size_t>(std::min<uint64_t>(total, ZIP_EOCD_SIZE + ZIP_MAX_COMMENT));
    uint64_t tail_start = total - tail_len;
    auto tail = read_range(*source_, tail_start, tail_len);
    if (tail.isErr()) {
        return Result<void>::err(tail.error().withContext(locator_));
    }
    const Bytes& t = tail.value();

    size_t eocd = std::string::npos;
    for (size_t i = tail_len - ZIP_EOCD_SIZE + 1; i-- > 0;) {
        if (read_u32(&t[i]) != ZIP_EOCD_SIG) continue;
        uint16_t comment_len = read_u16(&t[i + 20]);
        if (i + ZIP_EOCD_SIZE + comment_len <= tail_len) {
            eocd = i;
            break;
        }
    }
    if (eocd == std::string::npos) {
        return Result<void>::err(corrupt("end of central directory record not found"));
    }

    const uint8_t* e = &t[eocd];
    uint16_t disk = read_u16(e + 4);
    uint16_t cd_disk = read_u16(e + 6);
    uint16_t disk_entries = read_u16(e + 8);
    uint16_t total_entries = read_u16(e + 10);
    uint32_t cd_size = read_u32(e + 12);
    uint32_t cd_offset = read_u32(e + 16);
    uint64_t eocd_offset = tail_start + eocd;

    if (disk != 0 || cd_disk != 0 || disk_entries != total_entries) {
        return Result<void>::err(corrupt("multi-volume archives are not supported"));
    }
    if (total_entries == 0xFFFF || cd_size == 0xFFFFFFFF || cd_offset == 0xFFFFFFFF) {
        return Result<void>::err(corrupt("ZIP64 archives are not supported"));
    }
    if (static_cast<uint64_t>(cd_offset) + cd_size > eocd_offset) {
        return Result<void>::err(corrupt("central directory extends past its end record"));
    }

    auto cd = read_range(*source_, cd_offset, cd_size);
    if (cd.isErr()) {
        return Result<void>::err(cd.error().withContext(locator_));
    }
    const Bytes& d = cd.value();

    entries_.clear();
    entries_.reserve(total_entries);

    size_t pos = 0;
    for (uint16_t i = 0; i < total_entries; ++i) {
        if (pos + ZIP_CENTRAL_HEADER_SIZE > d.size()) {
            return Result<void>::err(corrupt("truncated central directory"));
        }
        const uint8_t* h = &d[pos];
        if (read_u32(h) != ZIP_CENTRAL_HEADER_SIG) {
            return Result<void>::err(corrupt("bad central directory signature at entry " +
                                             std::to_string(i)));
        }

        uint16_t name_len = read_u16(h + 28);
        uint16_t extra_len = read_u16(h + 30);
        uint16_t comment_len = read_u16(h + 32);
        size_t record_len = ZIP_CENTRAL_HEADER_SIZE + name_len + extra_len + comment_len;
        if (pos + record_len > d.size()) {
            return Result<void>::err(corrupt("truncated central directory record"));
        }

        ArchiveEntry entry;
        entry.method = read_u16(h + 10);
        entry.crc32 = read_u32(h + 16);
        entry.compressed_size = read_u32(h + 20);
        entry.size = read_u32(h + 24);
        entry.local_header_offset = read_u32(h + 42);
        entry.name.assign(reinterpret_cast<const char*>(h + ZIP_CENTRAL_HEADER_SIZE), name_len);
        entry.is_directory = !entry.name.empty() && entry.name.back() == '/';

        if (read_u16(h + 8) & ZIP_FLAG_ENCRYPTED) {
            // Recorded as an unsupported method; read() reports it per entry
            entry.method = 0xFFFF;
        }
        if (entry.local_header_offset + ZIP_LOCAL_HEADER_SIZE > cd_offset) {
            return Result<void>::err(corrupt("local header offset out of range for " + entry.name));
        }
        if (entry.is_directory) {
            entry.size = 0;
        }

        entries_.push_back(std::move(entry));
        pos += record_len;
    }

    std::stable_sort(entries_.begin(), entries_.end(),
                     [](const ArchiveEntry& a, const ArchiveEntry& b) {
                         return a.local_header_offset < b.local_header_offset;
                     });

    if (mode_ == ArchiveOpenMode::RandomAccess) {
        by_name_.reserve(entries_.size());
        for (size_t i = 0; i < entries_.size(); ++i) {
            by_name_.emplace(entries_[i].name, i);  // first physical occurrence wins
        }
    }

    return Result<void>::ok();
}

void ArchiveReader::for_each(const std::function<bool(const ArchiveEntry&)>& fn) const {
    for (const auto& entry : entries_) {
        if (!fn(entry)) break;
    }
}

const ArchiveEntry* ArchiveReader::find(const std::string& name) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

Result<Bytes> ArchiveReader::read(const ArchiveEntry& entry) const {
    using R = Result<Bytes>;

    if (entry.is_directory) {
        return R::ok(Bytes{});
    }
    if (entry.method != ZIP_METHOD_STORED && entry.method != ZIP_METHOD_DEFLATED) {
        return R::err(Error(ErrorCode::UNSUPPORTED_COMPRESSION,
            nested_locator(locator_, entry.name) + ": unsupported compression method " +
            std::to_string(entry.method)));
    }

    auto header = read_range(*source_, entry.local_header_offset, ZIP_LOCAL_HEADER_SIZE);
    if (header.isErr()) {
        return R::err(header.error().withContext(locator_));
    }
    const uint8_t* h = header.value().data();
    if (read_u32(h) != ZIP_LOCAL_HEADER_SIG) {
        return R::err(corrupt("bad local header signature for " + entry.name));
    }

    uint64_t data_offset = entry.local_header_offset + ZIP_LOCAL_HEADER_SIZE +
                           read_u16(h + 26) + read_u16(h + 28);
    if (data_offset + entry.compressed_size > source_->size()) {
        return R::err(corrupt("entry data past end of archive for " + entry.name));
    }

    auto raw = read_range(*source_, data_offset, static_cast<size_t>(entry.compressed_size));
    if (raw.isErr()) {
        return R::err(raw.error().withContext(locator_));
    }

    Bytes data;
    if (entry.method == ZIP_METHOD_STORED) {
        if (entry.compressed_size != entry.size) {
            return R::err(corrupt("stored entry size mismatch for " + entry.name));
        }
        data = raw.takeValue();
    } else if (!inflate_raw(raw.value(), entry.size, data)) {
        return R::err(corrupt("failed to inflate " + entry.name));
    }

    uint32_t crc = static_cast<uint32_t>(crc32(0L, Z_NULL, 0));
    if (!data.empty()) {
        crc = static_cast<uint32_t>(crc32(crc, data.data(), static_cast<uInt>(data.size())));
    }
    if (crc != entry.crc32) {
        return R::err(corrupt("CRC-32 mismatch for " + entry.name));
    }

    return R::ok(std::move(data));
}

Result<Bytes> ArchiveReader::read(const std::string& name) const {
    const ArchiveEntry* entry = find(name);
    if (!entry) {
        return Result<Bytes>::err(Error(ErrorCode::FILE_NOT_FOUND,
                                        nested_locator(locator_, name) + ": no such entry"));
    }
    return read(*entry);
}

} // namespace nestar
