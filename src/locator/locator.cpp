#include "nestar/locator.hpp"
#include "nestar/archive.hpp"
#include "nestar/platform.hpp"

#include <fstream>
#include <streambuf>

namespace nestar {

namespace {

// Read-only stream buffer over a shared payload; keeps the payload alive
class SharedBytesBuf : public std::streambuf {
public:
    explicit SharedBytesBuf(std::shared_ptr<const Bytes> data) : data_(std::move(data)) {
        char* begin = const_cast<char*>(reinterpret_cast<const char*>(data_->data()));
        setg(begin, begin, begin + data_->size());
    }

protected:
    pos_type seekoff(off_type off, std::ios_base::seekdir dir,
                     std::ios_base::openmode which) override {
        if (!(which & std::ios_base::in)) return pos_type(off_type(-1));
        off_type base = 0;
        if (dir == std::ios_base::cur) base = gptr() - eback();
        else if (dir == std::ios_base::end) base = egptr() - eback();
        off_type target = base + off;
        if (target < 0 || target > egptr() - eback()) return pos_type(off_type(-1));
        setg(eback(), eback() + target, egptr());
        return pos_type(target);
    }

    pos_type seekpos(pos_type pos, std::ios_base::openmode which) override {
        return seekoff(off_type(pos), std::ios_base::beg, which);
    }

private:
    std::shared_ptr<const Bytes> data_;
};

class SharedBytesStream : public std::istream {
public:
    explicit SharedBytesStream(std::shared_ptr<const Bytes> data)
        : std::istream(nullptr), buf_(std::move(data)) {
        rdbuf(&buf_);
    }

private:
    SharedBytesBuf buf_;
};

using StreamResult = Result<std::unique_ptr<std::istream>>;

StreamResult stream_over(std::shared_ptr<const Bytes> data) {
    return StreamResult::ok(std::unique_ptr<std::istream>(new SharedBytesStream(std::move(data))));
}

} // namespace

Locator Locator::file(std::string path) {
    return Locator(FileLocation{std::move(path)});
}

Locator Locator::archive_member(std::shared_ptr<const ArchiveReader> archive, std::string entry) {
    return Locator(ArchiveMember{std::move(archive), std::move(entry)});
}

Locator Locator::memory(std::string origin, std::string path, std::shared_ptr<const Bytes> data) {
    return Locator(MemoryBuffer{std::move(origin), std::move(path), std::move(data)});
}

Locator Locator::namespace_marker(std::string name) {
    return Locator(NamespaceMarker{namespace_key(name)});
}

Locator::Kind Locator::kind() const {
    switch (target_.index()) {
        case 0: return Kind::File;
        case 1: return Kind::Archive;
        case 2: return Kind::Memory;
        default: return Kind::Namespace;
    }
}

Result<std::unique_ptr<std::istream>> Locator::open() const {
    if (auto* f = std::get_if<FileLocation>(&target_)) {
        if (is_directory(f->path)) {
            return StreamResult::err(Error(ErrorCode::NOT_A_FILE, f->path + " is a directory"));
        }
        auto stream = std::make_unique<std::ifstream>(f->path, std::ios::binary);
        if (!*stream) {
            return StreamResult::err(Error(ErrorCode::FILE_NOT_FOUND, "failed to open " + f->path));
        }
        return StreamResult::ok(std::move(stream));
    }

    if (auto* a = std::get_if<ArchiveMember>(&target_)) {
        auto bytes = a->archive->read(a->entry);
        if (bytes.isErr()) {
            return StreamResult::err(bytes.error());
        }
        return stream_over(std::make_shared<const Bytes>(bytes.takeValue()));
    }

    if (auto* m = std::get_if<MemoryBuffer>(&target_)) {
        return stream_over(m->data);
    }

    const auto& ns = std::get<NamespaceMarker>(target_);
    return StreamResult::err(Error(ErrorCode::NOT_A_FILE,
                                   "namespace " + ns.name + "/ cannot be opened as a stream"));
}

Result<Bytes> Locator::read_all() const {
    if (auto* m = std::get_if<MemoryBuffer>(&target_)) {
        return Result<Bytes>::ok(*m->data);
    }
    if (auto* a = std::get_if<ArchiveMember>(&target_)) {
        return a->archive->read(a->entry);
    }
    if (auto* f = std::get_if<FileLocation>(&target_)) {
        if (is_directory(f->path)) {
            return Result<Bytes>::err(Error(ErrorCode::NOT_A_FILE, f->path + " is a directory"));
        }
        return read_file_bytes(f->path);
    }

    const auto& ns = std::get<NamespaceMarker>(target_);
    return Result<Bytes>::err(Error(ErrorCode::NOT_A_FILE,
                                    "namespace " + ns.name + "/ has no content"));
}

std::string Locator::to_string() const {
    switch (kind()) {
        case Kind::File:
            return "file:" + std::get<FileLocation>(target_).path;
        case Kind::Archive: {
            const auto& a = std::get<ArchiveMember>(target_);
            return "archive:" + nested_locator(a.archive->locator(), a.entry);
        }
        case Kind::Memory: {
            const auto& m = std::get<MemoryBuffer>(target_);
            return "memory:" + nested_locator(m.origin, m.path);
        }
        case Kind::Namespace:
        default:
            return "namespace:" + std::get<NamespaceMarker>(target_).name + "/";
    }
}

} // namespace nestar
