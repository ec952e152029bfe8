#pragma once

/**
 * @file locator.hpp
 * @brief Uniform handle for resolved resources
 *
 * A Locator says where a resource's bytes live: a file on disk, a member of
 * an archive that is read on demand, or a buffer already held in memory.
 * Callers open every kind the same way. A namespace placeholder stands for a
 * known package directory; opening it fails, just as opening a directory as
 * a byte stream would.
 */

#include "nestar/types.hpp"

#include <istream>
#include <memory>
#include <string>
#include <variant>

namespace nestar {

class ArchiveReader;

struct FileLocation {
    std::string path;
};

struct ArchiveMember {
    std::shared_ptr<const ArchiveReader> archive;
    std::string entry;
};

struct MemoryBuffer {
    std::string origin;   // archive the bytes were read from
    std::string path;     // logical path
    std::shared_ptr<const Bytes> data;
};

struct NamespaceMarker {
    std::string name;     // namespace key, no trailing '/'
};

class Locator {
public:
    enum class Kind {
        File,
        Archive,
        Memory,
        Namespace
    };

    static Locator file(std::string path);
    static Locator archive_member(std::shared_ptr<const ArchiveReader> archive, std::string entry);
    static Locator memory(std::string origin, std::string path, std::shared_ptr<const Bytes> data);
    static Locator namespace_marker(std::string name);

    Kind kind() const;

    /// Open the bytes as a stream; NOT_A_FILE for namespace placeholders
    Result<std::unique_ptr<std::istream>> open() const;

    /// Read the complete payload
    Result<Bytes> read_all() const;

    /// "file:<path>", "archive:<container>!/<entry>", "memory:<origin>!/<path>"
    /// or "namespace:<name>/"
    std::string to_string() const;

    const std::variant<FileLocation, ArchiveMember, MemoryBuffer, NamespaceMarker>& target() const {
        return target_;
    }

private:
    template<typename T>
    explicit Locator(T target) : target_(std::move(target)) {}

    std::variant<FileLocation, ArchiveMember, MemoryBuffer, NamespaceMarker> target_;
};

} // namespace nestar
