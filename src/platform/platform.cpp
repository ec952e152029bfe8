#include "nestar/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace nestar {

namespace fs = std::filesystem;

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

std::string absolute_path(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) {
        return path;
    }
    return abs.lexically_normal().string();
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

Result<Bytes> read_file_bytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        if (!path_exists(path)) {
            return Result<Bytes>::err(Error(ErrorCode::FILE_NOT_FOUND,
                                            "file not found: " + path));
        }
        return Result<Bytes>::err(Error(ErrorCode::IO_ERROR,
                                        "failed to open file: " + path));
    }

    Bytes data((std::istreambuf_iterator<char>(file)),
               std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<Bytes>::err(Error(ErrorCode::IO_ERROR,
                                        "failed to read file: " + path));
    }
    return Result<Bytes>::ok(std::move(data));
}

// ============================================================================
// Temporary Files
// ============================================================================

std::string get_temp_directory() {
    auto from_env = get_env("NESTAR_TMPDIR");
    if (from_env && !from_env->empty()) {
        return *from_env;
    }
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec) {
#ifdef _WIN32
        return ".";
#else
        return "/tmp";
#endif
    }
    return tmp.string();
}

Result<std::string> create_unique_file(const std::string& dir,
                                       const std::string& stem,
                                       const std::string& suffix,
                                       const Bytes& content) {
#ifdef _WIN32
    // CREATE_NEW fails if the name is taken; retry with a fresh name
    for (int attempt = 0; attempt < 16; ++attempt) {
        std::string path = join_path(dir, stem + generate_uuid().substr(0, 8) + suffix);
        HANDLE h = CreateFileA(path.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW,
                               FILE_ATTRIBUTE_NORMAL, nullptr);
        if (h == INVALID_HANDLE_VALUE) {
            if (GetLastError() == ERROR_FILE_EXISTS) continue;
            return Result<std::string>::err(Error(ErrorCode::IO_ERROR,
                                                  "failed to create temp file in " + dir));
        }
        DWORD written = 0;
        BOOL ok = content.empty() ||
                  WriteFile(h, content.data(), static_cast<DWORD>(content.size()), &written, nullptr);
        CloseHandle(h);
        if (!ok || written != content.size()) {
            DeleteFileA(path.c_str());
            return Result<std::string>::err(Error(ErrorCode::IO_ERROR,
                                                  "failed to write temp file: " + path));
        }
        return Result<std::string>::ok(path);
    }
    return Result<std::string>::err(Error(ErrorCode::IO_ERROR,
                                          "could not find a free temp file name in " + dir));
#else
    // mkstemps replaces the XXXXXX run and keeps the suffix intact
    std::string pattern = join_path(dir, stem + "XXXXXX" + suffix);
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    int fd = mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        ErrorCode code = (errno == EACCES) ? ErrorCode::PERMISSION_DENIED : ErrorCode::IO_ERROR;
        return Result<std::string>::err(Error(code,
            "failed to create temp file in " + dir + ": " + std::strerror(errno)));
    }
    std::string path(buf.data());

    size_t offset = 0;
    while (offset < content.size()) {
        ssize_t written = write(fd, content.data() + offset, content.size() - offset);
        if (written < 0) {
            if (errno == EINTR) continue;
            std::string reason = std::strerror(errno);
            close(fd);
            unlink(path.c_str());
            return Result<std::string>::err(Error(ErrorCode::IO_ERROR,
                "failed to write temp file " + path + ": " + reason));
        }
        offset += static_cast<size_t>(written);
    }

    if (close(fd) != 0) {
        std::string reason = std::strerror(errno);
        unlink(path.c_str());
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR,
            "failed to close temp file " + path + ": " + reason));
    }
    return Result<std::string>::ok(path);
#endif
}

Result<void> set_read_execute_only(const std::string& path) {
    std::error_code ec;
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_exec,
                    fs::perm_options::replace, ec);
    if (ec) {
        return Result<void>::err(Error(ErrorCode::PERMISSION_DENIED,
            "failed to set permissions on " + path + ": " + ec.message()));
    }
    return Result<void>::ok();
}

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace nestar
