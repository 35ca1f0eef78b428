// ============================================================
// file_io.cpp -- File storage collaborator implementation
// ============================================================

#include "file_io.hpp"
#include "errors.hpp"
#include <algorithm>
#include <atomic>
#include <cstring>
#include <string>
#include <system_error>

#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

using namespace file_io;

// Map an open()/rename() errno onto the error taxonomy
[[noreturn]] static void throw_errno(int err, const std::string& what, const std::string& path) {
    std::string msg = what + " '" + path + "': " + std::strerror(err);
    if (err == ENOENT) throw FileNotFound(msg);
    if (err == EACCES || err == EPERM || err == EROFS) throw PermissionDenied(msg);
    throw FileIoError(msg);
}

// ============================================================
// FileReader
// ============================================================

FileReader::FileReader(const std::string& path) : path_(path) {
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw_errno(errno, "Cannot open", path);
    }

    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        int err = errno;
        close();
        throw_errno(err, "fstat failed for", path);
    }
    if (!S_ISREG(st.st_mode)) {
        close();
        throw FileIoError("Not a regular file: '" + path + "'");
    }
    size_ = (u64)st.st_size;

#ifdef POSIX_FADV_SEQUENTIAL
    posix_fadvise(fd_, 0, 0, POSIX_FADV_SEQUENTIAL);
#endif
}

FileReader::~FileReader() {
    close();
}

size_t FileReader::read(void* buf, size_t len) {
    for (;;) {
        ssize_t n = ::read(fd_, buf, len);
        if (n >= 0) return (size_t)n;
        if (errno == EINTR) continue;
        throw FileIoError("read failed for '" + path_ + "': " + std::strerror(errno));
    }
}

void FileReader::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// ============================================================
// FileWriter
// ============================================================

FileWriter::FileWriter(const std::string& final_path) : final_path_(final_path) {
    static std::atomic<u32> counter{0};

    fs::path dest(final_path);
    fs::path dir = dest.parent_path();
    std::string tmp_name = "." + dest.filename().string() + ".part-" +
                           std::to_string(platform::current_pid()) + "-" +
                           std::to_string(counter.fetch_add(1));
    temp_path_ = (dir / tmp_name).string();

    std::error_code ec;
    if (fs::is_directory(dest, ec)) {
        throw FileIoError("Destination is a directory: '" + final_path + "'");
    }

    fd_ = ::open(temp_path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw_errno(errno, "Cannot create", final_path);
    }
}

FileWriter::~FileWriter() {
    if (!committed_) abort();
}

void FileWriter::write(const void* data, size_t len) {
    const char* p = static_cast<const char*>(data);
    while (len > 0) {
        ssize_t n = ::write(fd_, p, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw FileIoError("write failed for '" + final_path_ + "': " + std::strerror(errno));
        }
        p += n;
        len -= (size_t)n;
        written_ += (u64)n;
    }
}

void FileWriter::commit() {
    if (committed_) return;
    if (fd_ < 0) {
        throw FileIoError("commit after abort for '" + final_path_ + "'");
    }
    if (::fsync(fd_) != 0) {
        int err = errno;
        abort();
        throw_errno(err, "fsync failed for", final_path_);
    }
    if (::close(fd_) != 0) {
        int err = errno;
        fd_ = -1;
        abort();
        throw_errno(err, "close failed for", final_path_);
    }
    fd_ = -1;
    if (::rename(temp_path_.c_str(), final_path_.c_str()) != 0) {
        int err = errno;
        abort();
        throw_errno(err, "Cannot replace", final_path_);
    }
    committed_ = true;
}

void FileWriter::abort() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (!committed_ && !temp_path_.empty()) {
        ::unlink(temp_path_.c_str());
        temp_path_.clear();
    }
}

// ============================================================
// DirectoryStore
// ============================================================

DirectoryStore::DirectoryStore(const fs::path& root) : root_(root) {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        throw FileIoError("Not a directory: '" + root_.string() + "'");
    }
}

std::vector<std::string> DirectoryStore::list() const {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name.empty() || name[0] == '.') continue;
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;
        names.push_back(name);
    }
    if (ec) {
        throw FileIoError("Cannot list '" + root_.string() + "': " + ec.message());
    }
    std::sort(names.begin(), names.end());
    return names;
}

fs::path DirectoryStore::resolve(const std::string& name) const {
    if (!is_plain_file_name(name)) {
        throw InvalidFileName("invalid file name '" + name + "'");
    }
    return root_ / name;
}

bool DirectoryStore::exists(const std::string& name) const {
    if (!is_plain_file_name(name)) return false;
    std::error_code ec;
    return fs::is_regular_file(root_ / name, ec);
}

std::unique_ptr<FileReader> DirectoryStore::open_read(const std::string& name) const {
    fs::path p = resolve(name);
    if (!exists(name)) {
        throw FileNotFound("'" + name + "' is not a file");
    }
    return std::make_unique<FileReader>(p.string());
}

std::unique_ptr<FileWriter> DirectoryStore::open_write(const std::string& name) {
    fs::path p = resolve(name);
    return std::make_unique<FileWriter>(p.string());
}

// ============================================================
// Utility functions
// ============================================================

bool file_io::is_plain_file_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    for (char c : name) {
        if (c == '/' || c == '\\' || c == '\0') return false;
    }
    return true;
}

fs::path file_io::unique_local_path(const fs::path& dir, const std::string& name) {
    fs::path base = fs::path(name).filename();
    fs::path candidate = dir / base;
    std::error_code ec;
    if (!fs::exists(candidate, ec)) return candidate;

    std::string stem = base.stem().string();
    std::string ext  = base.extension().string();
    for (u32 n = 1;; ++n) {
        candidate = dir / (stem + "(" + std::to_string(n) + ")" + ext);
        if (!fs::exists(candidate, ec)) return candidate;
    }
}
