#pragma once

// ============================================================
// file_io.hpp -- File storage collaborator
//
// The protocol engine only sees FileStore: list the working
// directory, test for a file, open one for streaming read, open
// one for staged write. DirectoryStore implements it over a
// single local directory.
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <memory>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- FileReader: sequential read of one regular file ----
class FileReader {
public:
    // Throws FileNotFound, PermissionDenied or FileIoError
    explicit FileReader(const std::string& path);
    ~FileReader();

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    // Size at open time
    u64 size() const { return size_; }
    const std::string& path() const { return path_; }

    // Read up to len bytes; returns 0 at end of file.
    // Throws FileIoError on a read error.
    size_t read(void* buf, size_t len);

    void close();

private:
    std::string path_;
    int fd_{-1};
    u64 size_{0};
};

// ---- FileWriter: write to a private temporary, rename on commit ----
//
// Nothing is visible at the destination until commit(). Destroying an
// uncommitted writer removes the temporary, so an aborted upload
// leaves the destination as it was.
class FileWriter {
public:
    // Throws PermissionDenied or FileIoError
    explicit FileWriter(const std::string& final_path);
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Append len bytes; throws FileIoError (e.g. disk full)
    void write(const void* data, size_t len);

    // Flush, close, and atomically replace the destination
    void commit();

    // Drop the temporary without touching the destination
    void abort();

    u64 bytes_written() const { return written_; }
    const std::string& final_path() const { return final_path_; }
    const std::string& temp_path() const { return temp_path_; }

private:
    std::string final_path_;
    std::string temp_path_;
    int fd_{-1};
    u64 written_{0};
    bool committed_{false};
};

// ---- Storage capability consumed by the protocol engine ----
class FileStore {
public:
    virtual ~FileStore() = default;

    // Names of the entries in the working directory, ordered
    virtual std::vector<std::string> list() const = 0;

    virtual bool exists(const std::string& name) const = 0;

    virtual std::unique_ptr<FileReader> open_read(const std::string& name) const = 0;

    virtual std::unique_ptr<FileWriter> open_write(const std::string& name) = 0;
};

// ---- DirectoryStore: FileStore over one local directory ----
class DirectoryStore : public FileStore {
public:
    explicit DirectoryStore(const fs::path& root);

    // Regular files whose names do not begin with '.', sorted by name
    std::vector<std::string> list() const override;

    bool exists(const std::string& name) const override;

    std::unique_ptr<FileReader> open_read(const std::string& name) const override;

    std::unique_ptr<FileWriter> open_write(const std::string& name) override;

    // Map a client-supplied name to a path inside root.
    // Throws InvalidFileName for anything that is not a plain file name.
    fs::path resolve(const std::string& name) const;

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
};

// ---- Utility functions ----

// Reject names that are empty, contain a separator or NUL, or are "."/".."
bool is_plain_file_name(const std::string& name);

// First of name, name(1).ext, name(2).ext, ... that does not exist in dir
fs::path unique_local_path(const fs::path& dir, const std::string& name);

} // namespace file_io
