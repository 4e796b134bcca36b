#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/types.h>
#include <zlib.h>

namespace corvus::tasks::archive
{

// Thrown by the writers; buildArchive() turns it into an error message.
class ArchiveError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class OutputSink
{
public:
    virtual ~OutputSink() = default;
    virtual void write(const void *data, std::size_t size) = 0;
    virtual void finish() = 0;
};

// Buffered writer over a file descriptor. Supports the random access the zip
// writer needs to patch local headers.
class FileSink : public OutputSink
{
public:
    explicit FileSink(const std::filesystem::path &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const void *data, std::size_t size) override;
    void finish() override;

    std::uint64_t position() const noexcept { return flushed_ + buffer_.size(); }
    void writeAt(std::uint64_t offset, const void *data, std::size_t size);
    void truncate(std::uint64_t offset);

    dev_t device() const noexcept { return device_; }
    ino_t inode() const noexcept { return inode_; }

private:
    void flush();

    std::filesystem::path path_;
    int fd_ = -1;
    std::uint64_t flushed_ = 0;
    std::vector<unsigned char> buffer_;
    dev_t device_ = 0;
    ino_t inode_ = 0;
};

// gzip member around another sink (deflate with the gzip wrapper).
class GzipSink : public OutputSink
{
public:
    GzipSink(OutputSink &downstream, int level);
    ~GzipSink() override;

    GzipSink(const GzipSink &) = delete;
    GzipSink &operator=(const GzipSink &) = delete;

    void write(const void *data, std::size_t size) override;
    void finish() override;

private:
    void pump(int flush);

    OutputSink &downstream_;
    z_stream stream_{};
    bool active_ = false;
    std::vector<unsigned char> out_;
};

struct EntryInfo
{
    std::string name;            // archive member name, '/' separated, no trailing slash
    std::filesystem::path source; // file to read for regular entries
    bool directory = false;
    std::uint32_t mode = 0;       // permission bits
    std::uint64_t size = 0;
    std::time_t mtime = 0;
    uid_t uid = 0;
    gid_t gid = 0;
};

class ZipWriter
{
public:
    ZipWriter(FileSink &sink, int compressionLevel);

    void addDirectory(const EntryInfo &entry);
    void addFile(const EntryInfo &entry);
    void finish();

private:
    struct CentralEntry
    {
        std::string name;
        std::uint16_t method = 0;
        std::uint16_t dosTime = 0;
        std::uint16_t dosDate = 0;
        std::uint32_t crc = 0;
        std::uint32_t compressedSize = 0;
        std::uint32_t uncompressedSize = 0;
        std::uint32_t externalAttributes = 0;
        std::uint32_t localHeaderOffset = 0;
    };

    CentralEntry beginEntry(const EntryInfo &entry, const std::string &name);
    void writeLocalHeader(const CentralEntry &entry);

    FileSink &sink_;
    int level_;
    std::vector<CentralEntry> entries_;
};

class TarWriter
{
public:
    explicit TarWriter(OutputSink &sink);

    void addDirectory(const EntryInfo &entry);
    void addFile(const EntryInfo &entry);
    void finish();

private:
    void writeHeader(const EntryInfo &entry, const std::string &name, char typeflag, std::uint64_t size);
    void writeLongName(const std::string &name);
    void pad(std::uint64_t size);
    const std::string &userName(uid_t uid);
    const std::string &groupName(gid_t gid);

    OutputSink &sink_;
    std::map<uid_t, std::string> users_;
    std::map<gid_t, std::string> groups_;
};

} // namespace corvus::tasks::archive
