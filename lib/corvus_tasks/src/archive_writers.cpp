#include "archive_writers.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <limits>

#include <fcntl.h>
#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace corvus::tasks::archive
{
namespace
{

constexpr std::size_t kBufferSize = 64 * 1024;
constexpr std::uint64_t kZipLimit = std::numeric_limits<std::uint32_t>::max();
constexpr std::size_t kZipEntryLimit = 0xFFFF;

constexpr std::uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr std::uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr std::uint32_t kEndOfCentralDirectorySignature = 0x06054b50;
constexpr std::uint16_t kZipVersion = 20;
constexpr std::uint16_t kZipMadeByUnix = (3 << 8) | kZipVersion;
constexpr std::uint16_t kZipUtf8Flag = 0x0800;
constexpr std::uint16_t kZipStored = 0;
constexpr std::uint16_t kZipDeflated = 8;

constexpr std::size_t kTarBlock = 512;

std::string systemError(const char *verb, const std::filesystem::path &path, int error)
{
    return std::string("cannot ") + verb + " '" + path.string() + "': " + std::strerror(error);
}

void writeAll(int fd, const void *data, std::size_t size, const std::filesystem::path &path)
{
    const auto *bytes = static_cast<const unsigned char *>(data);
    while (size > 0)
    {
        ssize_t written = ::write(fd, bytes, size);
        if (written == -1)
        {
            if (errno == EINTR)
                continue;
            throw ArchiveError(systemError("write", path, errno));
        }
        bytes += written;
        size -= static_cast<std::size_t>(written);
    }
}

class InputFile
{
public:
    explicit InputFile(const std::filesystem::path &path)
        : path_(path)
    {
        fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd_ == -1)
            throw ArchiveError(systemError("open", path, errno));
    }

    ~InputFile()
    {
        if (fd_ != -1)
            ::close(fd_);
    }

    InputFile(const InputFile &) = delete;
    InputFile &operator=(const InputFile &) = delete;

    std::size_t read(unsigned char *buffer, std::size_t size)
    {
        for (;;)
        {
            ssize_t count = ::read(fd_, buffer, size);
            if (count >= 0)
                return static_cast<std::size_t>(count);
            if (errno != EINTR)
                throw ArchiveError(systemError("read", path_, errno));
        }
    }

    void rewind()
    {
        if (::lseek(fd_, 0, SEEK_SET) == -1)
            throw ArchiveError(systemError("read", path_, errno));
    }

private:
    std::filesystem::path path_;
    int fd_ = -1;
};

// Raw deflate (no zlib or gzip wrapper) as zip method 8 expects.
class RawDeflater
{
public:
    explicit RawDeflater(int level)
    {
        if (deflateInit2(&stream_, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK)
            throw ArchiveError("cannot initialise deflate compressor");
        out_.resize(kBufferSize);
    }

    ~RawDeflater() { deflateEnd(&stream_); }

    RawDeflater(const RawDeflater &) = delete;
    RawDeflater &operator=(const RawDeflater &) = delete;

    // Returns the number of compressed bytes written to the sink.
    std::uint64_t feed(const unsigned char *data, std::size_t size, int flush, OutputSink &sink)
    {
        std::uint64_t produced = 0;
        stream_.next_in = const_cast<Bytef *>(data);
        stream_.avail_in = static_cast<uInt>(size);
        for (;;)
        {
            stream_.next_out = out_.data();
            stream_.avail_out = static_cast<uInt>(out_.size());
            int rc = deflate(&stream_, flush);
            if (rc == Z_STREAM_ERROR)
                throw ArchiveError("deflate failed");
            std::size_t have = out_.size() - stream_.avail_out;
            if (have > 0)
            {
                sink.write(out_.data(), have);
                produced += have;
            }
            if (flush == Z_FINISH)
            {
                if (rc == Z_STREAM_END)
                    return produced;
                continue;
            }
            if (stream_.avail_out != 0)
                return produced;
        }
    }

private:
    z_stream stream_{};
    std::vector<unsigned char> out_;
};

void put16(std::vector<unsigned char> &out, std::uint16_t value)
{
    out.push_back(static_cast<unsigned char>(value & 0xFF));
    out.push_back(static_cast<unsigned char>((value >> 8) & 0xFF));
}

void put32(std::vector<unsigned char> &out, std::uint32_t value)
{
    for (int shift = 0; shift < 32; shift += 8)
        out.push_back(static_cast<unsigned char>((value >> shift) & 0xFF));
}

void dosDateTime(std::time_t mtime, std::uint16_t &dosTime, std::uint16_t &dosDate)
{
    std::tm local{};
    localtime_r(&mtime, &local);
    if (local.tm_year < 80)
    {
        // DOS dates start at 1980-01-01.
        dosTime = 0;
        dosDate = (1 << 5) | 1;
        return;
    }
    dosTime = static_cast<std::uint16_t>((local.tm_hour << 11) | (local.tm_min << 5) | (local.tm_sec / 2));
    dosDate = static_cast<std::uint16_t>(((local.tm_year - 80) << 9) | ((local.tm_mon + 1) << 5) | local.tm_mday);
}

struct TarHeader
{
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char checksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];
    char version[2];
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char pad[12];
};

static_assert(sizeof(TarHeader) == kTarBlock, "tar header must be one block");

// Octal with a terminating NUL when the value fits, GNU base-256 otherwise.
template <std::size_t N>
void writeNumber(char (&field)[N], std::uint64_t value)
{
    constexpr std::size_t digits = N - 1;
    if (digits * 3 >= 64 || value < (std::uint64_t{1} << (digits * 3)))
    {
        for (std::size_t i = digits; i-- > 0;)
        {
            field[i] = static_cast<char>('0' + (value & 7));
            value >>= 3;
        }
        field[digits] = '\0';
        return;
    }
    std::memset(field, 0, N);
    for (std::size_t i = N; i-- > 1 && value > 0;)
    {
        field[i] = static_cast<char>(value & 0xFF);
        value >>= 8;
    }
    field[0] = static_cast<char>(0x80);
}

template <std::size_t N>
void copyField(char (&field)[N], const std::string &text)
{
    std::memcpy(field, text.data(), std::min(text.size(), N));
}

void finishChecksum(TarHeader &header)
{
    std::memset(header.checksum, ' ', sizeof(header.checksum));
    std::uint32_t sum = 0;
    const auto *bytes = reinterpret_cast<const unsigned char *>(&header);
    for (std::size_t i = 0; i < sizeof(TarHeader); ++i)
        sum += bytes[i];
    char digits[8];
    std::snprintf(digits, sizeof(digits), "%06o", sum & 0777777);
    std::memcpy(header.checksum, digits, 6);
    header.checksum[6] = '\0';
    header.checksum[7] = ' ';
}

// Splits a long member name into the ustar prefix and name fields at a '/'.
bool splitUstarName(const std::string &name, std::string &prefix, std::string &shortName)
{
    if (name.size() <= sizeof(TarHeader::name))
    {
        prefix.clear();
        shortName = name;
        return true;
    }
    std::size_t from = name.size() - sizeof(TarHeader::name) - 1;
    std::size_t slash = name.find('/', from);
    if (slash == std::string::npos || slash == 0 || slash > sizeof(TarHeader::prefix) || slash + 1 == name.size())
        return false;
    prefix = name.substr(0, slash);
    shortName = name.substr(slash + 1);
    return true;
}

} // namespace

FileSink::FileSink(const std::filesystem::path &path)
    : path_(path)
{
    fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ == -1)
        throw ArchiveError(systemError("create", path, errno));
    struct stat info{};
    if (::fstat(fd_, &info) == 0)
    {
        device_ = info.st_dev;
        inode_ = info.st_ino;
    }
    buffer_.reserve(kBufferSize);
}

FileSink::~FileSink()
{
    if (fd_ != -1)
        ::close(fd_);
}

void FileSink::write(const void *data, std::size_t size)
{
    if (buffer_.size() + size > kBufferSize)
        flush();
    if (size >= kBufferSize)
    {
        writeAll(fd_, data, size, path_);
        flushed_ += size;
        return;
    }
    const auto *bytes = static_cast<const unsigned char *>(data);
    buffer_.insert(buffer_.end(), bytes, bytes + size);
}

void FileSink::flush()
{
    if (buffer_.empty())
        return;
    writeAll(fd_, buffer_.data(), buffer_.size(), path_);
    flushed_ += buffer_.size();
    buffer_.clear();
}

void FileSink::writeAt(std::uint64_t offset, const void *data, std::size_t size)
{
    flush();
    const auto *bytes = static_cast<const unsigned char *>(data);
    while (size > 0)
    {
        ssize_t written = ::pwrite(fd_, bytes, size, static_cast<off_t>(offset));
        if (written == -1)
        {
            if (errno == EINTR)
                continue;
            throw ArchiveError(systemError("write", path_, errno));
        }
        bytes += written;
        offset += static_cast<std::uint64_t>(written);
        size -= static_cast<std::size_t>(written);
    }
}

void FileSink::truncate(std::uint64_t offset)
{
    flush();
    if (::ftruncate(fd_, static_cast<off_t>(offset)) == -1 || ::lseek(fd_, static_cast<off_t>(offset), SEEK_SET) == -1)
        throw ArchiveError(systemError("write", path_, errno));
    flushed_ = offset;
}

void FileSink::finish()
{
    flush();
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) == -1)
        throw ArchiveError(systemError("write", path_, errno));
}

GzipSink::GzipSink(OutputSink &downstream, int level)
    : downstream_(downstream)
{
    if (deflateInit2(&stream_, level, Z_DEFLATED, MAX_WBITS + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        throw ArchiveError("cannot initialise gzip compressor");
    active_ = true;
    out_.resize(kBufferSize);
}

GzipSink::~GzipSink()
{
    if (active_)
        deflateEnd(&stream_);
}

void GzipSink::write(const void *data, std::size_t size)
{
    const auto *bytes = static_cast<const unsigned char *>(data);
    while (size > 0)
    {
        std::size_t chunk = std::min(size, kBufferSize);
        stream_.next_in = const_cast<Bytef *>(bytes);
        stream_.avail_in = static_cast<uInt>(chunk);
        pump(Z_NO_FLUSH);
        bytes += chunk;
        size -= chunk;
    }
}

void GzipSink::pump(int flush)
{
    for (;;)
    {
        stream_.next_out = out_.data();
        stream_.avail_out = static_cast<uInt>(out_.size());
        int rc = deflate(&stream_, flush);
        if (rc == Z_STREAM_ERROR)
            throw ArchiveError("gzip compression failed");
        std::size_t have = out_.size() - stream_.avail_out;
        if (have > 0)
            downstream_.write(out_.data(), have);
        if (flush == Z_FINISH)
        {
            if (rc == Z_STREAM_END)
                return;
            continue;
        }
        if (stream_.avail_out != 0)
            return;
    }
}

void GzipSink::finish()
{
    stream_.next_in = nullptr;
    stream_.avail_in = 0;
    pump(Z_FINISH);
    deflateEnd(&stream_);
    active_ = false;
    downstream_.finish();
}

ZipWriter::ZipWriter(FileSink &sink, int compressionLevel)
    : sink_(sink),
      level_(compressionLevel)
{
}

ZipWriter::CentralEntry ZipWriter::beginEntry(const EntryInfo &entry, const std::string &name)
{
    if (entries_.size() >= kZipEntryLimit)
        throw ArchiveError("too many entries for a zip archive (limit 65535)");
    if (name.size() > 0xFFFF)
        throw ArchiveError("entry name too long: " + name.substr(0, 64) + "...");
    if (sink_.position() > kZipLimit)
        throw ArchiveError("zip archive exceeds 4 GiB (zip64 is not supported)");

    CentralEntry central;
    central.name = name;
    central.localHeaderOffset = static_cast<std::uint32_t>(sink_.position());
    dosDateTime(entry.mtime, central.dosTime, central.dosDate);
    std::uint32_t type = entry.directory ? S_IFDIR : S_IFREG;
    central.externalAttributes = ((type | (entry.mode & 07777)) << 16) | (entry.directory ? 0x10u : 0u);
    return central;
}

void ZipWriter::writeLocalHeader(const CentralEntry &entry)
{
    std::vector<unsigned char> header;
    header.reserve(30 + entry.name.size());
    put32(header, kLocalHeaderSignature);
    put16(header, kZipVersion);
    put16(header, kZipUtf8Flag);
    put16(header, entry.method);
    put16(header, entry.dosTime);
    put16(header, entry.dosDate);
    put32(header, entry.crc);
    put32(header, entry.compressedSize);
    put32(header, entry.uncompressedSize);
    put16(header, static_cast<std::uint16_t>(entry.name.size()));
    put16(header, 0);
    header.insert(header.end(), entry.name.begin(), entry.name.end());
    sink_.write(header.data(), header.size());
}

void ZipWriter::addDirectory(const EntryInfo &entry)
{
    CentralEntry central = beginEntry(entry, entry.name + "/");
    central.method = kZipStored;
    writeLocalHeader(central);
    entries_.push_back(std::move(central));
}

void ZipWriter::addFile(const EntryInfo &entry)
{
    CentralEntry central = beginEntry(entry, entry.name);
    central.method = kZipDeflated;
    writeLocalHeader(central);
    const std::uint64_t dataStart = sink_.position();

    InputFile input(entry.source);
    std::vector<unsigned char> buffer(kBufferSize);
    uLong crc = crc32(0L, Z_NULL, 0);
    std::uint64_t uncompressed = 0;
    std::uint64_t compressed = 0;
    {
        RawDeflater deflater(level_);
        std::size_t count = 0;
        while ((count = input.read(buffer.data(), buffer.size())) > 0)
        {
            crc = crc32(crc, buffer.data(), static_cast<uInt>(count));
            uncompressed += count;
            compressed += deflater.feed(buffer.data(), count, Z_NO_FLUSH, sink_);
        }
        compressed += deflater.feed(nullptr, 0, Z_FINISH, sink_);
    }
    if (uncompressed > kZipLimit)
        throw ArchiveError("'" + entry.source.string() + "' exceeds 4 GiB (zip64 is not supported)");

    if (compressed >= uncompressed)
    {
        // Deflate did not help; rewrite the data stored.
        sink_.truncate(dataStart);
        input.rewind();
        std::uint64_t copied = 0;
        std::size_t count = 0;
        while (copied < uncompressed && (count = input.read(buffer.data(), buffer.size())) > 0)
        {
            count = static_cast<std::size_t>(std::min<std::uint64_t>(count, uncompressed - copied));
            sink_.write(buffer.data(), count);
            copied += count;
        }
        if (copied != uncompressed)
            throw ArchiveError("'" + entry.source.string() + "' changed size while being archived");
        central.method = kZipStored;
        compressed = uncompressed;
    }

    central.crc = static_cast<std::uint32_t>(crc);
    central.compressedSize = static_cast<std::uint32_t>(compressed);
    central.uncompressedSize = static_cast<std::uint32_t>(uncompressed);

    std::vector<unsigned char> method;
    put16(method, central.method);
    sink_.writeAt(central.localHeaderOffset + 8, method.data(), method.size());

    std::vector<unsigned char> sizes;
    put32(sizes, central.crc);
    put32(sizes, central.compressedSize);
    put32(sizes, central.uncompressedSize);
    sink_.writeAt(central.localHeaderOffset + 14, sizes.data(), sizes.size());

    entries_.push_back(std::move(central));
}

void ZipWriter::finish()
{
    const std::uint64_t directoryOffset = sink_.position();
    if (directoryOffset > kZipLimit)
        throw ArchiveError("zip archive exceeds 4 GiB (zip64 is not supported)");

    for (const auto &entry : entries_)
    {
        std::vector<unsigned char> header;
        header.reserve(46 + entry.name.size());
        put32(header, kCentralHeaderSignature);
        put16(header, kZipMadeByUnix);
        put16(header, kZipVersion);
        put16(header, kZipUtf8Flag);
        put16(header, entry.method);
        put16(header, entry.dosTime);
        put16(header, entry.dosDate);
        put32(header, entry.crc);
        put32(header, entry.compressedSize);
        put32(header, entry.uncompressedSize);
        put16(header, static_cast<std::uint16_t>(entry.name.size()));
        put16(header, 0); // extra
        put16(header, 0); // comment
        put16(header, 0); // disk
        put16(header, 0); // internal attributes
        put32(header, entry.externalAttributes);
        put32(header, entry.localHeaderOffset);
        header.insert(header.end(), entry.name.begin(), entry.name.end());
        sink_.write(header.data(), header.size());
    }

    const std::uint64_t directorySize = sink_.position() - directoryOffset;
    if (directorySize > kZipLimit)
        throw ArchiveError("zip central directory exceeds 4 GiB (zip64 is not supported)");

    std::vector<unsigned char> end;
    put32(end, kEndOfCentralDirectorySignature);
    put16(end, 0);
    put16(end, 0);
    put16(end, static_cast<std::uint16_t>(entries_.size()));
    put16(end, static_cast<std::uint16_t>(entries_.size()));
    put32(end, static_cast<std::uint32_t>(directorySize));
    put32(end, static_cast<std::uint32_t>(directoryOffset));
    put16(end, 0);
    sink_.write(end.data(), end.size());
    sink_.finish();
}

TarWriter::TarWriter(OutputSink &sink)
    : sink_(sink)
{
}

void TarWriter::addDirectory(const EntryInfo &entry)
{
    writeHeader(entry, entry.name + "/", '5', 0);
}

void TarWriter::addFile(const EntryInfo &entry)
{
    writeHeader(entry, entry.name, '0', entry.size);

    InputFile input(entry.source);
    std::vector<unsigned char> buffer(kBufferSize);
    std::uint64_t remaining = entry.size;
    while (remaining > 0)
    {
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
        std::size_t count = input.read(buffer.data(), want);
        if (count == 0)
            throw ArchiveError("'" + entry.source.string() + "' changed size while being archived");
        sink_.write(buffer.data(), count);
        remaining -= count;
    }
    pad(entry.size);
}

void TarWriter::writeHeader(const EntryInfo &entry, const std::string &name, char typeflag, std::uint64_t size)
{
    std::string prefix;
    std::string shortName;
    if (!splitUstarName(name, prefix, shortName))
    {
        writeLongName(name);
        prefix.clear();
        shortName = name.substr(0, sizeof(TarHeader::name));
    }

    TarHeader header{};
    copyField(header.name, shortName);
    writeNumber(header.mode, entry.mode & 07777);
    writeNumber(header.uid, entry.uid);
    writeNumber(header.gid, entry.gid);
    writeNumber(header.size, size);
    writeNumber(header.mtime, entry.mtime > 0 ? static_cast<std::uint64_t>(entry.mtime) : 0);
    header.typeflag = typeflag;
    std::memcpy(header.magic, "ustar", 6);
    std::memcpy(header.version, "00", 2);
    copyField(header.uname, userName(entry.uid).substr(0, sizeof(header.uname) - 1));
    copyField(header.gname, groupName(entry.gid).substr(0, sizeof(header.gname) - 1));
    copyField(header.prefix, prefix);
    finishChecksum(header);
    sink_.write(&header, sizeof(header));
}

void TarWriter::writeLongName(const std::string &name)
{
    TarHeader header{};
    copyField(header.name, std::string("././@LongLink"));
    writeNumber(header.mode, 0644);
    writeNumber(header.uid, 0);
    writeNumber(header.gid, 0);
    writeNumber(header.size, name.size() + 1);
    writeNumber(header.mtime, 0);
    header.typeflag = 'L';
    std::memcpy(header.magic, "ustar", 6);
    std::memcpy(header.version, "00", 2);
    finishChecksum(header);
    sink_.write(&header, sizeof(header));
    sink_.write(name.c_str(), name.size() + 1);
    pad(name.size() + 1);
}

void TarWriter::pad(std::uint64_t size)
{
    static const std::array<char, kTarBlock> zeros{};
    std::size_t remainder = static_cast<std::size_t>(size % kTarBlock);
    if (remainder != 0)
        sink_.write(zeros.data(), kTarBlock - remainder);
}

void TarWriter::finish()
{
    static const std::array<char, 2 * kTarBlock> trailer{};
    sink_.write(trailer.data(), trailer.size());
    sink_.finish();
}

const std::string &TarWriter::userName(uid_t uid)
{
    auto it = users_.find(uid);
    if (it != users_.end())
        return it->second;

    std::string name;
    long hint = sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buffer(hint > 0 ? static_cast<std::size_t>(hint) : 16384);
    passwd entry{};
    passwd *result = nullptr;
    if (getpwuid_r(uid, &entry, buffer.data(), buffer.size(), &result) == 0 && result)
        name = result->pw_name;
    return users_.emplace(uid, std::move(name)).first->second;
}

const std::string &TarWriter::groupName(gid_t gid)
{
    auto it = groups_.find(gid);
    if (it != groups_.end())
        return it->second;

    std::string name;
    long hint = sysconf(_SC_GETGR_R_SIZE_MAX);
    std::vector<char> buffer(hint > 0 ? static_cast<std::size_t>(hint) : 16384);
    group entry{};
    group *result = nullptr;
    if (getgrgid_r(gid, &entry, buffer.data(), buffer.size(), &result) == 0 && result)
        name = result->gr_name;
    return groups_.emplace(gid, std::move(name)).first->second;
}

} // namespace corvus::tasks::archive
