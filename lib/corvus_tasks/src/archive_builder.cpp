#include "corvus/tasks/archive_builder.hpp"

#include "archive_writers.hpp"
#include "corvus/log.hpp"
#include "corvus/tasks/task.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <optional>
#include <system_error>
#include <utility>

#include <sys/stat.h>

namespace corvus::tasks
{
namespace
{
namespace fs = std::filesystem;
using archive::ArchiveError;
using archive::EntryInfo;

struct WalkState
{
    dev_t destinationDevice = 0;
    ino_t destinationInode = 0;
    std::vector<std::pair<dev_t, ino_t>> ancestors;

    bool isDestination(const struct stat &info) const noexcept
    {
        return info.st_dev == destinationDevice && info.st_ino == destinationInode;
    }

    bool isAncestor(const struct stat &info) const
    {
        return std::find(ancestors.begin(), ancestors.end(), std::make_pair(info.st_dev, info.st_ino)) !=
               ancestors.end();
    }
};

// stat(2) rather than lstat(2): symbolic links are archived as their targets.
struct stat statOrThrow(const fs::path &path)
{
    struct stat info{};
    if (::stat(path.c_str(), &info) == -1)
        throw ArchiveError("cannot archive '" + path.string() + "': " + std::strerror(errno));
    return info;
}

EntryInfo makeEntry(const struct stat &info, std::string name, const fs::path &source)
{
    EntryInfo entry;
    entry.name = std::move(name);
    entry.source = source;
    entry.directory = S_ISDIR(info.st_mode);
    entry.mode = static_cast<std::uint32_t>(info.st_mode & 07777);
    entry.size = entry.directory ? 0 : static_cast<std::uint64_t>(info.st_size);
    entry.mtime = info.st_mtime;
    entry.uid = info.st_uid;
    entry.gid = info.st_gid;
    return entry;
}

std::string joinName(const std::string &prefix, const std::string &name)
{
    return prefix.empty() ? name : prefix + "/" + name;
}

void logSkippedSpecial(const fs::path &path)
{
    CORVUS_LOG_WARN("archive: skipping special file '" + path.string() + "'");
}

std::vector<fs::path> sortedChildren(const fs::path &directory)
{
    std::vector<fs::path> children;
    std::error_code ec;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec))
        children.push_back(it->path());
    if (ec)
        throw ArchiveError("cannot read directory '" + directory.string() + "': " + ec.message());
    std::sort(children.begin(), children.end(),
              [](const fs::path &a, const fs::path &b) { return a.filename().string() < b.filename().string(); });
    return children;
}

template <class Writer>
void walkDirectory(Writer &writer, const fs::path &directory, const std::string &prefix, WalkState &state)
{
    for (const fs::path &child : sortedChildren(directory))
    {
        struct stat info = statOrThrow(child);
        std::string name = joinName(prefix, child.filename().string());

        if (S_ISDIR(info.st_mode))
        {
            if (state.isAncestor(info))
            {
                CORVUS_LOG_WARN("archive: skipping '" + child.string() + "': symbolic link loop");
                continue;
            }
            writer.addDirectory(makeEntry(info, name, child));
            state.ancestors.emplace_back(info.st_dev, info.st_ino);
            walkDirectory(writer, child, name, state);
            state.ancestors.pop_back();
        }
        else if (S_ISREG(info.st_mode))
        {
            if (state.isDestination(info))
            {
                CORVUS_LOG_DEBUG("archive: skipping the archive itself at '" + child.string() + "'");
                continue;
            }
            CORVUS_LOG_TRACE("archive: adding '" + name + "'");
            writer.addFile(makeEntry(info, name, child));
        }
        else
        {
            logSkippedSpecial(child);
        }
    }
}

// Member name for a file given directly to a tar archive: the path with its
// root and any leading "." or ".." components removed.
std::string tarMemberName(const fs::path &input)
{
    fs::path cleaned;
    for (const fs::path &part : input.lexically_normal().relative_path())
    {
        if (part.empty() || part == "." || part == "..")
            continue;
        cleaned /= part;
    }
    if (cleaned.empty())
        return input.filename().string();
    return cleaned.generic_string();
}

// Name a directory input is stored under in a tar archive.
std::string directoryMemberName(const fs::path &input)
{
    auto lastComponent = [](fs::path path) {
        path = path.lexically_normal();
        if (!path.has_filename() && path.has_relative_path())
            path = path.parent_path();
        return path.filename();
    };

    fs::path name = lastComponent(input);
    if (name.empty() || name == "." || name == "..")
    {
        std::error_code ec;
        fs::path absolute = fs::absolute(input, ec);
        if (!ec)
            name = lastComponent(absolute);
    }
    if (name == "." || name == "..")
        return {};
    return name.string();
}

template <class Writer>
void addZipInput(Writer &writer, const fs::path &input, WalkState &state)
{
    struct stat info = statOrThrow(input);
    if (S_ISDIR(info.st_mode))
    {
        state.ancestors.emplace_back(info.st_dev, info.st_ino);
        walkDirectory(writer, input, std::string(), state);
        state.ancestors.pop_back();
    }
    else if (S_ISREG(info.st_mode))
    {
        if (!state.isDestination(info))
            writer.addFile(makeEntry(info, input.filename().string(), input));
    }
    else
    {
        logSkippedSpecial(input);
    }
}

template <class Writer>
void addTarInput(Writer &writer, const fs::path &input, WalkState &state)
{
    struct stat info = statOrThrow(input);
    if (S_ISDIR(info.st_mode))
    {
        std::string name = directoryMemberName(input);
        if (!name.empty())
            writer.addDirectory(makeEntry(info, name, input));
        state.ancestors.emplace_back(info.st_dev, info.st_ino);
        walkDirectory(writer, input, name, state);
        state.ancestors.pop_back();
    }
    else if (S_ISREG(info.st_mode))
    {
        if (!state.isDestination(info))
            writer.addFile(makeEntry(info, tarMemberName(input), input));
    }
    else
    {
        logSkippedSpecial(input);
    }
}

void assignError(std::string *errorMessage, const std::string &text)
{
    if (errorMessage)
        *errorMessage = text;
}

} // namespace

bool buildArchive(const std::vector<std::filesystem::path> &inputs,
                  const std::filesystem::path &destination,
                  std::string_view formatTag,
                  const ArchiveOptions &options,
                  std::string *errorMessage)
{
    std::optional<ArchiveFormat> format = parseArchiveFormat(formatTag);
    if (!format)
    {
        assignError(errorMessage, "Unsupported archive format: " + std::string(formatTag));
        return false;
    }
    if (options.compressionLevel < -1 || options.compressionLevel > 9)
    {
        assignError(errorMessage, "invalid compression level " + std::to_string(options.compressionLevel));
        return false;
    }

    CORVUS_LOG_DEBUG("archive: writing " + std::to_string(inputs.size()) + " inputs to '" + destination.string() +
                     "' as " + archiveFormatTag(*format));

    bool created = false;
    std::string failure;
    try
    {
        archive::FileSink file(destination);
        created = true;
        WalkState state;
        state.destinationDevice = file.device();
        state.destinationInode = file.inode();

        switch (*format)
        {
        case ArchiveFormat::Zip:
        {
            archive::ZipWriter writer(file, options.compressionLevel);
            for (const auto &input : inputs)
                addZipInput(writer, input, state);
            writer.finish();
            break;
        }
        case ArchiveFormat::Tar:
        {
            archive::TarWriter writer(file);
            for (const auto &input : inputs)
                addTarInput(writer, input, state);
            writer.finish();
            break;
        }
        case ArchiveFormat::TarGz:
        {
            archive::GzipSink gzip(file, options.compressionLevel);
            archive::TarWriter writer(gzip);
            for (const auto &input : inputs)
                addTarInput(writer, input, state);
            writer.finish();
            break;
        }
        }
        return true;
    }
    catch (const ArchiveError &error)
    {
        failure = error.what();
    }
    catch (const std::exception &error)
    {
        failure = std::string("cannot write '") + destination.string() + "': " + error.what();
    }

    if (created)
    {
        std::error_code ec;
        fs::remove(destination, ec);
        if (ec)
            CORVUS_LOG_WARN("archive: cannot remove partial '" + destination.string() + "': " + ec.message());
    }
    assignError(errorMessage, failure);
    return false;
}

} // namespace corvus::tasks
