#include "FileStream.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "fmt/core.h"

FileStream::FileStream(const std::filesystem::path& path)
    : path_(path)
    , fd_(-1)
{
}

FileStream::FileStream(const std::filesystem::path& path, int fd) noexcept
    : path_(path)
    , fd_(fd)
{
}

FileStream::~FileStream()
{
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

FileStream::FileStream(FileStream&& other) noexcept
    : path_(std::move(other.path_))
    , fd_(other.fd_)
{
    other.fd_ = -1;
}

FileStream& FileStream::operator=(FileStream&& other) noexcept
{
    if (this == &other)
        return *this;

    if (fd_ >= 0)
        ::close(fd_);

    path_ = std::move(other.path_);
    fd_ = other.fd_;
    other.fd_ = -1;

    return *this;
}

std::tuple<bool, std::unique_ptr<FileStream>, FileStream::Error>
FileStream::CreateTemp(const std::filesystem::path& dir, std::string_view prefix) noexcept
{
    try {
        const std::string pattern = (dir / (std::string(prefix) + "XXXXXX")).string();
        std::vector<char> name(pattern.begin(), pattern.end());
        name.push_back('\0');

        const int fd = ::mkostemp(name.data(), O_CLOEXEC);
        if (fd < 0) {
            const int err = errno;
            return { false, nullptr, Error{ err, fmt::format("mkstemp: {} ({}), pattern={}", err, std::strerror(err), pattern) } };
        }

        return { true, std::make_unique<FileStream>(std::filesystem::path(name.data()), fd), Error{} };
    }
    catch (const std::exception& e) {
        return { false, nullptr, Error{ -1, fmt::format("mkstemp: {}", e.what()) } };
    }
}

const std::filesystem::path& FileStream::GetPath() const noexcept
{
    return path_;
}

int FileStream::GetDescriptor() const noexcept
{
    return fd_;
}

bool FileStream::IsOpen() const noexcept
{
    return fd_ >= 0;
}

std::optional<FileStream::Error> FileStream::Open(int flags, mode_t mode) noexcept
{
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }

    do {
        fd_ = ::open(path_.c_str(), flags | O_CLOEXEC, mode);
    } while (fd_ < 0 && errno == EINTR);

    if (fd_ < 0)
        return errno_error(errno, "open");

    return std::nullopt;
}

std::optional<FileStream::Error> FileStream::Write(std::string_view data) noexcept
{
    if (fd_ < 0)
        return Error{-1, "write: stream is not open"};

    const char* cursor = data.data();
    size_t remaining = data.size();

    while (remaining > 0) {
        const ssize_t n = ::write(fd_, cursor, remaining);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return errno_error(errno, "write");
        }

        cursor += n;
        remaining -= static_cast<size_t>(n);
    }

    return std::nullopt;
}

std::tuple<bool, ssize_t, FileStream::Error> FileStream::Read(char* data, size_t size) noexcept
{
    if (fd_ < 0)
        return { false, 0, Error{ -1, "read: stream is not open"} };

    if (size == 0)
        return { true, 0, Error{} };

    if (!data)
        return { false, 0, Error{ -1, "read: null buffer with non-zero size"} };

    ssize_t n;
    do {
        n = ::read(fd_, data, size);
    } while (n < 0 && errno == EINTR);

    if (n < 0)
        return { false, 0, errno_error(errno, "read") };

    return { true, n, Error{} };
}

std::optional<FileStream::Error> FileStream::Sync() noexcept
{
    if (fd_ < 0)
        return Error{-1, "sync: stream is not open"};

    if (::fsync(fd_) != 0)
        return errno_error(errno, "fsync");

    return std::nullopt;
}

std::optional<FileStream::Error> FileStream::Close() noexcept
{
    if (fd_ < 0)
        return std::nullopt;

    const int fd = fd_;
    fd_ = -1;

    // close() must not be retried on EINTR, the descriptor is gone either way
    if (::close(fd) != 0 && errno != EINTR)
        return errno_error(errno, "close");

    return std::nullopt;
}

std::optional<FileStream::Error> FileStream::Remove() noexcept
{
    if (path_.empty())
        return std::nullopt;

    if (::unlink(path_.c_str()) != 0 && errno != ENOENT)
        return errno_error(errno, "unlink");

    return std::nullopt;
}

FileStream::Error FileStream::errno_error(int err, const char* context) const
{
    return Error{ err, fmt::format("{}: errno={} ({}), path={}",
                                   context ? context : "stream", err, std::strerror(err), path_.string()) };
}
