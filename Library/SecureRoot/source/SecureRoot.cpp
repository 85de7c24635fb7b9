#include "SecureRoot.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <linux/openat2.h>
#include <sys/syscall.h>
#include <unistd.h>

#include "fmt/core.h"

namespace {
	constexpr int kDirectoryFlags = O_PATH | O_DIRECTORY | O_CLOEXEC;
	constexpr uint64_t kResolveFlags = RESOLVE_BENEATH | RESOLVE_NO_SYMLINKS | RESOLVE_NO_MAGICLINKS;

	bool force_component_walk = false;

	class ScopedFd
	{
	public:
		explicit ScopedFd(int fd) noexcept : fd_(fd) { }
		~ScopedFd() { if (fd_ >= 0) ::close(fd_); }

		ScopedFd(const ScopedFd&) = delete;
		ScopedFd& operator=(const ScopedFd&) = delete;

		int Get() const noexcept { return fd_; }
		int Release() noexcept { const int fd = fd_; fd_ = -1; return fd; }
		void Reset(int fd) noexcept { if (fd_ >= 0) ::close(fd_); fd_ = fd; }

	private:
		int fd_;
	};

	int OpenAt2(int dirfd, const char* path, uint64_t flags, uint64_t resolve)
	{
		struct open_how how;
		std::memset(&how, 0, sizeof(how));
		how.flags = flags;
		how.resolve = resolve;

		long fd;
		do {
			fd = ::syscall(SYS_openat2, dirfd, path, &how, sizeof(how));
		} while (fd < 0 && (errno == EINTR || errno == EAGAIN));

		return static_cast<int>(fd);
	}
}

SecureRoot::SecureRoot(std::filesystem::path path, int fd) noexcept
	: path_(std::move(path))
	, fd_(fd)
{
}

SecureRoot::~SecureRoot()
{
	if (fd_ >= 0) {
		::close(fd_);
		fd_ = -1;
	}
}

bool SecureRoot::IsLocal(std::string_view name) noexcept
{
	if (name.empty() || name.find('\0') != std::string_view::npos)
		return false;

	try {
		const std::filesystem::path path(name);
		if (path.has_root_path())
			return false;

		const std::filesystem::path normal = path.lexically_normal();
		if (normal.empty() || !normal.has_filename() || normal == ".")
			return false;

		return *normal.begin() != "..";
	}
	catch (const std::exception&) {
		return false;
	}
}

std::tuple<bool, std::filesystem::path, std::string> SecureRoot::Split(std::string_view name)
{
	if (!IsLocal(name))
		return { false, {}, {} };

	const std::filesystem::path normal = std::filesystem::path(name).lexically_normal();

	return { true, normal.parent_path(), normal.filename().string() };
}

std::tuple<bool, std::unique_ptr<SecureRoot>, SecureRoot::Error>
SecureRoot::Open(const std::filesystem::path& dir) noexcept
{
	if (dir.empty())
		return { false, nullptr, Error{ EINVAL, "open root: empty directory path" } };

	const int fd = ::open(dir.c_str(), kDirectoryFlags);
	if (fd < 0) {
		const int err = errno;
		return { false, nullptr, Error{ err, fmt::format("open root: errno={} ({}), path={}", err, std::strerror(err), dir.string()) } };
	}

	return { true, std::unique_ptr<SecureRoot>(new SecureRoot(dir, fd)), Error{} };
}

const std::filesystem::path& SecureRoot::GetPath() const noexcept
{
	return path_;
}

int SecureRoot::GetDescriptor() const noexcept
{
	return fd_;
}

std::tuple<bool, std::unique_ptr<SecureRoot>, SecureRoot::Error>
SecureRoot::OpenDirectory(const std::filesystem::path& rel) noexcept
{
	try {
		const std::filesystem::path normal = rel.empty() ? std::filesystem::path(".") : rel.lexically_normal();
		if (normal.has_root_path())
			return { false, nullptr, EscapeError("open directory", normal.string()) };

		auto [fd, err] = ResolveBeneath(normal);
		if (fd < 0)
			return { false, nullptr, err };

		std::filesystem::path path = normal == "." ? path_ : path_ / normal;
		return { true, std::unique_ptr<SecureRoot>(new SecureRoot(std::move(path), fd)), Error{} };
	}
	catch (const std::exception& e) {
		return { false, nullptr, Error{ -1, fmt::format("open directory: {}", e.what()) } };
	}
}

void SecureRoot::ForceComponentWalk(bool enable) noexcept
{
	force_component_walk = enable;
}

std::tuple<int, SecureRoot::Error> SecureRoot::ResolveBeneath(const std::filesystem::path& rel) const
{
	if (force_component_walk)
		return WalkBeneath(rel);

	const int fd = OpenAt2(fd_, rel.c_str(), kDirectoryFlags, kResolveFlags);
	if (fd >= 0)
		return { fd, Error{} };

	// Kernels before 5.6, and some sandboxes, lack openat2
	if (errno == ENOSYS || errno == EPERM)
		return WalkBeneath(rel);

	// EXDEV: would leave the root, ELOOP: a symlink on the way
	if (errno == EXDEV || errno == ELOOP)
		return { -1, EscapeError("openat2", rel.string()) };

	return { -1, MakeError(errno, "openat2", rel.string()) };
}

std::tuple<int, SecureRoot::Error> SecureRoot::WalkBeneath(const std::filesystem::path& rel) const
{
	ScopedFd current(::openat(fd_, ".", kDirectoryFlags));
	if (current.Get() < 0)
		return { -1, MakeError(errno, "openat", ".") };

	for (const auto& component : rel) {
		const std::string name = component.string();
		if (name.empty() || name == ".")
			continue;

		// Same rules as openat2 with kResolveFlags, but ".." is refused outright
		if (name == "..")
			return { -1, EscapeError("walk", rel.string()) };

		struct stat st;
		if (::fstatat(current.Get(), name.c_str(), &st, AT_SYMLINK_NOFOLLOW) != 0)
			return { -1, MakeError(errno, "fstatat", rel.string()) };

		if (S_ISLNK(st.st_mode))
			return { -1, EscapeError("walk: symlink", rel.string()) };

		const int next = ::openat(current.Get(), name.c_str(), kDirectoryFlags | O_NOFOLLOW);
		if (next < 0)
			return { -1, MakeError(errno, "openat", rel.string()) };

		current.Reset(next);
	}

	return { current.Release(), Error{} };
}

std::tuple<bool, struct stat, SecureRoot::Error> SecureRoot::StatSelf() const noexcept
{
	struct stat st;
	std::memset(&st, 0, sizeof(st));

	if (::fstat(fd_, &st) != 0)
		return { false, st, MakeError(errno, "fstat", ".") };

	return { true, st, Error{} };
}

std::tuple<bool, struct stat, SecureRoot::Error> SecureRoot::Stat(std::string_view entry) const noexcept
{
	struct stat st;
	std::memset(&st, 0, sizeof(st));

	if (auto err = CheckEntry(entry))
		return { false, st, *err };

	const std::string name(entry);
	if (::fstatat(fd_, name.c_str(), &st, AT_SYMLINK_NOFOLLOW) != 0)
		return { false, st, MakeError(errno, "fstatat", entry) };

	return { true, st, Error{} };
}

std::optional<SecureRoot::Error> SecureRoot::Rename(std::string_view from, std::string_view to, bool replace) noexcept
{
	if (auto err = CheckEntry(from))
		return err;
	if (auto err = CheckEntry(to))
		return err;

	const std::string src(from);
	const std::string dst(to);

	if (::renameat2(fd_, src.c_str(), fd_, dst.c_str(), replace ? 0U : RENAME_NOREPLACE) != 0)
		return MakeError(errno, "renameat2", fmt::format("{} -> {}", from, to));

	return std::nullopt;
}

std::optional<SecureRoot::Error> SecureRoot::Adopt(const std::filesystem::path& source, std::string_view entry) noexcept
{
	if (auto err = CheckEntry(entry))
		return err;

	const std::string dst(entry);

	if (::renameat(AT_FDCWD, source.c_str(), fd_, dst.c_str()) != 0)
		return MakeError(errno, "renameat", fmt::format("{} -> {}", source.string(), entry));

	return std::nullopt;
}

std::tuple<bool, std::unique_ptr<FileStream>, SecureRoot::Error>
SecureRoot::CreateExclusive(std::string_view entry, mode_t mode) noexcept
{
	if (auto err = CheckEntry(entry))
		return { false, nullptr, *err };

	const std::string name(entry);

	int fd;
	do {
		fd = ::openat(fd_, name.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, mode);
	} while (fd < 0 && errno == EINTR);

	if (fd < 0)
		return { false, nullptr, MakeError(errno, "openat", entry) };

	return { true, std::make_unique<FileStream>(path_ / name, fd), Error{} };
}

std::optional<SecureRoot::Error> SecureRoot::Remove(std::string_view entry) noexcept
{
	if (auto err = CheckEntry(entry))
		return err;

	const std::string name(entry);

	if (::unlinkat(fd_, name.c_str(), 0) != 0)
		return MakeError(errno, "unlinkat", entry);

	return std::nullopt;
}

std::optional<SecureRoot::Error> SecureRoot::CheckEntry(std::string_view entry) const
{
	if (entry.empty() || entry == "." || entry == ".."
	    || entry.find('/') != std::string_view::npos
	    || entry.find('\0') != std::string_view::npos)
		return MakeError(EINVAL, "entry is not a single path component", entry);

	return std::nullopt;
}

SecureRoot::Error SecureRoot::EscapeError(std::string_view context, std::string_view entry) const
{
	return Error{ kEscapesRoot, fmt::format("{}: {} resolves outside {}", context, entry, path_.string()) };
}

SecureRoot::Error SecureRoot::MakeError(int err, std::string_view context, std::string_view entry) const
{
	return Error{ err, fmt::format("{}: errno={} ({}), root={}, entry={}",
				     context, err, std::strerror(err), path_.string(), entry) };
}
