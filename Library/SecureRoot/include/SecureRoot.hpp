#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include <cerrno>

#include <sys/stat.h>
#include <sys/types.h>

#include "FileStream.hpp"

// A directory opened as a confinement boundary. Every relative path handed to
// it is resolved beneath the directory descriptor itself. ".." segments that
// climb out, absolute components and symlinks of any kind are refused. Entry
// operations take a single path component and never follow a final symlink.
class SecureRoot final
{
public:
	struct Error {
		int code = 0;	// errno, or kEscapesRoot
		std::string message;
	};

	// Resolution of a path would have left the root
	static constexpr int kEscapesRoot = -EXDEV;

public:
	SecureRoot(const SecureRoot&) = delete;
	SecureRoot& operator=(const SecureRoot&) = delete;
	~SecureRoot();

public:
	// True when name is relative, non-empty and lexically stays beneath "."
	static bool IsLocal(std::string_view name) noexcept;
	// Lexically normalized {parent, entry}; parent is empty for top-level names
	static std::tuple<bool, std::filesystem::path, std::string> Split(std::string_view name);

	static std::tuple<bool, std::unique_ptr<SecureRoot>, Error> Open(const std::filesystem::path& dir) noexcept;

	// Resolve with the O_NOFOLLOW component walk even when openat2 is available
	static void ForceComponentWalk(bool enable) noexcept;

public:
	const std::filesystem::path& GetPath() const noexcept;
	int GetDescriptor() const noexcept;

public:
	// Opens a directory below this one; an empty path yields this directory again
	std::tuple<bool, std::unique_ptr<SecureRoot>, Error> OpenDirectory(const std::filesystem::path& rel) noexcept;

	std::tuple<bool, struct stat, Error> StatSelf() const noexcept;
	std::tuple<bool, struct stat, Error> Stat(std::string_view entry) const noexcept;

	std::optional<Error> Rename(std::string_view from, std::string_view to, bool replace) noexcept;
	// Moves a file from anywhere on the same volume onto entry
	std::optional<Error> Adopt(const std::filesystem::path& source, std::string_view entry) noexcept;
	std::tuple<bool, std::unique_ptr<FileStream>, Error> CreateExclusive(std::string_view entry, mode_t mode) noexcept;
	std::optional<Error> Remove(std::string_view entry) noexcept;

private:
	SecureRoot(std::filesystem::path path, int fd) noexcept;

	std::tuple<int, Error> ResolveBeneath(const std::filesystem::path& rel) const;
	std::tuple<int, Error> WalkBeneath(const std::filesystem::path& rel) const;
	std::optional<Error> CheckEntry(std::string_view entry) const;
	Error EscapeError(std::string_view context, std::string_view entry) const;
	Error MakeError(int err, std::string_view context, std::string_view entry) const;

private:
	const std::filesystem::path path_;
	int fd_;
};
