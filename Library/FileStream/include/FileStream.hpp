#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include <sys/types.h>

class FileStream {
public:
	struct Error {
		int code = 0;
		std::string message;
	};

public:
	// Can be moved, but can't be copied
	FileStream(const FileStream&) = delete;
	FileStream& operator=(const FileStream&) = delete;
	FileStream(FileStream&&) noexcept;
	FileStream& operator=(FileStream&&) noexcept;

public:
	explicit FileStream(const std::filesystem::path& path);
	// Takes ownership of an already opened descriptor
	FileStream(const std::filesystem::path& path, int fd) noexcept;
	virtual ~FileStream();

public:
	// mkstemp() below dir; the file is created with mode 0600
	static std::tuple<bool, std::unique_ptr<FileStream>, Error>
	CreateTemp(const std::filesystem::path& dir, std::string_view prefix) noexcept;

public:
	const std::filesystem::path& GetPath() const noexcept;
	int GetDescriptor() const noexcept;
	bool IsOpen() const noexcept;

public:
	virtual std::optional<Error> Open(int flags, mode_t mode = 0644) noexcept;
	virtual std::optional<Error> Write(std::string_view data) noexcept;

	virtual std::tuple<bool, ssize_t, Error> Read(char* data, size_t size) noexcept;

	virtual std::optional<Error> Sync() noexcept;
	virtual std::optional<Error> Close() noexcept;

	// Unlinks the path; a missing file is not an error
	std::optional<Error> Remove() noexcept;

private:
	Error errno_error(int err, const char* context) const;

private:
	std::filesystem::path path_;
	int fd_;
};
