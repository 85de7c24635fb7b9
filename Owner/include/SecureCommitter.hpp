#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include <spdlog/logger.h>

#include "SecureRoot.hpp"
#include "ServiceInfo.hpp"

struct CommitResult {
	std::filesystem::path path;
	std::optional<std::filesystem::path> backup;
	uint64_t size = 0;
	bool copied = false;
};

// Moves a verified staging file to its final name below the destination
// directory. The staging file is gone once Commit() returns.
class SecureCommitter final
{
public:
	enum class Mode {
		Auto,		// rename on the same volume, copy otherwise
		Rename,
		Copy
	};

public:
	SecureCommitter(std::filesystem::path destination_dir, std::shared_ptr<spdlog::logger> logger);

public:
	// local_name if set, else the last path component of remote_name
	static std::string ResolveName(std::string_view remote_name, std::string_view local_name);
	// "<stem>.<YYYYMMDDHHMMSS.uuuuuu><ext>", modification time in local time
	static std::string MakeBackupName(std::string_view entry, const struct timespec& mtime);

public:
	std::tuple<bool, CommitResult, ServiceInfoError>
	Commit(const std::filesystem::path& staging, std::string_view name, Mode mode = Mode::Auto);

private:
	std::tuple<bool, CommitResult, ServiceInfoError>
	Place(const std::filesystem::path& staging, std::string_view name, Mode mode);

	std::tuple<bool, std::optional<std::string>, ServiceInfoError>
	BackupExisting(SecureRoot& dir, const std::string& entry);

	std::tuple<bool, std::string, ServiceInfoError>
	CopyIn(const std::filesystem::path& staging, SecureRoot& dir, const std::string& entry);

private:
	const std::filesystem::path destination_dir_;
	std::shared_ptr<spdlog::logger> logger_;
};
