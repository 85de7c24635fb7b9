#include "SecureCommitter.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "fmt/chrono.h"
#include "fmt/core.h"

#include "openssl/rand.h"

#include "FileStream.hpp"

namespace {
	constexpr size_t kCopyBufferSize = 64 * BUFSIZ;
	constexpr int kCopyTempAttempts = 8;

	ServiceInfoError SecurityError(std::string message)
	{
		return ServiceInfoError{ ServiceInfoError::Kind::Security, 0, std::move(message) };
	}

	ServiceInfoError IOError(int code, std::string message)
	{
		return ServiceInfoError{ ServiceInfoError::Kind::IO, code, std::move(message) };
	}

	ServiceInfoError FromRootError(const SecureRoot::Error& err, std::string_view what)
	{
		if (err.code == SecureRoot::kEscapesRoot)
			return SecurityError(fmt::format("{}: {}", what, err.message));

		return IOError(err.code, fmt::format("{}: {}", what, err.message));
	}

	std::tuple<bool, std::string> RandomSuffix()
	{
		unsigned char bytes[4];
		if (RAND_bytes(bytes, sizeof(bytes)) != 1)
			return { false, {} };

		return { true, fmt::format("{:02x}{:02x}{:02x}{:02x}", bytes[0], bytes[1], bytes[2], bytes[3]) };
	}
}

SecureCommitter::SecureCommitter(std::filesystem::path destination_dir, std::shared_ptr<spdlog::logger> logger)
	: destination_dir_(std::move(destination_dir))
	, logger_(logger ? std::move(logger) : spdlog::default_logger())
{
}

std::string SecureCommitter::ResolveName(std::string_view remote_name, std::string_view local_name)
{
	if (!local_name.empty())
		return std::string(local_name);

	std::string_view name = remote_name;
	while (name.size() > 1 && name.back() == '/')
		name.remove_suffix(1);

	const auto pos = name.find_last_of('/');
	if (pos == std::string_view::npos || name.size() == 1)
		return std::string(name);

	return std::string(name.substr(pos + 1));
}

std::string SecureCommitter::MakeBackupName(std::string_view entry, const struct timespec& mtime)
{
	std::tm tm{};
	const time_t seconds = mtime.tv_sec;
	localtime_r(&seconds, &tm);

	const std::string stamp = fmt::format("{:%Y%m%d%H%M%S}.{:06}", tm, mtime.tv_nsec / 1000);

	// The extension starts at the last dot, so ".bashrc" is all extension
	const auto dot = entry.find_last_of('.');
	if (dot == std::string_view::npos)
		return fmt::format("{}.{}", entry, stamp);

	return fmt::format("{}.{}{}", entry.substr(0, dot), stamp, entry.substr(dot));
}

std::tuple<bool, CommitResult, ServiceInfoError>
SecureCommitter::Commit(const std::filesystem::path& staging, std::string_view name, Mode mode)
{
	std::tuple<bool, CommitResult, ServiceInfoError> result;

	try {
		result = Place(staging, name, mode);
	}
	catch (const std::exception& e) {
		result = { false, CommitResult{}, IOError(-1, fmt::format("commit of \"{}\": {}", name, e.what())) };
	}

	// After a rename there is nothing left here; after a copy or a failure
	// the staging file is still ours to delete
	if (::unlink(staging.c_str()) != 0 && errno != ENOENT) {
		const int err = errno;
		logger_->warn("failed to remove staging file {}: {}", staging.string(), std::strerror(err));
	}

	return result;
}

std::tuple<bool, CommitResult, ServiceInfoError>
SecureCommitter::Place(const std::filesystem::path& staging, std::string_view name, Mode mode)
{
	if (!SecureRoot::IsLocal(name))
		return { false, CommitResult{}, SecurityError(fmt::format("path traversal detected in name \"{}\"", name)) };

	const auto [split_ok, parent, entry] = SecureRoot::Split(name);
	if (!split_ok)
		return { false, CommitResult{}, SecurityError(fmt::format("invalid name \"{}\"", name)) };

	auto [root_ok, root, root_err] = SecureRoot::Open(destination_dir_);
	if (!root_ok)
		return { false, CommitResult{}, IOError(root_err.code, fmt::format("error opening destination directory: {}", root_err.message)) };

	auto [dir_ok, dir, dir_err] = root->OpenDirectory(parent);
	if (!dir_ok)
		return { false, CommitResult{}, FromRootError(dir_err, fmt::format("error resolving \"{}\"", name)) };

	struct stat staged;
	if (::stat(staging.c_str(), &staged) != 0) {
		const int err = errno;
		return { false, CommitResult{}, IOError(err, fmt::format("error checking staging file {}: {}", staging.string(), std::strerror(err))) };
	}

	const auto [self_ok, dir_stat, self_err] = dir->StatSelf();
	if (!self_ok)
		return { false, CommitResult{}, IOError(self_err.code, fmt::format("error checking destination volume: {}", self_err.message)) };

	const bool same_volume = staged.st_dev == dir_stat.st_dev;
	const bool copy = mode == Mode::Copy || (mode == Mode::Auto && !same_volume);

	CommitResult result;
	result.path = dir->GetPath() / entry;
	result.size = static_cast<uint64_t>(staged.st_size);
	result.copied = copy;

	std::string temp_entry;
	if (copy) {
		auto [copied, temp, copy_err] = CopyIn(staging, *dir, entry);
		if (!copied)
			return { false, CommitResult{}, copy_err };
		temp_entry = temp;
	}

	auto [backup_ok, backup, backup_err] = BackupExisting(*dir, entry);
	if (!backup_ok) {
		if (!temp_entry.empty())
			if (auto err = dir->Remove(temp_entry))
				logger_->warn("failed to remove {}: {}", temp_entry, err->message);
		return { false, CommitResult{}, backup_err };
	}

	const auto placed = copy ? dir->Rename(temp_entry, entry, true) : dir->Adopt(staging, entry);
	if (placed) {
		if (!temp_entry.empty())
			if (auto err = dir->Remove(temp_entry))
				logger_->warn("failed to remove {}: {}", temp_entry, err->message);

		if (backup)
			if (auto err = dir->Rename(*backup, entry, false))
				logger_->warn("failed to restore {} from {}: {}", entry, *backup, err->message);

		return { false, CommitResult{}, IOError(placed->code, fmt::format("error moving staged file to \"{}\": {}", entry, placed->message)) };
	}

	if (backup)
		result.backup = dir->GetPath() / *backup;

	logger_->info("committed {} ({} bytes, {})", result.path.string(), result.size, copy ? "copied" : "renamed");

	return { true, std::move(result), ServiceInfoError{} };
}

std::tuple<bool, std::optional<std::string>, ServiceInfoError>
SecureCommitter::BackupExisting(SecureRoot& dir, const std::string& entry)
{
	const auto [exists, st, err] = dir.Stat(entry);
	if (!exists) {
		if (err.code == ENOENT)
			return { true, std::nullopt, ServiceInfoError{} };

		return { false, std::nullopt, IOError(err.code, fmt::format("error checking for existing \"{}\": {}", entry, err.message)) };
	}

	const std::string backup = MakeBackupName(entry, st.st_mtim);
	if (auto rename_err = dir.Rename(entry, backup, false))
		return { false, std::nullopt, IOError(rename_err->code, fmt::format("error renaming existing file \"{}\" to \"{}\": {}", entry, backup, rename_err->message)) };

	logger_->info("renamed existing {} to {}", (dir.GetPath() / entry).string(), backup);

	return { true, backup, ServiceInfoError{} };
}

std::tuple<bool, std::string, ServiceInfoError>
SecureCommitter::CopyIn(const std::filesystem::path& staging, SecureRoot& dir, const std::string& entry)
{
	FileStream source(staging);
	if (auto err = source.Open(O_RDONLY))
		return { false, {}, IOError(err->code, fmt::format("error opening staging file: {}", err->message)) };

	std::unique_ptr<FileStream> target;
	std::string temp;

	for (int attempt = 0; attempt < kCopyTempAttempts && !target; ++attempt) {
		auto [rand_ok, suffix] = RandomSuffix();
		if (!rand_ok)
			return { false, {}, IOError(-1, "RAND_bytes failed") };

		temp = fmt::format(".{}.upload-{}", entry, suffix);

		auto [created, file, create_err] = dir.CreateExclusive(temp, 0644);
		if (created)
			target = std::move(file);
		else if (create_err.code != EEXIST)
			return { false, {}, IOError(create_err.code, fmt::format("error creating destination file: {}", create_err.message)) };
	}

	if (!target)
		return { false, {}, IOError(EEXIST, fmt::format("error creating destination file for \"{}\"", entry)) };

	auto fail = [&](int code, std::string message) -> std::tuple<bool, std::string, ServiceInfoError> {
		(void)target->Close();
		if (auto err = dir.Remove(temp))
			logger_->warn("failed to remove {}: {}", temp, err->message);
		return { false, {}, IOError(code, std::move(message)) };
	};

	std::vector<char> buffer(kCopyBufferSize);
	uint64_t copied = 0;

	while (true) {
		const auto [read_ok, n, read_err] = source.Read(buffer.data(), buffer.size());
		if (!read_ok)
			return fail(read_err.code, fmt::format("error reading staging file: {}", read_err.message));

		if (n == 0)
			break;

		if (auto err = target->Write(std::string_view(buffer.data(), static_cast<size_t>(n))))
			return fail(err->code, fmt::format("error copying to destination file: {}", err->message));

		copied += static_cast<uint64_t>(n);
	}

	if (auto err = target->Sync())
		return fail(err->code, fmt::format("error syncing destination file: {}", err->message));

	if (auto err = target->Close())
		return fail(err->code, fmt::format("error closing destination file: {}", err->message));

	logger_->debug("copied {} bytes across volumes into {}", copied, temp);

	return { true, temp, ServiceInfoError{} };
}
