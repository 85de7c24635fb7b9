#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/logger.h>

#include "HashingFileStream.hpp"
#include "ServiceInfo.hpp"
#include "UploadRequest.hpp"

// Receives the data of one upload into a staging file while computing its
// SHA-384.
class UploadSession final
{
public:
	UploadSession(StagingFactory factory, std::shared_ptr<spdlog::logger> logger);
	~UploadSession();

	UploadSession(const UploadSession&) = delete;
	UploadSession& operator=(const UploadSession&) = delete;

public:
	static StagingFactory DefaultStagingFactory();

public:
	// Consumes every chunk of one data message body
	std::optional<ServiceInfoError> Receive(MessageReader& body) noexcept;
	std::optional<ServiceInfoError> Write(std::string_view chunk) noexcept;

	// Closes and unlinks the staging file, if any
	std::optional<FileStream::Error> Discard() noexcept;

public:
	bool HasStaging() const noexcept;
	HashingFileStream* GetStaging() noexcept;
	int64_t GetBytesWritten() const noexcept;

private:
	std::optional<ServiceInfoError> InitializeStaging() noexcept;

private:
	StagingFactory factory_;
	std::shared_ptr<spdlog::logger> logger_;

	bool staging_initialized_ = false;
	std::unique_ptr<HashingFileStream> staging_;
	int64_t bytes_written_ = 0;
};
