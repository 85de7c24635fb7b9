#include "UploadSession.hpp"

#include <filesystem>
#include <string>
#include <system_error>

#include <spdlog/spdlog.h>

#include "fmt/core.h"

namespace {
	ServiceInfoError IOError(int code, std::string message)
	{
		return ServiceInfoError{ ServiceInfoError::Kind::IO, code, std::move(message) };
	}
}

UploadSession::UploadSession(StagingFactory factory, std::shared_ptr<spdlog::logger> logger)
	: factory_(factory ? std::move(factory) : DefaultStagingFactory())
	, logger_(logger ? std::move(logger) : spdlog::default_logger())
{
}

UploadSession::~UploadSession()
{
	if (auto err = Discard())
		logger_->warn("failed to remove staging file: {}", err->message);
}

StagingFactory UploadSession::DefaultStagingFactory()
{
	return []() -> std::tuple<bool, std::unique_ptr<FileStream>, FileStream::Error> {
		std::error_code ec;
		const std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
		if (ec)
			return { false, nullptr, FileStream::Error{ ec.value(), "temp_directory_path: " + ec.message() } };

		return FileStream::CreateTemp(dir, "fdo.upload_");
	};
}

std::optional<ServiceInfoError> UploadSession::InitializeStaging() noexcept
{
	auto [ok, file, err] = factory_();
	if (!ok || !file)
		return IOError(err.code, fmt::format("error creating staging file: {}", err.message));

	if (!file->IsOpen())
		return IOError(-1, fmt::format("staging file {} is not open", file->GetPath().string()));

	auto staging = std::make_unique<HashingFileStream>(std::move(file), Hasher::Type::SHA384);
	if (auto herr = staging->Open()) {
		(void)staging->Remove();
		return IOError(herr->code, fmt::format("error initializing staging digest: {}", herr->message));
	}

	logger_->debug("staging upload in {}", staging->GetPath().string());
	staging_ = std::move(staging);

	return std::nullopt;
}

std::optional<ServiceInfoError> UploadSession::Receive(MessageReader& body) noexcept
{
	if (!staging_initialized_) {
		staging_initialized_ = true;
		if (auto err = InitializeStaging())
			return err;
	}

	if (!staging_)
		return IOError(-1, "staging file is unavailable");

	size_t chunks = 0;
	while (!body.AtEnd()) {
		std::string chunk;
		if (auto err = body.ReadBytes(chunk))
			return ServiceInfoError{ ServiceInfoError::Kind::ProtocolViolation, err->code,
						 fmt::format("error decoding message data: {}", err->message) };

		if (auto err = Write(chunk))
			return err;

		++chunks;
	}

	logger_->debug("received {} chunk(s), {} byte(s) staged", chunks, bytes_written_);

	return std::nullopt;
}

std::optional<ServiceInfoError> UploadSession::Write(std::string_view chunk) noexcept
{
	if (!staging_)
		return IOError(-1, "staging file is unavailable");

	if (auto err = staging_->Write(chunk))
		return IOError(err->code, fmt::format("error writing upload data chunk: {}", err->message));

	bytes_written_ += static_cast<int64_t>(chunk.size());

	return std::nullopt;
}

std::optional<FileStream::Error> UploadSession::Discard() noexcept
{
	if (!staging_)
		return std::nullopt;

	auto err = staging_->Remove();
	staging_.reset();

	return err;
}

bool UploadSession::HasStaging() const noexcept
{
	return staging_ != nullptr;
}

HashingFileStream* UploadSession::GetStaging() noexcept
{
	return staging_.get();
}

int64_t UploadSession::GetBytesWritten() const noexcept
{
	return bytes_written_;
}
