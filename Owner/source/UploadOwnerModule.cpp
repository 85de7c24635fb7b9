#include "UploadOwnerModule.hpp"

#include <string>

#include <spdlog/spdlog.h>

#include "fmt/core.h"

#include "IntegrityVerifier.hpp"

namespace {
	ServiceInfoError ProtocolViolation(std::string message, int code = 0)
	{
		return ServiceInfoError{ ServiceInfoError::Kind::ProtocolViolation, code, std::move(message) };
	}

	ServiceInfoError DecodeError(std::string_view name, const MessageReader::Error& err)
	{
		return ProtocolViolation(fmt::format("error decoding message {}: {}", name, err.message), err.code);
	}

	std::shared_ptr<spdlog::logger> ResolveLogger(const std::shared_ptr<spdlog::logger>& logger)
	{
		return logger ? logger : spdlog::default_logger();
	}
}

UploadOwnerModule::UploadOwnerModule(UploadRequest request)
	: request_(std::move(request))
	, logger_(ResolveLogger(request_.logger))
	, session_(request_.create_temp, logger_)
	, committer_(request_.dir, logger_)
{
}

std::optional<ServiceInfoError> UploadOwnerModule::HandleInfo(std::string_view name, MessageReader& body)
{
	switch (phase_) {
	case Phase::Aborted:
		return ProtocolViolation(fmt::format("upload of \"{}\" was aborted", request_.name));
	case Phase::Finalized:
		return ProtocolViolation(fmt::format("unexpected message {} after upload of \"{}\" completed", name, request_.name));
	case Phase::NotRequested:
	case Phase::Requested:
		break;
	}

	if (auto err = Dispatch(name, body))
		return Abort(std::move(*err));

	return std::nullopt;
}

std::optional<ServiceInfoError> UploadOwnerModule::Dispatch(std::string_view name, MessageReader& body)
{
	if (name == "active") {
		bool device_active = false;
		if (auto err = body.ReadBool(device_active))
			return DecodeError(name, *err);
		if (!device_active)
			return ProtocolViolation("device service info module is not active");
		return std::nullopt;
	}

	if (name == "length") {
		if (auto err = body.ReadInt(length_))
			return DecodeError(name, *err);
		logger_->debug("upload of \"{}\": device announced {} bytes", request_.name, length_);
		return std::nullopt;
	}

	if (name == "data")
		return session_.Receive(body);

	if (name == "sha-384") {
		if (sha384_)
			return ProtocolViolation("duplicate sha-384 message");

		std::string digest;
		if (auto err = body.ReadBytes(digest))
			return DecodeError(name, *err);
		if (digest.size() != kDigestSize)
			return ProtocolViolation(fmt::format("sha-384 value is {} bytes, expected {}", digest.size(), kDigestSize));

		sha384_.emplace(digest.begin(), digest.end());
		return std::nullopt;
	}

	return ProtocolViolation(fmt::format("unsupported message \"{}\"", name));
}

std::tuple<bool, OwnerModule::Progress, ServiceInfoError> UploadOwnerModule::ProduceInfo(MessageWriter& producer)
{
	switch (phase_) {
	case Phase::NotRequested:
		return Request(producer);
	case Phase::Requested:
		if (!ReadyToFinalize())
			return { true, Progress{}, ServiceInfoError{} };
		return Finalize();
	case Phase::Finalized:
		return { true, Progress{ false, true }, ServiceInfoError{} };
	case Phase::Aborted:
		break;
	}

	return { false, Progress{}, ProtocolViolation(fmt::format("upload of \"{}\" was aborted", request_.name)) };
}

std::tuple<bool, OwnerModule::Progress, ServiceInfoError> UploadOwnerModule::Request(MessageWriter& producer)
{
	if (request_.name.empty())
		return { false, Progress{}, Abort(ProtocolViolation("upload request has no name")) };

	if (auto err = producer.WriteBool("active", true))
		return { false, Progress{}, Abort(ProtocolViolation(fmt::format("error writing message active: {}", err->message), err->code)) };
	if (auto err = producer.WriteBool("need-sha", true))
		return { false, Progress{}, Abort(ProtocolViolation(fmt::format("error writing message need-sha: {}", err->message), err->code)) };
	if (auto err = producer.WriteString("name", request_.name))
		return { false, Progress{}, Abort(ProtocolViolation(fmt::format("error writing message name: {}", err->message), err->code)) };

	phase_ = Phase::Requested;
	logger_->info("requested upload of \"{}\" into {}", request_.name, request_.dir.string());

	return { true, Progress{}, ServiceInfoError{} };
}

bool UploadOwnerModule::ReadyToFinalize() const noexcept
{
	return sha384_.has_value() && length_ > 0 && session_.GetBytesWritten() >= length_;
}

std::tuple<bool, OwnerModule::Progress, ServiceInfoError> UploadOwnerModule::Finalize()
{
	if (auto err = VerifyUpload(session_, length_, *sha384_))
		return { false, Progress{}, Abort(std::move(*err)) };

	const std::filesystem::path staging = session_.GetStaging()->GetPath();
	const std::string name = SecureCommitter::ResolveName(request_.name, request_.rename);

	auto [ok, result, err] = committer_.Commit(staging, name);
	if (!ok)
		return { false, Progress{}, Abort(std::move(err)) };

	// Nothing is left on disk, this only drops the handle
	if (auto discard_err = session_.Discard())
		logger_->warn("upload of \"{}\": {}", request_.name, discard_err->message);

	result_ = std::move(result);
	phase_ = Phase::Finalized;
	logger_->info("upload of \"{}\" complete: {} bytes in {}", request_.name, length_, result_->path.string());

	return { true, Progress{ false, true }, ServiceInfoError{} };
}

ServiceInfoError UploadOwnerModule::Abort(ServiceInfoError error)
{
	phase_ = Phase::Aborted;

	if (auto err = session_.Discard())
		logger_->warn("upload of \"{}\": failed to remove staging file: {}", request_.name, err->message);

	logger_->warn("upload of \"{}\" aborted ({}): {}", request_.name, ToString(error.kind), error.message);

	error.message = fmt::format("uploaded file \"{}\": {}", request_.name, error.message);
	return error;
}

UploadOwnerModule::Phase UploadOwnerModule::GetPhase() const noexcept
{
	return phase_;
}

int64_t UploadOwnerModule::GetBytesWritten() const noexcept
{
	return session_.GetBytesWritten();
}

const std::optional<CommitResult>& UploadOwnerModule::GetResult() const noexcept
{
	return result_;
}

const char* ToString(UploadOwnerModule::Phase phase) noexcept
{
	switch (phase) {
	case UploadOwnerModule::Phase::NotRequested:	return "not requested";
	case UploadOwnerModule::Phase::Requested:	return "requested";
	case UploadOwnerModule::Phase::Finalized:	return "finalized";
	case UploadOwnerModule::Phase::Aborted:		return "aborted";
	}

	return "unknown";
}
