#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <tuple>
#include <vector>

#include <spdlog/logger.h>

#include "SecureCommitter.hpp"
#include "ServiceInfo.hpp"
#include "UploadRequest.hpp"
#include "UploadSession.hpp"

// Owner side of the fdo.upload service info module: asks the device for a
// file, receives it, checks its length and SHA-384 and commits it below
// UploadRequest::dir.
class UploadOwnerModule final : public OwnerModule
{
public:
	enum class Phase {
		NotRequested,
		Requested,
		Finalized,
		Aborted
	};

	static constexpr const char* kModuleName = "fdo.upload";
	static constexpr size_t kDigestSize = 48;

public:
	explicit UploadOwnerModule(UploadRequest request);

public:
	std::optional<ServiceInfoError> HandleInfo(std::string_view name, MessageReader& body) override;
	std::tuple<bool, Progress, ServiceInfoError> ProduceInfo(MessageWriter& producer) override;

public:
	Phase GetPhase() const noexcept;
	int64_t GetBytesWritten() const noexcept;
	const std::optional<CommitResult>& GetResult() const noexcept;

private:
	std::optional<ServiceInfoError> Dispatch(std::string_view name, MessageReader& body);
	std::tuple<bool, Progress, ServiceInfoError> Request(MessageWriter& producer);
	std::tuple<bool, Progress, ServiceInfoError> Finalize();

	bool ReadyToFinalize() const noexcept;
	ServiceInfoError Abort(ServiceInfoError error);

private:
	UploadRequest request_;
	std::shared_ptr<spdlog::logger> logger_;

	Phase phase_ = Phase::NotRequested;
	int64_t length_ = 0;
	std::optional<std::vector<uint8_t>> sha384_;

	UploadSession session_;
	SecureCommitter committer_;
	std::optional<CommitResult> result_;
};

const char* ToString(UploadOwnerModule::Phase phase) noexcept;
