#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "ServiceInfo.hpp"
#include "UploadSession.hpp"

// Checks the staged upload against what the device declared, then closes
// the staging file. Overflow is checked before the digest.
std::optional<ServiceInfoError> VerifyUpload(UploadSession& session,
					     int64_t declared_length,
					     const std::vector<uint8_t>& expected_digest) noexcept;
