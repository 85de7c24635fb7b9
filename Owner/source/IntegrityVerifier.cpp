#include "IntegrityVerifier.hpp"

#include "fmt/core.h"

#include "openssl/crypto.h"

std::optional<ServiceInfoError> VerifyUpload(UploadSession& session,
					     int64_t declared_length,
					     const std::vector<uint8_t>& expected_digest) noexcept
{
	const int64_t written = session.GetBytesWritten();
	if (written > declared_length)
		return ServiceInfoError{ ServiceInfoError::Kind::Overflow, 0,
					 fmt::format("received {} bytes, expected {}", written, declared_length) };

	HashingFileStream* staging = session.GetStaging();
	if (!staging)
		return ServiceInfoError{ ServiceInfoError::Kind::IO, -1, "no staged data to verify" };

	if (auto err = staging->Finalize())
		return ServiceInfoError{ ServiceInfoError::Kind::IO, err->code, err->message };

	const auto digest = staging->GetHash();
	if (!digest || digest->size() != expected_digest.size()
	    || CRYPTO_memcmp(digest->data(), expected_digest.data(), digest->size()) != 0)
		return ServiceInfoError{ ServiceInfoError::Kind::Integrity, 0, "SHA-384 did not match" };

	if (auto err = staging->Close())
		return ServiceInfoError{ ServiceInfoError::Kind::IO, err->code,
					 fmt::format("error closing staging file: {}", err->message) };

	return std::nullopt;
}
