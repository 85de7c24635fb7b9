#include "IntegrityVerifier.hpp"

#include "ServiceInfoCodec.hpp"
#include "test_support.hpp"

#include <cassert>
#include <string>
#include <vector>

int main() {
    test_support::TempDir staging_dir;
    const std::string payload = "integrity checked payload";
    const auto digest = test_support::digest(payload);

    // Matching length and digest; the staging file ends up closed
    {
        UploadSession session(test_support::staging_in(staging_dir.path()), nullptr);
        ProtoMessageReader body(EncodeBytes({payload}));
        assert(!session.Receive(body));

        assert(!VerifyUpload(session, static_cast<int64_t>(payload.size()), digest));
        assert(!session.GetStaging()->GetFile().IsOpen());
        assert(test_support::read_file(session.GetStaging()->GetPath()) == payload);
    }

    // More bytes than declared is reported before the digest is looked at
    {
        UploadSession session(test_support::staging_in(staging_dir.path()), nullptr);
        ProtoMessageReader body(EncodeBytes({payload}));
        assert(!session.Receive(body));

        auto err = VerifyUpload(session, 4, std::vector<uint8_t>(48, 0));
        assert(err);
        assert(err->kind == ServiceInfoError::Kind::Overflow);
        assert(err->message.find("expected 4") != std::string::npos);
        assert(!session.GetStaging()->GetHash());
    }

    // Any differing digest byte fails
    {
        UploadSession session(test_support::staging_in(staging_dir.path()), nullptr);
        ProtoMessageReader body(EncodeBytes({payload}));
        assert(!session.Receive(body));

        auto wrong = digest;
        wrong.back() ^= 0x01;
        auto err = VerifyUpload(session, static_cast<int64_t>(payload.size()), wrong);
        assert(err);
        assert(err->kind == ServiceInfoError::Kind::Integrity);
    }

    // A digest of the wrong length never matches
    {
        UploadSession session(test_support::staging_in(staging_dir.path()), nullptr);
        ProtoMessageReader body(EncodeBytes({payload}));
        assert(!session.Receive(body));

        auto short_digest = digest;
        short_digest.resize(32);
        auto err = VerifyUpload(session, static_cast<int64_t>(payload.size()), short_digest);
        assert(err);
        assert(err->kind == ServiceInfoError::Kind::Integrity);
    }

    // Nothing staged at all
    {
        UploadSession session(test_support::staging_in(staging_dir.path()), nullptr);
        auto err = VerifyUpload(session, 0, digest);
        assert(err);
        assert(err->kind == ServiceInfoError::Kind::IO);
    }

    assert(test_support::list_dir(staging_dir.path()).empty());

    return 0;
}
