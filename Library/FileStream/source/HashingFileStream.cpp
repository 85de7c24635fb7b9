#include "HashingFileStream.hpp"

#include "fmt/core.h"

HashingFileStream::HashingFileStream(std::unique_ptr<FileStream> file, Hasher::Type type)
    : file_(std::move(file))
    , hasher_(type)
{
}

const std::filesystem::path& HashingFileStream::GetPath() const noexcept
{
    return file_->GetPath();
}

const FileStream& HashingFileStream::GetFile() const noexcept
{
    return *file_;
}

std::optional<HashingFileStream::Error> HashingFileStream::Open() noexcept
{
    digest_.reset();

    if (!file_ || !file_->IsOpen())
        return Error{ -1, "open: staging file is not open" };

    if (auto herr = hasher_.Initialize())
        return ConvertHasherError(*herr);

    return std::nullopt;
}

std::optional<HashingFileStream::Error> HashingFileStream::Write(std::string_view data) noexcept
{
    if (digest_.has_value())
        return Error{ -1, "write: digest already finalized" };

    if (data.empty())
        return std::nullopt;

    if (auto err = file_->Write(data))
        return err;

    if (auto herr = hasher_.Update(data.data(), data.size()))
        return ConvertHasherError(*herr);

    return std::nullopt;
}

std::optional<HashingFileStream::Error> HashingFileStream::Finalize() noexcept
{
    if (digest_.has_value())
        return std::nullopt;

    auto [ok, digest, herr] = hasher_.Finalize();
    if (!ok)
        return ConvertHasherError(herr);

    digest_ = std::move(digest);

    return std::nullopt;
}

std::optional<HashingFileStream::Error> HashingFileStream::Close() noexcept
{
    if (auto err = Finalize()) {
        (void)file_->Close();
        return err;
    }

    return file_->Close();
}

std::optional<HashingFileStream::Error> HashingFileStream::Remove() noexcept
{
    const auto close_err = file_->Close();

    if (auto err = file_->Remove())
        return err;

    return close_err;
}

std::optional<std::vector<uint8_t>> HashingFileStream::GetHash() const noexcept
{
    return digest_;
}

HashingFileStream::Error HashingFileStream::ConvertHasherError(const Hasher::Error& e)
{
    return Error{ e.code, fmt::format("hasher: {}", e.message) };
}
