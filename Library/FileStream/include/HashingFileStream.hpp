#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "FileStream.hpp"
#include "Hasher.hpp"

// Write-only file whose every byte also feeds a running digest.
class HashingFileStream final
{
public:
    using Error = FileStream::Error;

public:
    // file must already be open for writing
    HashingFileStream(std::unique_ptr<FileStream> file, Hasher::Type type);

public:
    const std::filesystem::path& GetPath() const noexcept;
    const FileStream& GetFile() const noexcept;

public:
    std::optional<Error> Open() noexcept;
    std::optional<Error> Write(std::string_view data) noexcept;

    // Stops hashing; later writes fail. Idempotent.
    std::optional<Error> Finalize() noexcept;
    // Finalizes if needed, then closes the file
    std::optional<Error> Close() noexcept;
    // Closes and unlinks the file
    std::optional<Error> Remove() noexcept;

public:
    std::optional<std::vector<uint8_t>> GetHash() const noexcept;

private:
    static Error ConvertHasherError(const Hasher::Error& e);

private:
    std::unique_ptr<FileStream> file_;
    Hasher hasher_;
    std::optional<std::vector<uint8_t>> digest_;
};
