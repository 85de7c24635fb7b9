#pragma once

#include <algorithm>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>

#include "FileStream.hpp"
#include "Hasher.hpp"
#include "ServiceInfoCodec.hpp"
#include "UploadRequest.hpp"

namespace test_support {

// mkdtemp() directory removed with everything in it on destruction
class TempDir {
public:
    explicit TempDir(std::string_view prefix = "fdo_upload_test_") {
        std::string pattern = (std::filesystem::temp_directory_path() / (std::string(prefix) + "XXXXXX")).string();
        const char* created = ::mkdtemp(pattern.data());
        assert(created != nullptr);
        path_ = created;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    assert(in.is_open());
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void write_file(const std::filesystem::path& path, std::string_view content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    assert(out.is_open());
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

// Entry names directly inside dir, sorted
inline std::vector<std::string> list_dir(const std::filesystem::path& dir) {
    std::vector<std::string> names;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

inline void set_mtime(const std::filesystem::path& path, time_t seconds, long nanoseconds) {
    struct timespec times[2];
    times[0].tv_sec = seconds;
    times[0].tv_nsec = nanoseconds;
    times[1] = times[0];
    const int rc = ::utimensat(AT_FDCWD, path.c_str(), times, 0);
    assert(rc == 0);
    (void)rc;
}

inline std::vector<uint8_t> digest(std::string_view data, Hasher::Type type = Hasher::Type::SHA384) {
    Hasher hasher(type);
    const auto init_err = hasher.Initialize();
    assert(!init_err);
    const auto update_err = hasher.Update(data);
    assert(!update_err);
    auto [ok, out, err] = hasher.Finalize();
    assert(ok);
    (void)init_err;
    (void)update_err;
    (void)err;
    return out;
}

inline std::string sha384(std::string_view data) {
    const auto bytes = digest(data);
    return std::string(bytes.begin(), bytes.end());
}

inline std::string to_hex(const std::vector<uint8_t>& bytes) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    for (uint8_t b : bytes) {
        out.push_back(kHex[(b >> 4) & 0xF]);
        out.push_back(kHex[b & 0xF]);
    }
    return out;
}

// Staging files land in dir so tests can see whether any survived
inline StagingFactory staging_in(const std::filesystem::path& dir) {
    return [dir]() { return FileStream::CreateTemp(dir, "staging_"); };
}

} // namespace test_support
