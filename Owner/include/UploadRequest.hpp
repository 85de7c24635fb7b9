#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <tuple>

#include <spdlog/logger.h>

#include "FileStream.hpp"

// Opens the staging file an upload is streamed into. The returned stream must
// be open for writing.
using StagingFactory = std::function<std::tuple<bool, std::unique_ptr<FileStream>, FileStream::Error>()>;

// Caller configuration of one fdo.upload transfer.
struct UploadRequest {
	// Directory to place the uploaded file in; nothing is written outside it
	std::filesystem::path dir;

	// Name sent to the device in the upload request
	std::string name;

	// Optional name to use below dir, defaults to the last component of name
	std::string rename;

	// Optional, defaults to a mkstemp() file in the system temporary directory
	StagingFactory create_temp;

	// Optional, defaults to spdlog::default_logger()
	std::shared_ptr<spdlog::logger> logger;
};
