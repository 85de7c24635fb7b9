#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "ServiceInfo.hpp"

#include "serviceinfo.pb.h"

// MessageReader over a body of length-delimited ServiceInfoValue messages.
class ProtoMessageReader final : public MessageReader
{
public:
	explicit ProtoMessageReader(std::string body);

public:
	bool AtEnd() const noexcept override;

	std::optional<Error> ReadBool(bool& value) noexcept override;
	std::optional<Error> ReadInt(int64_t& value) noexcept override;
	std::optional<Error> ReadBytes(std::string& value) noexcept override;
	std::optional<Error> ReadString(std::string& value) noexcept override;

private:
	std::tuple<bool, ServiceInfoValue, Error> Next() noexcept;

private:
	const std::string body_;
	size_t offset_;
};

// MessageWriter that collects ServiceInfoMessage records for one module.
class ProtoMessageWriter final : public MessageWriter
{
public:
	explicit ProtoMessageWriter(std::string module);

public:
	std::optional<Error> WriteBool(std::string_view name, bool value) noexcept override;
	std::optional<Error> WriteString(std::string_view name, std::string_view value) noexcept override;

public:
	const std::vector<ServiceInfoMessage>& GetMessages() const noexcept;
	std::vector<ServiceInfoMessage> TakeMessages() noexcept;

private:
	std::optional<Error> Append(std::string_view name, std::string body) noexcept;

private:
	const std::string module_;
	std::vector<ServiceInfoMessage> messages_;
};

std::string EncodeBool(bool value);
std::string EncodeInt(int64_t value);
std::string EncodeString(std::string_view value);
// A data body: every chunk becomes one bytes value
std::string EncodeBytes(const std::vector<std::string>& chunks);
