#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

// Error returned by a service info module. Any error is terminal for the
// module instance that produced it.
struct ServiceInfoError {
	enum class Kind {
		None = 0,
		ProtocolViolation,
		Overflow,
		Integrity,
		Security,
		IO
	};

	Kind kind = Kind::None;
	int code = 0;
	std::string message;
};

const char* ToString(ServiceInfoError::Kind kind) noexcept;

// Decodes the values of one inbound message body, in order.
class MessageReader
{
public:
	struct Error {
		int code = 0;
		std::string message;
	};

public:
	virtual ~MessageReader() = default;

public:
	virtual bool AtEnd() const noexcept = 0;

	virtual std::optional<Error> ReadBool(bool& value) noexcept = 0;
	virtual std::optional<Error> ReadInt(int64_t& value) noexcept = 0;
	virtual std::optional<Error> ReadBytes(std::string& value) noexcept = 0;
	virtual std::optional<Error> ReadString(std::string& value) noexcept = 0;
};

// Queues outbound messages for the peer.
class MessageWriter
{
public:
	using Error = MessageReader::Error;

public:
	virtual ~MessageWriter() = default;

public:
	virtual std::optional<Error> WriteBool(std::string_view name, bool value) noexcept = 0;
	virtual std::optional<Error> WriteString(std::string_view name, std::string_view value) noexcept = 0;
};

// One named capability of the owner side of a service info exchange. The
// driver calls HandleInfo() for every inbound message addressed to the
// module and ProduceInfo() whenever the module may speak; the two are never
// called concurrently.
class OwnerModule
{
public:
	struct Progress {
		bool block_peer = false;
		bool done = false;
	};

public:
	virtual ~OwnerModule() = default;

public:
	virtual std::optional<ServiceInfoError> HandleInfo(std::string_view name, MessageReader& body) = 0;
	virtual std::tuple<bool, Progress, ServiceInfoError> ProduceInfo(MessageWriter& producer) = 0;
};
