#include "ServiceInfoCodec.hpp"

#include <utility>

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include "fmt/core.h"

namespace {
	MessageReader::Error MakeError(int code, std::string message)
	{
		return MessageReader::Error{ code, std::move(message) };
	}

	const char* CaseName(ServiceInfoValue::ValueCase value_case)
	{
		switch (value_case) {
		case ServiceInfoValue::kBoolValue:	return "bool";
		case ServiceInfoValue::kIntValue:	return "int";
		case ServiceInfoValue::kBytesValue:	return "bytes";
		case ServiceInfoValue::kTextValue:	return "text";
		case ServiceInfoValue::VALUE_NOT_SET:
		default:
			return "empty";
		}
	}

	MessageReader::Error TypeMismatch(const ServiceInfoValue& value, const char* expected)
	{
		return MakeError(-2, fmt::format("expected {} value, got {}", expected, CaseName(value.value_case())));
	}

	std::string AppendDelimited(std::string out, const ServiceInfoValue& value)
	{
		{
			google::protobuf::io::StringOutputStream stream(&out);
			google::protobuf::io::CodedOutputStream coded(&stream);

			coded.WriteVarint32(static_cast<uint32_t>(value.ByteSizeLong()));
			value.SerializeWithCachedSizes(&coded);
		}

		return out;
	}
}

ProtoMessageReader::ProtoMessageReader(std::string body)
	: body_(std::move(body))
	, offset_(0)
{
}

bool ProtoMessageReader::AtEnd() const noexcept
{
	return offset_ >= body_.size();
}

std::tuple<bool, ServiceInfoValue, MessageReader::Error> ProtoMessageReader::Next() noexcept
{
	if (AtEnd())
		return { false, ServiceInfoValue{}, MakeError(-1, "unexpected end of message body") };

	google::protobuf::io::CodedInputStream coded(
		reinterpret_cast<const uint8_t*>(body_.data() + offset_),
		static_cast<int>(body_.size() - offset_));

	uint32_t size = 0;
	if (!coded.ReadVarint32(&size))
		return { false, ServiceInfoValue{}, MakeError(-3, "malformed value length") };

	ServiceInfoValue value;
	const auto limit = coded.PushLimit(static_cast<int>(size));
	if (!value.ParseFromCodedStream(&coded) || !coded.ConsumedEntireMessage())
		return { false, ServiceInfoValue{}, MakeError(-3, "malformed value") };
	coded.PopLimit(limit);

	offset_ += static_cast<size_t>(coded.CurrentPosition());

	return { true, std::move(value), Error{} };
}

std::optional<MessageReader::Error> ProtoMessageReader::ReadBool(bool& value) noexcept
{
	auto [ok, next, err] = Next();
	if (!ok)
		return err;

	if (next.value_case() != ServiceInfoValue::kBoolValue)
		return TypeMismatch(next, "bool");

	value = next.bool_value();
	return std::nullopt;
}

std::optional<MessageReader::Error> ProtoMessageReader::ReadInt(int64_t& value) noexcept
{
	auto [ok, next, err] = Next();
	if (!ok)
		return err;

	if (next.value_case() != ServiceInfoValue::kIntValue)
		return TypeMismatch(next, "int");

	value = next.int_value();
	return std::nullopt;
}

std::optional<MessageReader::Error> ProtoMessageReader::ReadBytes(std::string& value) noexcept
{
	auto [ok, next, err] = Next();
	if (!ok)
		return err;

	if (next.value_case() != ServiceInfoValue::kBytesValue)
		return TypeMismatch(next, "bytes");

	value = std::move(*next.mutable_bytes_value());
	return std::nullopt;
}

std::optional<MessageReader::Error> ProtoMessageReader::ReadString(std::string& value) noexcept
{
	auto [ok, next, err] = Next();
	if (!ok)
		return err;

	if (next.value_case() != ServiceInfoValue::kTextValue)
		return TypeMismatch(next, "text");

	value = std::move(*next.mutable_text_value());
	return std::nullopt;
}

ProtoMessageWriter::ProtoMessageWriter(std::string module)
	: module_(std::move(module))
{
}

std::optional<MessageWriter::Error> ProtoMessageWriter::WriteBool(std::string_view name, bool value) noexcept
{
	return Append(name, EncodeBool(value));
}

std::optional<MessageWriter::Error> ProtoMessageWriter::WriteString(std::string_view name, std::string_view value) noexcept
{
	return Append(name, EncodeString(value));
}

const std::vector<ServiceInfoMessage>& ProtoMessageWriter::GetMessages() const noexcept
{
	return messages_;
}

std::vector<ServiceInfoMessage> ProtoMessageWriter::TakeMessages() noexcept
{
	return std::exchange(messages_, {});
}

std::optional<MessageWriter::Error> ProtoMessageWriter::Append(std::string_view name, std::string body) noexcept
{
	if (name.empty())
		return MakeError(-1, "message name is empty");

	ServiceInfoMessage message;
	message.set_module(module_);
	message.set_name(std::string(name));
	message.set_body(std::move(body));

	messages_.push_back(std::move(message));

	return std::nullopt;
}

std::string EncodeBool(bool value)
{
	ServiceInfoValue v;
	v.set_bool_value(value);
	return AppendDelimited({}, v);
}

std::string EncodeInt(int64_t value)
{
	ServiceInfoValue v;
	v.set_int_value(value);
	return AppendDelimited({}, v);
}

std::string EncodeString(std::string_view value)
{
	ServiceInfoValue v;
	v.set_text_value(std::string(value));
	return AppendDelimited({}, v);
}

std::string EncodeBytes(const std::vector<std::string>& chunks)
{
	std::string out;

	for (const auto& chunk : chunks) {
		ServiceInfoValue v;
		v.set_bytes_value(chunk);
		out = AppendDelimited(std::move(out), v);
	}

	return out;
}
