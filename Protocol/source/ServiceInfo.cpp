#include "ServiceInfo.hpp"

const char* ToString(ServiceInfoError::Kind kind) noexcept
{
	switch (kind) {
	case ServiceInfoError::Kind::None:		return "none";
	case ServiceInfoError::Kind::ProtocolViolation:	return "protocol violation";
	case ServiceInfoError::Kind::Overflow:		return "overflow";
	case ServiceInfoError::Kind::Integrity:		return "integrity";
	case ServiceInfoError::Kind::Security:		return "security";
	case ServiceInfoError::Kind::IO:		return "io";
	}

	return "unknown";
}
