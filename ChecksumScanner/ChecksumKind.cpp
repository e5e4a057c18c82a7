#include "ChecksumKind.hpp"

#include <cctype>

/**
* Name: InvalidChecksumKind::InvalidChecksumKind
* Description: Constructor
* @Param value - raw value that is not a ChecksumKind
*/
InvalidChecksumKind::InvalidChecksumKind(int value) :
	std::invalid_argument("Invalid checksum kind: " + std::to_string(value)), m_value(value) {}

std::string toString(ChecksumKind kind)
{
	switch (kind)
	{
	case ChecksumKind::MD5:
		return "MD5";
	case ChecksumKind::SHA1:
		return "SHA1";
	case ChecksumKind::SHA256:
		return "SHA256";
	case ChecksumKind::SHA512:
		return "SHA512";
	}

	throw InvalidChecksumKind(static_cast<int>(kind));
}

std::optional<ChecksumKind> parseChecksumKind(const std::string& name)
{
	std::string key;
	for (char c : name)
	{
		if ('-' != c)
		{
			key += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
		}
	}

	for (ChecksumKind kind : { ChecksumKind::MD5, ChecksumKind::SHA1, ChecksumKind::SHA256, ChecksumKind::SHA512 })
	{
		if (toString(kind) == key)
		{
			return kind;
		}
	}

	return std::nullopt;
}

std::size_t digestHexLength(ChecksumKind kind)
{
	switch (kind)
	{
	case ChecksumKind::MD5:
		return 32;
	case ChecksumKind::SHA1:
		return 40;
	case ChecksumKind::SHA256:
		return 64;
	case ChecksumKind::SHA512:
		return 128;
	}

	throw InvalidChecksumKind(static_cast<int>(kind));
}
