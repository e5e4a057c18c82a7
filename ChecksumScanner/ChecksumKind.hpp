#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

enum class ChecksumKind { MD5 = 0, SHA1, SHA256, SHA512 };

class InvalidChecksumKind : public std::invalid_argument
{
public:
	explicit InvalidChecksumKind(int value);

	int value() const { return m_value; }

private:
	int m_value;
};

std::string toString(ChecksumKind kind);

// Case-insensitive, accepts "sha256" as well as "SHA-256".
std::optional<ChecksumKind> parseChecksumKind(const std::string& name);

// Length of the hex digest, two characters per output byte.
std::size_t digestHexLength(ChecksumKind kind);
