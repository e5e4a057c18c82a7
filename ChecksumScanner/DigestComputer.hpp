#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <openssl/evp.h>

#include "ChecksumKind.hpp"

namespace fs = std::filesystem;

class DigestComputer
{
public:
	explicit DigestComputer(std::size_t chunkSize = 1 << 20);

	/**
	* Lowercase hex digest of the file contents, or an empty string when the
	* file cannot be opened or read. Throws InvalidChecksumKind for a kind
	* outside the enumeration.
	*/
	std::string computeChecksum(const fs::path& path, ChecksumKind kind) const;

	static std::string toHex(const unsigned char* data, std::size_t size);
	static const EVP_MD* selectDigest(ChecksumKind kind);

private:
	const std::size_t m_CHUNK;

	struct ScopedDigestContext
	{
		ScopedDigestContext();
		~ScopedDigestContext();

		ScopedDigestContext(const ScopedDigestContext&) = delete;
		ScopedDigestContext& operator=(const ScopedDigestContext&) = delete;

		EVP_MD_CTX* m_ctx;
	};
};
