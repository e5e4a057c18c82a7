#include "DigestComputer.hpp"
#include "Logger.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

/**
* Name: DigestComputer::DigestComputer
* Description: Constructor
* @Param chunkSize - read chunk size
*/
DigestComputer::DigestComputer(std::size_t chunkSize) :
	m_CHUNK(0 == chunkSize ? 1 : chunkSize) {}

/**
* Name: DigestComputer::ScopedDigestContext::ScopedDigestContext
* Description: Constructor, allocates the EVP context
*/
DigestComputer::ScopedDigestContext::ScopedDigestContext() :
	m_ctx(EVP_MD_CTX_new()) {}

/**
* Name: DigestComputer::ScopedDigestContext::~ScopedDigestContext
* Description: Destructor, releases the EVP context
*/
DigestComputer::ScopedDigestContext::~ScopedDigestContext()
{
	EVP_MD_CTX_free(m_ctx);
}

/**
* Name: DigestComputer::selectDigest
* Description: Map the checksum kind to its EVP algorithm
* @Param kind - checksum kind
*/
const EVP_MD* DigestComputer::selectDigest(ChecksumKind kind)
{
	switch (kind)
	{
	case ChecksumKind::MD5:
		return EVP_md5();
	case ChecksumKind::SHA1:
		return EVP_sha1();
	case ChecksumKind::SHA256:
		return EVP_sha256();
	case ChecksumKind::SHA512:
		return EVP_sha512();
	}

	throw InvalidChecksumKind(static_cast<int>(kind));
}

/**
* Name: DigestComputer::computeChecksum
* Description: Hash the whole file, chunk by chunk
* @Param path - path to file
* @Param kind - checksum kind
*/
std::string DigestComputer::computeChecksum(const fs::path& path, ChecksumKind kind) const
{
	ScopedDigestContext digestGuard;
	if (!digestGuard.m_ctx)
	{
		LOG(Error, "Failed to create EVP context.");
		return std::string();
	}

	const EVP_MD* md = selectDigest(kind);

	std::ifstream file(path, std::ios::binary);
	if (!file)
	{
		LOG(Error, "Failed to open file: %s.", path.string().c_str());
		return std::string();
	}

	if (1 != EVP_DigestInit_ex(digestGuard.m_ctx, md, nullptr))
	{
		LOG(Error, "Failed to init EVP for %s.", toString(kind).c_str());
		return std::string();
	}

	std::vector<char> buffer(m_CHUNK);

	while (file)
	{
		file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
		std::streamsize streamSize = file.gcount();

		if (0 < streamSize && 1 != EVP_DigestUpdate(digestGuard.m_ctx, buffer.data(), static_cast<std::size_t>(streamSize)))
		{
			LOG(Error, "Update failed: %s.", path.string().c_str());
			return std::string();
		}
	}

	if (file.bad())
	{
		LOG(Error, "Failed to read file: %s.", path.string().c_str());
		return std::string();
	}

	unsigned char hash[EVP_MAX_MD_SIZE];
	unsigned int hashLen = 0;

	if (1 != EVP_DigestFinal_ex(digestGuard.m_ctx, hash, &hashLen))
	{
		LOG(Error, "Final failed: %s.", path.string().c_str());
		return std::string();
	}

	return toHex(hash, hashLen);
}

/**
* Name: DigestComputer::toHex
* Description: Lowercase hex, two characters per byte
* @Param data - bytes
* @Param size - number of bytes
*/
std::string DigestComputer::toHex(const unsigned char* data, std::size_t size)
{
	std::ostringstream ss;
	ss << std::hex << std::setfill('0');

	for (std::size_t i = 0; i < size; ++i)
	{
		ss << std::setw(2) << static_cast<int>(data[i]);
	}

	return ss.str();
}
