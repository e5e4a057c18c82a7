#include "ChecksumManager.hpp"
#include "Logger.hpp"

#include <utility>

/**
* Name: ChecksumManager::ChecksumManager
* Description: Constructor
* @Param scanner - directory walker
* @Param digester - digest computer
*/
ChecksumManager::ChecksumManager(FileScanner& scanner, DigestComputer& digester) :
	m_scanner(scanner), m_digester(digester), m_failed(0) {}

/**
* Name: ChecksumManager::collect
* Description: Scan the request and hash every file found, in walker order.
*              Files that cannot be hashed keep an empty digest.
* @Param request - scan request
* @Param kind - checksum kind
*/
std::vector<FileChecksum> ChecksumManager::collect(const ScanRequest& request, ChecksumKind kind)
{
	m_failed = 0;
	m_skipped.clear();

	// reject an invalid kind before touching the filesystem
	DigestComputer::selectDigest(kind);

	LOG(Info, "Entry, kind: %s.", toString(kind).c_str());

	ScanResult scanned = m_scanner.scan(request);
	m_skipped = std::move(scanned.skippedPaths);

	std::vector<FileChecksum> checksums;
	checksums.reserve(scanned.files.size());

	for (std::string& path : scanned.files)
	{
		FileChecksum checksum;
		checksum.digest = m_digester.computeChecksum(path, kind);
		checksum.path = std::move(path);

		if (checksum.digest.empty())
		{
			++m_failed;
		}

		checksums.emplace_back(std::move(checksum));
	}

	LOG(Info, "Exit, files: %zu, failed: %zu.", checksums.size(), m_failed);
	return checksums;
}
