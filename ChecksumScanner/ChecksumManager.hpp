#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ChecksumKind.hpp"
#include "DigestComputer.hpp"
#include "FileScanner.hpp"

struct FileChecksum
{
	std::string path;
	std::string digest;
};

class IChecksumManager
{
public:
	virtual ~IChecksumManager() = default;
	virtual std::vector<FileChecksum> collect(const ScanRequest& request, ChecksumKind kind) = 0;
};

class ChecksumManager : public IChecksumManager
{
public:
	ChecksumManager(FileScanner& scanner, DigestComputer& digester);
	std::vector<FileChecksum> collect(const ScanRequest& request, ChecksumKind kind) override;

	// counters of the last collect() call
	std::size_t failed() const { return m_failed; }
	const std::vector<std::string>& skippedPaths() const { return m_skipped; }

private:
	FileScanner& m_scanner;
	DigestComputer& m_digester;
	std::size_t m_failed;
	std::vector<std::string> m_skipped;
};
