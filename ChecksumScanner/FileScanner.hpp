#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "GlobPattern.hpp"

namespace fs = std::filesystem;

struct ScanRequest
{
	std::string basePath;
	std::string excludeGlob;
	std::string matchGlob = "*";
	bool recurse = false;
};

struct ScanResult
{
	std::vector<std::string> files;
	std::vector<std::string> skippedPaths;

	bool partial() const { return !skippedPaths.empty(); }
};

// true for the error codes the walker treats as an inaccessible path
bool isAccessDenied(const std::error_code& ec);

class FileScanner
{
public:
	ScanResult scan(const ScanRequest& request) const;

	std::vector<std::string> listDirectory(const fs::path& dir, const std::string& exclude, const std::string& match = "*") const;
	std::vector<std::string> listRecursive(const fs::path& basePath, const std::string& exclude, const std::string& match, bool recurse) const;

private:
	void scanDirectory(const fs::path& dir, const GlobPattern& exclude, const GlobPattern& match, ScanResult& result) const;
	void scanRecursive(const fs::path& dir, const GlobPattern& exclude, const GlobPattern& match, bool recurse, ScanResult& result) const;
	void handleError(const fs::path& dir, const std::error_code& ec, ScanResult& result) const;
};
