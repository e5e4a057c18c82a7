#include "FileScanner.hpp"
#include "Logger.hpp"

#include <iterator>

namespace
{
	constexpr const char* MATCH_ALL = "*";

	GlobPattern compileMatch(const std::string& match)
	{
		return GlobPattern::literal(match.empty() ? MATCH_ALL : match);
	}
} // anonymous namespace

bool isAccessDenied(const std::error_code& ec)
{
	return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}

/**
* Name: FileScanner::scan
* Description: List files for the request, keeping track of skipped paths
* @Param request - base path, globs and recursion flag
*/
ScanResult FileScanner::scan(const ScanRequest& request) const
{
	LOG(Info, "Entry, base: %s, recurse: %d.", request.basePath.c_str(), request.recurse);

	ScanResult result;
	const GlobPattern exclude(request.excludeGlob);
	const GlobPattern match = compileMatch(request.matchGlob);

	scanRecursive(request.basePath, exclude, match, request.recurse, result);

	LOG(Info, "Exit, files: %zu, skipped: %zu.", result.files.size(), result.skippedPaths.size());
	return result;
}

/**
* Name: FileScanner::listDirectory
* Description: Files directly inside dir matching match and not matching exclude
* @Param dir - directory to list, may not exist
* @Param exclude - exclude glob, empty for none
* @Param match - match glob applied to file names
*/
std::vector<std::string> FileScanner::listDirectory(const fs::path& dir, const std::string& exclude, const std::string& match) const
{
	ScanResult result;
	scanDirectory(dir, GlobPattern(exclude), compileMatch(match), result);
	return result.files;
}

/**
* Name: FileScanner::listRecursive
* Description: Files in basePath and, when recurse is set, in all subdirectories
* @Param basePath - root directory
* @Param exclude - exclude glob, empty for none
* @Param match - match glob applied to file names
* @Param recurse - descend into subdirectories
*/
std::vector<std::string> FileScanner::listRecursive(const fs::path& basePath, const std::string& exclude, const std::string& match, bool recurse) const
{
	ScanRequest request;
	request.basePath = basePath.string();
	request.excludeGlob = exclude;
	request.matchGlob = match;
	request.recurse = recurse;

	return scan(request).files;
}

/**
* Name: FileScanner::scanDirectory
* Description: Append the filtered regular files of a single directory.
*              A listing error discards the whole directory.
* @Param dir - directory to list
* @Param exclude - compiled exclude glob, tested against the full path
* @Param match - compiled match glob, tested against the file name
* @Param result - output
*/
void FileScanner::scanDirectory(const fs::path& dir, const GlobPattern& exclude, const GlobPattern& match, ScanResult& result) const
{
	std::error_code ec;
	if (!fs::is_directory(dir, ec))
	{
		if (ec && isAccessDenied(ec))
		{
			handleError(dir, ec, result);
		}
		return;
	}

	std::vector<std::string> files;

	fs::directory_iterator it(dir, ec);
	for (; !ec && it != fs::directory_iterator(); it.increment(ec))
	{
		std::error_code typeEc;
		if (!it->is_regular_file(typeEc))
		{
			continue;
		}

		if (!match.matchesWhole(it->path().filename().string()))
		{
			continue;
		}

		std::string path = it->path().string();
		if (exclude.matches(path))
		{
			LOG(Debug, "Excluded: %s.", path.c_str());
			continue;
		}

		files.emplace_back(std::move(path));
	}

	if (ec)
	{
		handleError(dir, ec, result);
		return;
	}

	result.files.insert(result.files.end(),
		std::make_move_iterator(files.begin()), std::make_move_iterator(files.end()));
}

/**
* Name: FileScanner::scanRecursive
* Description: List dir, then each subdirectory. Subdirectories are collected
*              up front; failing to collect them drops every subdirectory of
*              this level while keeping the files of dir itself.
*              Symlinked directories are not descended into.
* @Param dir - directory to scan
* @Param exclude - compiled exclude glob
* @Param match - compiled match glob
* @Param recurse - descend into subdirectories
* @Param result - output
*/
void FileScanner::scanRecursive(const fs::path& dir, const GlobPattern& exclude, const GlobPattern& match, bool recurse, ScanResult& result) const
{
	scanDirectory(dir, exclude, match, result);

	if (!recurse)
	{
		return;
	}

	std::error_code ec;
	if (!fs::is_directory(dir, ec))
	{
		return;
	}

	std::vector<fs::path> subDirs;

	fs::directory_iterator it(dir, ec);
	for (; !ec && it != fs::directory_iterator(); it.increment(ec))
	{
		std::error_code typeEc;
		if (it->is_symlink(typeEc) || !it->is_directory(typeEc))
		{
			continue;
		}
		subDirs.push_back(it->path());
	}

	if (ec)
	{
		handleError(dir, ec, result);
		return;
	}

	for (const fs::path& subDir : subDirs)
	{
		scanRecursive(subDir, exclude, match, recurse, result);
	}
}

/**
* Name: FileScanner::handleError
* Description: Absorb access denied and vanished directories, rethrow the rest
* @Param dir - directory being listed
* @Param ec - listing error
* @Param result - output, records skipped paths
*/
void FileScanner::handleError(const fs::path& dir, const std::error_code& ec, ScanResult& result) const
{
	if (isAccessDenied(ec))
	{
		if (result.skippedPaths.empty() || result.skippedPaths.back() != dir.string())
		{
			LOG(Warn, "Skipping %s: %s.", dir.string().c_str(), ec.message().c_str());
			result.skippedPaths.push_back(dir.string());
		}
		return;
	}

	if (ec == std::errc::no_such_file_or_directory)
	{
		LOG(Debug, "Directory vanished: %s.", dir.string().c_str());
		return;
	}

	throw fs::filesystem_error("Cannot list directory", dir, ec);
}
