#include <iostream>
#include <optional>
#include <string>

#include "ChecksumManager.hpp"
#include "Logger.hpp"

namespace
{
	const char* MATCH_OPTION = "-match";
	const char* EXCLUDE_OPTION = "-exclude";
	const char* RECURSE_OPTION = "-r";
	const char* TYPE_OPTION = "-type";
	const char* LOG_OPTION = "-log";
	const char* LOG_LEVEL_OPTION = "-loglevel";

	constexpr ChecksumKind DEFAULT_KIND = ChecksumKind::SHA256;
	constexpr LogLevel DEFAULT_LOG_LEVEL = LogLevel::Warn;

	constexpr int EXIT_ALL_HASHED = 0;
	constexpr int EXIT_SOME_FAILED = 1;
	constexpr int EXIT_USAGE = 2;
	constexpr int EXIT_ERROR = 3;
} //anonymous namespace

void printHelp()
{
	std::cout << "Usage: checksum-scanner <base_path> [-match <glob>] [-exclude <glob>] [-r]\n"
		<< "                        [-type md5|sha1|sha256|sha512] [-log <file>]\n"
		<< "                        [-loglevel debug|info|warn|error]\n";
}

int main(int argc, char** argv)
{
	if (2 > argc)
	{
		printHelp();
		return EXIT_USAGE;
	}

	ScanRequest request;
	request.basePath = argv[1];
	ChecksumKind kind = DEFAULT_KIND;
	std::string logFile;
	LogLevel logLevel = DEFAULT_LOG_LEVEL;

	for (int i = 2; i < argc; ++i)
	{
		std::string option(argv[i]);
		if (RECURSE_OPTION == option)
		{
			request.recurse = true;
			continue;
		}

		if (i + 1 >= argc)
		{
			std::cerr << "Missing value for " << option << "\n";
			printHelp();
			return EXIT_USAGE;
		}

		std::string value(argv[++i]);
		if (MATCH_OPTION == option)
		{
			request.matchGlob = value;
		}
		else if (EXCLUDE_OPTION == option)
		{
			request.excludeGlob = value;
		}
		else if (TYPE_OPTION == option)
		{
			std::optional<ChecksumKind> parsed = parseChecksumKind(value);
			if (!parsed)
			{
				std::cerr << "Unknown checksum type: " << value << "\n";
				return EXIT_USAGE;
			}
			kind = *parsed;
		}
		else if (LOG_OPTION == option)
		{
			logFile = value;
		}
		else if (LOG_LEVEL_OPTION == option)
		{
			std::optional<LogLevel> parsed = Logger::parseLevel(value);
			if (!parsed)
			{
				std::cerr << "Unknown log level: " << value << "\n";
				return EXIT_USAGE;
			}
			logLevel = *parsed;
		}
		else
		{
			std::cerr << "Unknown option: " << option << "\n";
			printHelp();
			return EXIT_USAGE;
		}
	}

	if (!Logger::instance().init(logFile, logLevel))
	{
		std::cerr << "Cannot open log file " << logFile << "\n";
	}

	FileScanner scanner;
	DigestComputer digester;
	ChecksumManager checksumManager(scanner, digester);

	try
	{
		for (const FileChecksum& checksum : checksumManager.collect(request, kind))
		{
			if (checksum.digest.empty())
			{
				std::cerr << "Cannot read " << checksum.path << "\n";
				continue;
			}
			std::cout << checksum.digest << "  " << checksum.path << "\n";
		}
	}
	catch (const std::exception& error)
	{
		std::cerr << "Error: " << error.what() << "\n";
		return EXIT_ERROR;
	}

	return 0 == checksumManager.failed() ? EXIT_ALL_HASHED : EXIT_SOME_FAILED;
}
