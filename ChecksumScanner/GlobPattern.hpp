#pragma once

#include <regex>
#include <string>

/**
* Simple wildcard pattern: '*' is any run of characters, '?' is any single
* character and '.' is literal. Translated to a regular expression.
* Other characters pass through as regex syntax unless the pattern is
* built with literal(), which escapes them.
*/
class GlobPattern
{
public:
	GlobPattern() = default;
	explicit GlobPattern(const std::string& glob, bool escapeAll = false);

	// only '*' and '?' are special, for file-name patterns
	static GlobPattern literal(const std::string& glob);

	// true when the pattern matches any portion of text
	bool matches(const std::string& text) const;

	// true when the pattern matches the whole of text
	bool matchesWhole(const std::string& text) const;

	bool empty() const { return m_glob.empty(); }
	const std::string& glob() const { return m_glob; }

	static std::string toRegex(const std::string& glob, bool escapeAll = false);

private:
	std::string m_glob;
	std::regex m_regex;
};
