#include "GlobPattern.hpp"

#include <cstring>
#include <stdexcept>

namespace
{
	constexpr const char* REGEX_SPECIALS = "\\^$|+()[]{}";
} // anonymous namespace

/**
* Name: GlobPattern::GlobPattern
* Description: Constructor, compiles the glob
* @Param glob - wildcard pattern
* @Param escapeAll - escape regex syntax other than the wildcards
*/
GlobPattern::GlobPattern(const std::string& glob, bool escapeAll) :
	m_glob(glob)
{
	try
	{
		m_regex = std::regex(toRegex(glob, escapeAll), std::regex::ECMAScript | std::regex::optimize);
	}
	catch (const std::regex_error& error)
	{
		throw std::invalid_argument("Invalid glob pattern '" + glob + "': " + error.what());
	}
}

/**
* Name: GlobPattern::literal
* Description: Pattern where only '*' and '?' are special
* @Param glob - wildcard pattern
*/
GlobPattern GlobPattern::literal(const std::string& glob)
{
	return GlobPattern(glob, true);
}

/**
* Name: GlobPattern::matches
* Description: Substring match, the pattern may hit any part of the text
* @Param text - candidate path or name
*/
bool GlobPattern::matches(const std::string& text) const
{
	if (m_glob.empty())
	{
		return false;
	}

	return std::regex_search(text, m_regex);
}

/**
* Name: GlobPattern::matchesWhole
* Description: Anchored match against the whole text
* @Param text - candidate path or name
*/
bool GlobPattern::matchesWhole(const std::string& text) const
{
	if (m_glob.empty())
	{
		return false;
	}

	return std::regex_match(text, m_regex);
}

/**
* Name: GlobPattern::toRegex
* Description: Translate a glob into an ECMAScript expression
* @Param glob - wildcard pattern
* @Param escapeAll - escape regex syntax other than the wildcards
*/
std::string GlobPattern::toRegex(const std::string& glob, bool escapeAll)
{
	std::string expression;
	expression.reserve(glob.size() * 2);

	for (char c : glob)
	{
		switch (c)
		{
		case '.':
			expression += "[.]";
			break;
		case '*':
			expression += ".*";
			break;
		case '?':
			expression += '.';
			break;
		default:
			if (escapeAll && '\0' != c && nullptr != std::strchr(REGEX_SPECIALS, c))
			{
				expression += '\\';
			}
			expression += c;
			break;
		}
	}

	return expression;
}
