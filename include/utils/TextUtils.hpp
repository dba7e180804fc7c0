#pragma once

#include <string>
#include <vector>
#include <map>

namespace Songbook {

/**
 * String helpers shared by the tokenizer, parser and planners
 */
namespace TextUtils {

// Default column width a tab character expands to
constexpr int kDefaultTabWidth = 4;

std::string trim(const std::string& str);
std::string trimRight(const std::string& str);
std::string toLower(std::string str);

// Lower-cased, inner whitespace collapsed to single spaces, trimmed
std::string normalizeName(const std::string& name);

// Capitalize first letter of every word ("verse 1" -> "Verse 1")
std::string titleCase(const std::string& str);

// Expand tabs to the next multiple of tabWidth (columns are code points)
std::string expandTabs(const std::string& line, int tabWidth);

// Columns a UTF-8 string occupies, one per code point
size_t columnCount(const std::string& str);

// Byte index where a column starts; str.size() for columns past the end
size_t byteOffset(const std::string& str, size_t column);

/**
 * Make a line valid UTF-8.
 * Bytes that do not form a UTF-8 sequence are read as Latin-1 and re-encoded.
 * Returns true when anything had to be re-encoded.
 */
bool repairUtf8(std::string& str);

// Number of leading blanks
size_t leadingSpaces(const std::string& line);

/**
 * Split raw text into lines.
 * Strips a UTF-8 byte order mark and accepts \n, \r\n and bare \r endings.
 */
std::vector<std::string> splitLines(const std::string& text);

// Split on a delimiter, trimming every item; empty items are dropped
std::vector<std::string> splitList(const std::string& str, char delimiter);

bool startsWith(const std::string& str, const std::string& prefix);

// Replace {{key}} placeholders; unknown keys render as empty strings
std::string renderTemplate(const std::string& templ,
                           const std::map<std::string, std::string>& values);

} // namespace TextUtils

} // namespace Songbook
