#include "utils/TextUtils.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace Songbook {
namespace TextUtils {

namespace {

bool isContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the well-formed UTF-8 sequence at pos, 0 when there is none
size_t sequenceLength(const std::string& str, size_t pos) {
    unsigned char lead = static_cast<unsigned char>(str[pos]);
    size_t length = 0;
    unsigned char low = 0x80;
    unsigned char high = 0xBF;

    if (lead < 0x80) {
        return 1;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) low = 0xA0;        // overlong
        if (lead == 0xED) high = 0x9F;       // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) low = 0x90;        // overlong
        if (lead == 0xF4) high = 0x8F;       // above U+10FFFF
    } else {
        return 0;
    }

    if (pos + length > str.size()) {
        return 0;
    }
    unsigned char second = static_cast<unsigned char>(str[pos + 1]);
    if (second < low || second > high) {
        return 0;
    }
    for (size_t i = 2; i < length; ++i) {
        if (!isContinuation(static_cast<unsigned char>(str[pos + i]))) {
            return 0;
        }
    }
    return length;
}

} // anonymous namespace

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n\f\v");
    return str.substr(start, end - start + 1);
}

std::string trimRight(const std::string& str) {
    size_t end = str.find_last_not_of(" \t\r\n\f\v");
    if (end == std::string::npos) {
        return "";
    }
    return str.substr(0, end + 1);
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string normalizeName(const std::string& name) {
    std::string result;
    bool pendingSpace = false;
    for (unsigned char c : trim(name)) {
        if (std::isspace(c)) {
            pendingSpace = true;
            continue;
        }
        if (pendingSpace && !result.empty()) {
            result += ' ';
        }
        pendingSpace = false;
        result += static_cast<char>(std::tolower(c));
    }
    return result;
}

std::string titleCase(const std::string& str) {
    std::string result = str;
    bool startOfWord = true;
    for (auto& ch : result) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) {
            startOfWord = true;
        } else if (startOfWord) {
            ch = static_cast<char>(std::toupper(c));
            startOfWord = false;
        }
    }
    return result;
}

std::string expandTabs(const std::string& line, int tabWidth) {
    if (line.find('\t') == std::string::npos) {
        return line;
    }
    
    const size_t width = tabWidth > 0 ? static_cast<size_t>(tabWidth) : 1;
    std::string result;
    result.reserve(line.size() + width);
    size_t column = 0;
    
    for (char c : line) {
        if (c == '\t') {
            size_t spaces = width - (column % width);
            result.append(spaces, ' ');
            column += spaces;
        } else {
            if (!isContinuation(static_cast<unsigned char>(c))) {
                ++column;
            }
            result += c;
        }
    }
    return result;
}

size_t columnCount(const std::string& str) {
    return static_cast<size_t>(std::count_if(str.begin(), str.end(), [](char c) {
        return !isContinuation(static_cast<unsigned char>(c));
    }));
}

size_t byteOffset(const std::string& str, size_t column) {
    size_t seen = 0;
    for (size_t pos = 0; pos < str.size(); ++pos) {
        if (isContinuation(static_cast<unsigned char>(str[pos]))) {
            continue;
        }
        if (seen == column) {
            return pos;
        }
        ++seen;
    }
    return str.size();
}

bool repairUtf8(std::string& str) {
    std::string result;
    bool repaired = false;

    size_t pos = 0;
    while (pos < str.size()) {
        size_t length = sequenceLength(str, pos);
        if (length == 0) {
            unsigned char c = static_cast<unsigned char>(str[pos]);
            if (!repaired) {
                result.assign(str, 0, pos);
                repaired = true;
            }
            result += static_cast<char>(0xC0 | (c >> 6));
            result += static_cast<char>(0x80 | (c & 0x3F));
            ++pos;
            continue;
        }
        if (repaired) {
            result.append(str, pos, length);
        }
        pos += length;
    }

    if (repaired) {
        str = std::move(result);
    }
    return repaired;
}

size_t leadingSpaces(const std::string& line) {
    size_t pos = line.find_first_not_of(' ');
    return pos == std::string::npos ? line.size() : pos;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    
    size_t pos = 0;
    if (startsWith(text, "\xEF\xBB\xBF")) {
        pos = 3;
    }
    
    std::string current;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '\r') {
            lines.push_back(current);
            current.clear();
            if (pos + 1 < text.size() && text[pos + 1] == '\n') {
                ++pos;
            }
        } else if (c == '\n') {
            lines.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    
    if (!current.empty()) {
        lines.push_back(current);
    }
    
    return lines;
}

std::vector<std::string> splitList(const std::string& str, char delimiter) {
    std::vector<std::string> items;
    std::stringstream ss(str);
    std::string item;
    
    while (std::getline(ss, item, delimiter)) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    
    return items;
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

std::string renderTemplate(const std::string& templ,
                           const std::map<std::string, std::string>& values) {
    static const std::regex placeholder(R"(\{\{\s*([A-Za-z0-9_]+)\s*\}\})");
    
    std::string result;
    auto begin = std::sregex_iterator(templ.begin(), templ.end(), placeholder);
    auto end = std::sregex_iterator();
    size_t last = 0;
    
    for (auto it = begin; it != end; ++it) {
        const std::smatch& match = *it;
        result.append(templ, last, static_cast<size_t>(match.position(0)) - last);
        
        auto value = values.find(toLower(match[1].str()));
        if (value != values.end()) {
            result += value->second;
        }
        last = static_cast<size_t>(match.position(0) + match.length(0));
    }
    result.append(templ, last, std::string::npos);
    
    return result;
}

} // namespace TextUtils
} // namespace Songbook
