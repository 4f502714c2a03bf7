#include "application/TextUtils.hpp"
#include <cctype>

namespace ledgerwise::application::text {

namespace {

bool IsWordByte(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

std::string FoldBytes(const std::string& value, bool foldAscii) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(value[i]);
        if (c < 0x80) {
            out.push_back(foldAscii ? static_cast<char>(std::tolower(c)) : static_cast<char>(c));
            continue;
        }
        // U+00C0..U+00DE (except U+00D7 ×) encode as C3 80..C3 9E; lowercase is +0x20.
        if (c == 0xC3 && i + 1 < value.size()) {
            unsigned char next = static_cast<unsigned char>(value[i + 1]);
            if (next >= 0x80 && next <= 0x9E && next != 0x97) {
                next = static_cast<unsigned char>(next + 0x20);
            }
            out.push_back(static_cast<char>(c));
            out.push_back(static_cast<char>(next));
            ++i;
            continue;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

} // namespace

std::string FoldCase(const std::string& value) {
    return FoldBytes(value, true);
}

std::string FoldLatin1(const std::string& value) {
    return FoldBytes(value, false);
}

std::vector<std::string> WordTokens(const std::string& value, size_t minLength) {
    std::vector<std::string> tokens;
    std::string folded = FoldCase(value);
    std::string current;
    for (char ch : folded) {
        if (IsWordByte(static_cast<unsigned char>(ch))) {
            current.push_back(ch);
        } else if (!current.empty()) {
            if (current.size() >= minLength) tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty() && current.size() >= minLength) {
        tokens.push_back(current);
    }
    return tokens;
}

std::vector<std::string> SplitWhitespace(const std::string& value) {
    std::vector<std::string> parts;
    std::string current;
    for (char ch : value) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(ch);
        }
    }
    if (!current.empty()) parts.push_back(current);
    return parts;
}

std::string Trim(const std::string& value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
    return value.substr(begin, end - begin);
}

std::string DigitsOnly(const std::string& value) {
    std::string out;
    for (char ch : value) {
        if (ch >= '0' && ch <= '9') out.push_back(ch);
    }
    return out;
}

bool ContainsFolded(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return false;
    return FoldCase(haystack).find(FoldCase(needle)) != std::string::npos;
}

} // namespace ledgerwise::application::text
