/**
 * @file TextUtils.hpp
 * @brief Small text helpers shared by the matchers.
 */

#pragma once
#include <string>
#include <vector>

namespace ledgerwise::application::text {

/**
 * @brief Lowercases ASCII and the Latin-1 letters of UTF-8 input (Å, Ä, Ö, É...).
 * Other bytes pass through unchanged.
 */
std::string FoldCase(const std::string& value);

/** @brief Like FoldCase, but leaves ASCII bytes (and so regex syntax) untouched. */
std::string FoldLatin1(const std::string& value);

/**
 * @brief Maximal runs of word characters (ASCII alphanumerics, '_', and any
 * non-ASCII byte) of at least minLength bytes, case-folded.
 */
std::vector<std::string> WordTokens(const std::string& value, size_t minLength = 1);

/** @brief Splits on ASCII whitespace, dropping empty pieces. */
std::vector<std::string> SplitWhitespace(const std::string& value);

std::string Trim(const std::string& value);

/** @brief Keeps only the digits 0-9. */
std::string DigitsOnly(const std::string& value);

/** @brief Case-insensitive substring test. An empty needle never matches. */
bool ContainsFolded(const std::string& haystack, const std::string& needle);

} // namespace ledgerwise::application::text
