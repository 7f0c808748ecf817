#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace titan_core::text {

// Lower-cases ASCII and the Latin blocks used by Vietnamese (Latin-1, Latin Extended-A,
// Ơ/Ư and Latin Extended Additional). Diacritics are preserved.
std::uint32_t fold_codepoint(std::uint32_t cp);

// Letters (any script), digits and combining marks
bool is_word_codepoint(std::uint32_t cp);

// Composes to NFC so "a" + U+0301 and "á" compare equal. Invalid sequences become U+FFFD.
std::string to_nfc(const std::string &text);

// Case-folds a UTF-8 string in NFC. Invalid sequences are replaced with U+FFFD instead of throwing.
std::string fold_case(const std::string &text);

// Normalizes, folds and splits on non-word code points
std::vector<std::string> tokenize(const std::string &text);

// Splits on non-word code points without folding (keeps the original capitalisation)
std::vector<std::string> split_words(const std::string &text);

// True when `needle` occurs in `haystack` as a contiguous token run
bool contains_token_sequence(const std::vector<std::string> &haystack,
                             const std::vector<std::string> &needle);

// Word-boundary phrase match, case-insensitive
bool contains_phrase(const std::string &text, const std::string &phrase);

// True when the first code point of `word` is an upper-case letter
bool starts_with_uppercase(const std::string &word);

}  // namespace titan_core::text
