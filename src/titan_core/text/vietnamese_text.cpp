#include "titan_core/text/vietnamese_text.hpp"

#include <unicode/normalizer2.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>
#include <utf8.h>

#include <iterator>
#include <stdexcept>

namespace titan_core::text {

namespace {

std::string make_valid(const std::string &text) {
  if (utf8::is_valid(text.begin(), text.end())) {
    return text;
  }
  std::string valid;
  valid.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));
  return valid;
}

}  // namespace

std::string to_nfc(const std::string &text) {
  std::string valid = make_valid(text);

  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2 *nfc = icu::Normalizer2::getNFCInstance(status);
  if (U_FAILURE(status) || nfc == nullptr) {
    throw std::runtime_error(std::string("ICU: failed to get NFC normalizer: ") + u_errorName(status));
  }

  icu::UnicodeString source =
      icu::UnicodeString::fromUTF8(icu::StringPiece(valid.data(), static_cast<int32_t>(valid.size())));
  if (nfc->quickCheck(source, status) == UNORM_YES && U_SUCCESS(status)) {
    return valid;
  }

  status = U_ZERO_ERROR;
  icu::UnicodeString composed;
  nfc->normalize(source, composed, status);
  if (U_FAILURE(status)) {
    throw std::runtime_error(std::string("ICU: NFC normalize failed: ") + u_errorName(status));
  }

  std::string out;
  composed.toUTF8String(out);
  return out;
}

namespace {

template <typename Fn>
std::vector<std::string> split_on_boundaries(const std::string &text, Fn transform) {
  std::vector<std::string> words;
  std::string valid = to_nfc(text);
  std::string current;

  auto it = valid.begin();
  while (it != valid.end()) {
    std::uint32_t cp = utf8::next(it, valid.end());
    if (is_word_codepoint(cp)) {
      utf8::append(transform(cp), std::back_inserter(current));
    } else if (!current.empty()) {
      words.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

}  // namespace

std::uint32_t fold_codepoint(std::uint32_t cp) {
  if (cp >= 'A' && cp <= 'Z') {
    return cp + 32;
  }
  if (cp < 0x00C0) {
    return cp;
  }
  // Latin-1 Supplement: À..Þ except ×
  if (cp <= 0x00DE) {
    return cp == 0x00D7 ? cp : cp + 0x20;
  }
  // Latin Extended-A, paired upper/lower (Ă, Đ, Ĩ, Ũ, ...)
  if ((cp >= 0x0100 && cp <= 0x0137) || (cp >= 0x014A && cp <= 0x0177)) {
    return (cp % 2 == 0) ? cp + 1 : cp;
  }
  if (cp >= 0x0139 && cp <= 0x0148) {
    return (cp % 2 == 1) ? cp + 1 : cp;
  }
  // Ơ, Ư
  if (cp == 0x01A0 || cp == 0x01AF) {
    return cp + 1;
  }
  // Latin Extended Additional: Ạ..Ỹ alternate upper/lower
  if (cp >= 0x1E00 && cp <= 0x1EFF) {
    return (cp % 2 == 0) ? cp + 1 : cp;
  }
  return cp;
}

bool is_word_codepoint(std::uint32_t cp) {
  if (cp < 0x80) {
    return (cp >= '0' && cp <= '9') || (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z');
  }
  if (cp < 0x00C0) {
    return false;
  }
  if (cp == 0x00D7 || cp == 0x00F7) {
    return false;
  }
  // General punctuation, arrows, math operators, box drawing, dingbats ...
  if (cp >= 0x2000 && cp <= 0x2BFF) {
    return false;
  }
  // CJK punctuation, fullwidth ASCII punctuation, replacement character
  if ((cp >= 0x3000 && cp <= 0x303F) || (cp >= 0xFF00 && cp <= 0xFF0F) || cp == 0xFFFD) {
    return false;
  }
  return true;
}

std::string fold_case(const std::string &text) {
  std::string valid = to_nfc(text);
  std::string folded;
  folded.reserve(valid.size());

  auto it = valid.begin();
  while (it != valid.end()) {
    utf8::append(fold_codepoint(utf8::next(it, valid.end())), std::back_inserter(folded));
  }
  return folded;
}

std::vector<std::string> tokenize(const std::string &text) {
  return split_on_boundaries(text, fold_codepoint);
}

std::vector<std::string> split_words(const std::string &text) {
  return split_on_boundaries(text, [](std::uint32_t cp) { return cp; });
}

bool contains_token_sequence(const std::vector<std::string> &haystack,
                             const std::vector<std::string> &needle) {
  if (needle.empty() || needle.size() > haystack.size()) {
    return false;
  }
  for (std::size_t start = 0; start + needle.size() <= haystack.size(); ++start) {
    std::size_t matched = 0;
    while (matched < needle.size() && haystack[start + matched] == needle[matched]) {
      ++matched;
    }
    if (matched == needle.size()) {
      return true;
    }
  }
  return false;
}

bool contains_phrase(const std::string &text, const std::string &phrase) {
  return contains_token_sequence(tokenize(text), tokenize(phrase));
}

bool starts_with_uppercase(const std::string &word) {
  if (word.empty()) {
    return false;
  }
  std::string valid = to_nfc(word);
  auto it = valid.begin();
  std::uint32_t cp = utf8::next(it, valid.end());
  return is_word_codepoint(cp) && fold_codepoint(cp) != cp;
}

}  // namespace titan_core::text
