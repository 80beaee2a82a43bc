#include "unicode_fold.hpp"

#include <unicode/normalizer2.h>
#include <unicode/translit.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

#include <memory>
#include <stdexcept>

namespace dedup::fingerprint {

namespace {

icu::UnicodeString FromUtf8(std::string_view utf8) {
  return icu::UnicodeString::fromUTF8(icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
}

// One transliterator per thread; ICU transliterators are not thread safe.
icu::Transliterator* LatinAsciiTransliterator() {
  static thread_local std::unique_ptr<icu::Transliterator> transliterator = [] {
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::Transliterator> instance(
        icu::Transliterator::createInstance(icu::UnicodeString::fromUTF8("Any-Latin; Latin-ASCII"), UTRANS_FORWARD, status));
    if (U_FAILURE(status)) {
      instance.reset();
    }
    return instance;
  }();
  return transliterator.get();
}

// Fallback when transliteration data is unavailable: NFKD and drop marks.
icu::UnicodeString StripMarks(const icu::UnicodeString& input) {
  UErrorCode              status = U_ZERO_ERROR;
  const icu::Normalizer2* nfkd   = icu::Normalizer2::getNFKDInstance(status);
  if (U_FAILURE(status) || nfkd == nullptr) {
    throw std::runtime_error("ICU: failed to get NFKD normalizer");
  }

  icu::UnicodeString decomposed;
  nfkd->normalize(input, decomposed, status);
  if (U_FAILURE(status)) {
    throw std::runtime_error("ICU: NFKD normalize failed");
  }

  icu::UnicodeString out;
  for (int32_t i = 0; i < decomposed.length();) {
    UChar32 c = decomposed.char32At(i);
    if (u_getCombiningClass(c) == 0 && u_charType(c) != U_NON_SPACING_MARK) {
      out.append(c);
    }
    i = decomposed.moveIndex32(i, 1);
  }
  return out;
}

} // namespace

std::string FoldToAscii(std::string_view utf8) {
  icu::UnicodeString text = FromUtf8(utf8);

  if (auto* transliterator = LatinAsciiTransliterator()) {
    transliterator->transliterate(text);
  } else {
    text = StripMarks(text);
  }

  std::string converted;
  text.toUTF8String(converted);

  std::string ascii;
  ascii.reserve(converted.size());
  for (char c : converted) {
    if (static_cast<unsigned char>(c) < 0x80) {
      ascii.push_back(c);
    }
  }
  return ascii;
}

std::string ToLowerUtf8(std::string_view utf8) {
  icu::UnicodeString text = FromUtf8(utf8);
  text.toLower();
  std::string out;
  text.toUTF8String(out);
  return out;
}

std::string PrefixCodePoints(std::string_view utf8, std::size_t n) {
  const auto*   bytes  = reinterpret_cast<const uint8_t*>(utf8.data());
  const int32_t length = static_cast<int32_t>(utf8.size());
  int32_t       i      = 0;
  for (std::size_t count = 0; count < n && i < length; ++count) {
    U8_FWD_1(bytes, i, length);
  }
  return std::string(utf8.substr(0, static_cast<std::size_t>(i)));
}

std::u32string ToCodePoints(std::string_view utf8) {
  std::u32string out;
  out.reserve(utf8.size());

  const auto*   bytes  = reinterpret_cast<const uint8_t*>(utf8.data());
  const int32_t length = static_cast<int32_t>(utf8.size());
  int32_t       i      = 0;
  while (i < length) {
    UChar32 c;
    U8_NEXT(bytes, i, length, c);
    out.push_back(c < 0 ? U'\uFFFD' : static_cast<char32_t>(c));
  }
  return out;
}

} // namespace dedup::fingerprint
