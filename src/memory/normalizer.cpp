/*
 * engram C++11 - Text Normalizer Implementation
 */
#include <engram/memory/normalizer.hpp>
#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>
#include <stdexcept>

namespace engram {

namespace {

const UChar KATAKANA_VU = 0x30F4;
const UChar PROLONGED_MARK = 0x30FC;

bool is_kana(UChar c) {
    return (c >= 0x3041 && c <= 0x309F) || (c >= 0x30A0 && c <= 0x30FF);
}

// Hyphen-like characters left after NFKC (U+FF0D and U+FE63 fold to '-')
bool is_dash(UChar c) {
    switch (c) {
        case 0x002D: case 0x2010: case 0x2011: case 0x2012: case 0x2013:
        case 0x2014: case 0x2015: case 0x2212:
            return true;
        default:
            return false;
    }
}

// ヴァ ヴィ ヴェ ヴォ fold the following small vowel in; a bare ヴ is ブ
UChar fold_vu(UChar next, bool& consumed_next) {
    consumed_next = true;
    switch (next) {
        case 0x30A1: return 0x30D0;  // ァ -> バ
        case 0x30A3: return 0x30D3;  // ィ -> ビ
        case 0x30A7: return 0x30D9;  // ェ -> ベ
        case 0x30A9: return 0x30DC;  // ォ -> ボ
        default:
            consumed_next = false;
            return 0x30D6;
    }
}

UChar full_size_kana(UChar c) {
    switch (c) {
        case 0x30A1: case 0x30A3: case 0x30A5: case 0x30A7: case 0x30A9:  // ァィゥェォ
        case 0x3041: case 0x3043: case 0x3045: case 0x3047: case 0x3049:  // ぁぃぅぇぉ
            return static_cast<UChar>(c + 1);
        default:
            return c;
    }
}

const icu::Normalizer2& nfkc_instance() {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfkc = icu::Normalizer2::getNFKCInstance(status);
    if (U_FAILURE(status) || !nfkc) {
        throw std::runtime_error(std::string("ICU NFKC normalizer unavailable: ") +
                                 u_errorName(status));
    }
    return *nfkc;
}

} // anonymous namespace

std::string normalize_text(const std::string& text) {
    if (text.empty()) return text;

    UErrorCode status = U_ZERO_ERROR;
    icu::UnicodeString source = icu::UnicodeString::fromUTF8(icu::StringPiece(text));
    icu::UnicodeString folded = nfkc_instance().normalize(source, status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("NFKC normalization failed: ") + u_errorName(status));
    }

    icu::UnicodeString out;
    const int32_t n = folded.length();
    for (int32_t i = 0; i < n; ++i) {
        UChar c = folded.charAt(i);
        if (c == KATAKANA_VU) {
            bool consumed = false;
            out.append(fold_vu(i + 1 < n ? folded.charAt(i + 1) : 0, consumed));
            if (consumed) ++i;
        } else if (is_dash(c) && out.length() > 0 && is_kana(out.charAt(out.length() - 1))) {
            out.append(PROLONGED_MARK);
        } else {
            out.append(full_size_kana(c));
        }
    }
    out.toLower(icu::Locale::getRoot());

    std::string result;
    out.toUTF8String(result);
    return result;
}

} // namespace engram
