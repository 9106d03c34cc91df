/*
 * engram C++11 - Text Normalizer
 *
 * Folds spelling variants before text reaches the lexical index or an
 * embedder, so stored content and queries meet in the same form:
 *   1. NFKC (fullwidth ASCII to ASCII, halfwidth kana to fullwidth)
 *   2. katakana v-sounds to b-sounds (ヴァ -> バ, ヴ -> ブ)
 *   3. hyphen and dash variants following kana to the prolonged mark ー
 *   4. small kana to full size (ァ -> ア); the sokuon ッ/っ is kept
 *   5. lower case
 */
#ifndef ENGRAM_MEMORY_NORMALIZER_HPP
#define ENGRAM_MEMORY_NORMALIZER_HPP

#include <string>

namespace engram {

// UTF-8 in, UTF-8 out. Invalid input sequences come back as U+FFFD.
// Throws std::runtime_error if the ICU normalization data is unavailable.
std::string normalize_text(const std::string& text);

} // namespace engram

#endif // ENGRAM_MEMORY_NORMALIZER_HPP
