// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace jsonmend
{
namespace util
{
namespace utf8
{
  /// \brief Code point substituted for malformed input sequences.
  inline constexpr char32_t kReplacement = 0xFFFD;

  /// \brief Append the UTF-8 encoding of \p cp to \p out.
  /// Surrogates and values above U+10FFFF are written as U+FFFD.
  inline void append(std::string &out, char32_t cp)
  {
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
    {
      cp = kReplacement;
    }

    if (cp < 0x80)
    {
      out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  /// \brief Decode the well-formed sequence starting at byte \p i.
  /// \return its length in bytes with \p cp set, or 0 if the bytes at \p i
  /// are a stray continuation byte, a truncated or overlong sequence, an
  /// encoded surrogate or beyond U+10FFFF
  inline std::size_t decodeOne(std::string_view text, std::size_t i, char32_t &cp)
  {
    auto lead = static_cast<std::uint8_t>(text[i]);
    if (lead < 0x80)
    {
      cp = lead;
      return 1;
    }

    std::size_t len = 0;
    char32_t minimum = 0;
    if ((lead & 0xE0) == 0xC0)
    {
      len = 2;
      cp = lead & 0x1F;
      minimum = 0x80;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
      len = 3;
      cp = lead & 0x0F;
      minimum = 0x800;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
      len = 4;
      cp = lead & 0x07;
      minimum = 0x10000;
    }

    if (len == 0 || i + len > text.size())
    {
      return 0;
    }
    for (std::size_t k = 1; k < len; ++k)
    {
      auto cont = static_cast<std::uint8_t>(text[i + k]);
      if ((cont & 0xC0) != 0x80)
      {
        return 0;
      }
      cp = (cp << 6) | (cont & 0x3F);
    }

    if (cp < minimum || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
    {
      return 0;
    }
    return len;
  }

  /// \brief Decode UTF-8 text into code points.
  ///
  /// Never fails: every byte that does not begin a well-formed sequence
  /// yields one U+FFFD and decoding resumes at the next byte.
  inline std::u32string decode(std::string_view text)
  {
    std::u32string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size())
    {
      char32_t cp = 0;
      std::size_t len = decodeOne(text, i, cp);
      if (len != 0)
      {
        out.push_back(cp);
        i += len;
      }
      else
      {
        out.push_back(kReplacement);
        ++i;
      }
    }
    return out;
  }

  /// \brief Encode code points as UTF-8.
  inline std::string encode(std::u32string_view text)
  {
    std::string out;
    out.reserve(text.size());
    for (char32_t cp : text)
    {
      append(out, cp);
    }
    return out;
  }

  /// \brief Unicode White_Space property.
  inline bool isSpace(char32_t cp)
  {
    switch (cp)
    {
    case U' ':
    case U'\t':
    case U'\n':
    case U'\v':
    case U'\f':
    case U'\r':
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200A;
    }
  }

  inline bool isAsciiDigit(char32_t cp) { return cp >= U'0' && cp <= U'9'; }

  /// \brief Approximate Unicode letter test.
  ///
  /// Exact for ASCII and Latin-1. Above Latin-1 every code point counts as a
  /// letter except whitespace, combining diacritics, the punctuation and
  /// symbol blocks, fullwidth ASCII punctuation and digits, surrogates,
  /// private use, specials, and the emoji/pictograph planes.
  inline bool isLetter(char32_t cp)
  {
    if (cp < 0x80)
    {
      return (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z');
    }
    if (cp < 0xC0)
    {
      return cp == 0xAA || cp == 0xB5 || cp == 0xBA;
    }
    if (cp <= 0xFF)
    {
      return cp != 0xD7 && cp != 0xF7;
    }
    if (isSpace(cp))
    {
      return false;
    }
    if (cp >= 0x0300 && cp <= 0x036F) // combining diacritical marks
      return false;
    if (cp >= 0x2000 && cp <= 0x2BFF) // punctuation, symbols, arrows, box drawing
      return false;
    if (cp >= 0x3000 && cp <= 0x303F) // CJK symbols and punctuation
      return false;
    if (cp >= 0xD800 && cp <= 0xF8FF) // surrogates, private use
      return false;
    if (cp >= 0xFE00 && cp <= 0xFE6F) // variation selectors, CJK compatibility forms
      return false;
    if (cp >= 0xFF00 && cp <= 0xFF20) // fullwidth punctuation and digits
      return false;
    if ((cp >= 0xFF3B && cp <= 0xFF40) || (cp >= 0xFF5B && cp <= 0xFF65))
      return false;
    if (cp >= 0xFFF0 && cp <= 0xFFFF)
      return false;
    if (cp >= 0x1F000 && cp <= 0x1FAFF) // emoji and pictographs
      return false;
    return cp <= 0x10FFFF;
  }

  /// \brief Letter, ASCII digit or underscore.
  inline bool isIdentifierChar(char32_t cp) { return isLetter(cp) || isAsciiDigit(cp) || cp == U'_'; }

} // namespace utf8
} // namespace util
} // namespace jsonmend
