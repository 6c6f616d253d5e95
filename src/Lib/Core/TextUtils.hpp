#pragma once

#include <algorithm> // std::ranges::{all_of, transform}
#include <cctype>    // std::{isspace, tolower}

#include "Nimbus++/Utils/Definitions.hpp"
#include "Nimbus++/Utils/Types.hpp"

namespace nimbus::core::text {
  namespace {
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::usize;
    using utils::types::Vec;
  } // namespace

  inline fn IsSpace(const char character) -> bool {
    return std::isspace(static_cast<unsigned char>(character)) != 0;
  }

  inline fn Trim(StringView text) -> StringView {
    while (!text.empty() && IsSpace(text.front()))
      text.remove_prefix(1);

    while (!text.empty() && IsSpace(text.back()))
      text.remove_suffix(1);

    return text;
  }

  inline fn IsBlank(const StringView text) -> bool {
    return std::ranges::all_of(text, IsSpace);
  }

  inline fn ToLower(const StringView text) -> String {
    String lowered(text);
    std::ranges::transform(lowered, lowered.begin(), [](const char character) {
      return static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
    });
    return lowered;
  }

  /**
   * @brief Splits on @p delimiter, keeping empty fields.
   */
  inline fn Split(const StringView text, const char delimiter) -> Vec<StringView> {
    Vec<StringView> fields;

    usize start = 0;

    while (true) {
      const usize end = text.find(delimiter, start);

      if (end == StringView::npos) {
        fields.push_back(text.substr(start));
        return fields;
      }

      fields.push_back(text.substr(start, end - start));
      start = end + 1;
    }
  }
} // namespace nimbus::core::text
