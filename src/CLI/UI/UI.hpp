#pragma once

#include <ftxui/screen/color.hpp> // ftxui::Color::Palette16

#include <Nimbus++/Core/Entities.hpp>
#include <Nimbus++/Core/Temperature.hpp>
#include <Nimbus++/Utils/Types.hpp>

namespace nimbus::ui {
  namespace {
    using core::LocationSummary;
    using core::LocationWeatherDetails;
    using core::Temperature;

    using utils::types::String;
    using utils::types::StringView;
    using utils::types::usize;
    using utils::types::Vec;
  } // namespace

  struct Theme {
    ftxui::Color::Palette16 icon;
    ftxui::Color::Palette16 label;
    ftxui::Color::Palette16 value;
    ftxui::Color::Palette16 highlight;
  };

  extern const Theme DEFAULT_THEME;

  struct Icons {
    StringView location;
    StringView calendar;
    StringView thermometer;
    StringView summary;
  };

  extern const Icons ICON_TYPE;

  /**
   * @brief Terminal columns occupied by @p str, skipping ANSI escapes and counting wide CJK glyphs twice.
   */
  fn GetVisualWidth(StringView str) -> usize;

  /**
   * @brief Boxed list of the locations warmer than @p threshold tomorrow.
   */
  fn CreateSummaryReport(const Vec<LocationSummary>& summaries, const Temperature& threshold) -> String;

  /**
   * @brief Boxed day-by-day forecast for one location.
   */
  fn CreateDetailsReport(const LocationWeatherDetails& details) -> String;
} // namespace nimbus::ui
