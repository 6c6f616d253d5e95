#include "UI.hpp"

#include <algorithm> // std::max
#include <chrono>    // std::chrono::sys_days
#include <format>    // std::format

#include <Nimbus++/Utils/Logging.hpp>
#include <Nimbus++/Utils/Types.hpp>

using namespace nimbus::utils::types;
using namespace nimbus::utils::logging;

namespace nimbus::ui {
  using core::DailyForecast;

  constexpr Theme DEFAULT_THEME = {
    .icon      = ftxui::Color::Palette16::Cyan,
    .label     = ftxui::Color::Palette16::Yellow,
    .value     = ftxui::Color::Palette16::White,
    .highlight = ftxui::Color::Palette16::Magenta,
  };

  constexpr Icons ICON_TYPE = {
    .location    = " ◆ ",
    .calendar    = " ▸ ",
    .thermometer = " ▲ ",
    .summary     = " ◇ ",
  };

  struct RowInfo {
    StringView icon;
    String     label;
    String     value;
  };

  struct UIGroup {
    Vec<RowInfo> rows;
    Vec<usize>   iconWidths;
    Vec<usize>   labelWidths;
    Vec<usize>   valueWidths;

    // Coloured once here so rendering is plain concatenation.
    Vec<String> colouredIcons;
    Vec<String> colouredLabels;
    Vec<String> colouredValues;

    usize maxLabelWidth = 0;
  };

  namespace {
    constexpr fn IsWideCharacter(const char32_t codepoint) -> bool {
      return (codepoint >= 0x1100 && codepoint <= 0x115F) || // Hangul Jamo
        (codepoint >= 0x2E80 && codepoint <= 0x303E) ||      // CJK Radicals through CJK Symbols
        (codepoint >= 0x3041 && codepoint <= 0x33FF) ||      // Kana, Bopomofo, CJK Compatibility
        (codepoint >= 0x3400 && codepoint <= 0x4DBF) ||      // CJK Unified Ideographs Extension A
        (codepoint >= 0x4E00 && codepoint <= 0x9FFF) ||      // CJK Unified Ideographs
        (codepoint >= 0xA000 && codepoint <= 0xA4CF) ||      // Yi
        (codepoint >= 0xAC00 && codepoint <= 0xD7A3) ||      // Hangul Syllables
        (codepoint >= 0xF900 && codepoint <= 0xFAFF) ||      // CJK Compatibility Ideographs
        (codepoint >= 0xFE30 && codepoint <= 0xFE6F) ||      // CJK Compatibility Forms
        (codepoint >= 0xFF00 && codepoint <= 0xFF60) ||      // Fullwidth Forms
        (codepoint >= 0xFFE0 && codepoint <= 0xFFE6) ||      // Fullwidth Forms
        (codepoint >= 0x20000 && codepoint <= 0x3FFFD);      // CJK Unified Ideographs Extension B-F
    }

    constexpr fn DecodeUTF8(const StringView str, usize& pos) -> char32_t {
      if (pos >= str.length())
        return 0;

      const fn getByte = [&](const usize index) -> u8 {
        return static_cast<u8>(str[index]);
      };

      const u8 first = getByte(pos++);

      if ((first & 0x80) == 0) // ASCII (0xxxxxxx)
        return first;

      if ((first & 0xE0) == 0xC0) {
        // 2-byte sequence (110xxxxx 10xxxxxx)
        if (pos >= str.length())
          return 0;

        const u8 second = getByte(pos++);
        return ((first & 0x1F) << 6) | (second & 0x3F);
      }

      if ((first & 0xF0) == 0xE0) {
        // 3-byte sequence (1110xxxx 10xxxxxx 10xxxxxx)
        if (pos + 1 >= str.length())
          return 0;

        const u8 second = getByte(pos++);
        const u8 third  = getByte(pos++);
        return ((first & 0x0F) << 12) | ((second & 0x3F) << 6) | (third & 0x3F);
      }

      if ((first & 0xF8) == 0xF0) {
        // 4-byte sequence (11110xxx 10xxxxxx 10xxxxxx 10xxxxxx)
        if (pos + 2 >= str.length())
          return 0;

        const u8 second = getByte(pos++);
        const u8 third  = getByte(pos++);
        const u8 fourth = getByte(pos++);
        return ((first & 0x07) << 18) | ((second & 0x3F) << 12) | ((third & 0x3F) << 6) | (fourth & 0x3F);
      }

      return 0; // Invalid UTF-8
    }

    fn ProcessGroup(UIGroup& group) -> usize {
      if (group.rows.empty())
        return 0;

      usize groupMaxWidth = 0;

      for (const RowInfo& row : group.rows) {
        const usize iconW  = GetVisualWidth(row.icon);
        const usize labelW = GetVisualWidth(row.label);
        const usize valueW = GetVisualWidth(row.value);

        group.maxLabelWidth = std::max(group.maxLabelWidth, labelW);

        group.iconWidths.push_back(iconW);
        group.labelWidths.push_back(labelW);
        group.valueWidths.push_back(valueW);

        group.colouredIcons.push_back(Colorize(row.icon, DEFAULT_THEME.icon));
        group.colouredLabels.push_back(Colorize(row.label, DEFAULT_THEME.label));
        group.colouredValues.push_back(Colorize(row.value, DEFAULT_THEME.value));

        groupMaxWidth = std::max(groupMaxWidth, iconW + valueW);
      }

      // Widest label plus one separating space.
      return groupMaxWidth + group.maxLabelWidth + 1;
    }

    fn RenderGroup(String& out, const UIGroup& group, const usize maxContentWidth, const String& hBorder) -> Unit {
      if (group.rows.empty())
        return;

      out += "├";
      out += hBorder;
      out += "┤\n";

      for (usize i = 0; i < group.rows.size(); ++i) {
        const usize leftWidth  = group.iconWidths[i] + group.maxLabelWidth;
        const usize rightWidth = group.valueWidths[i];
        const usize padding    = maxContentWidth >= leftWidth + rightWidth ? maxContentWidth - (leftWidth + rightWidth) : 0;

        out += "│";
        out += group.colouredIcons[i];
        out += group.colouredLabels[i];
        out.append(group.maxLabelWidth - group.labelWidths[i], ' ');
        out.append(padding, ' ');
        out += group.colouredValues[i];
        out += " │\n";
      }
    }

    /**
     * @brief Draws a rounded box with a title line and one section per non-empty group.
     */
    fn RenderBox(const String& title, Vec<UIGroup>& groups) -> String {
      usize maxContentWidth = GetVisualWidth(title);

      for (UIGroup& group : groups)
        maxContentWidth = std::max(maxContentWidth, ProcessGroup(group));

      const usize innerWidth = maxContentWidth + 1;

      String hBorder;
      hBorder.reserve(innerWidth * 3);

      for (usize i = 0; i < innerWidth; ++i) hBorder += "─";

      String out;

      out += "╭";
      out += hBorder;
      out += "╮\n";

      out += "│";
      out += Colorize(title, DEFAULT_THEME.icon);
      out.append(maxContentWidth - GetVisualWidth(title), ' ');
      out += " │\n";

      for (const UIGroup& group : groups)
        RenderGroup(out, group, maxContentWidth, hBorder);

      out += "╰";
      out += hBorder;
      out += "╯\n";

      return out;
    }

    fn FormatInUnit(const f64 value, const StringView unitName) -> String {
      return std::format("{:.1f}{}", value, unitName == "fahrenheit" ? "°F" : "°C");
    }

    fn DayRow(const DailyForecast& day) -> RowInfo {
      return {
        .icon  = ICON_TYPE.calendar,
        .label = std::format("{:%a %d %b}", std::chrono::sys_days(day.date)),
        .value = std::format("{} / {}  {}", day.temperatureMin.format(), day.temperatureMax.format(), day.description),
      };
    }
  } // namespace

  fn GetVisualWidth(const StringView str) -> usize {
    usize width    = 0;
    bool  inEscape = false;
    usize pos      = 0;

    while (pos < str.length()) {
      const char current = str[pos];

      if (inEscape) {
        inEscape = (current != 'm');
        pos++;
      } else if (current == '\033') {
        inEscape = true;
        pos++;
      } else {
        const char32_t codepoint = DecodeUTF8(str, pos);

        if (codepoint != 0)
          width += IsWideCharacter(codepoint) ? 2 : 1;
      }
    }

    return width;
  }

  fn CreateSummaryReport(const Vec<LocationSummary>& summaries, const Temperature& threshold) -> String {
    const String title = std::format("{}Warmer than {} tomorrow", ICON_TYPE.summary, threshold.format());

    Vec<UIGroup> groups(1);

    if (summaries.empty())
      groups[0].rows.push_back({ .icon = ICON_TYPE.location, .label = "No matching locations", .value = "" });

    for (const LocationSummary& summary : summaries)
      groups[0].rows.push_back({
        .icon  = ICON_TYPE.location,
        .label = std::format("{}, {}", summary.locationName, summary.country),
        .value = std::format("{}  {}", FormatInUnit(summary.tomorrowMaxTemperature, summary.temperatureUnit), summary.weatherDescription),
      });

    return RenderBox(title, groups);
  }

  fn CreateDetailsReport(const LocationWeatherDetails& details) -> String {
    const core::Location& location = details.location;

    const String title = std::format("{}{}, {} ({})", ICON_TYPE.location, location.name, location.country, location.id);

    Vec<UIGroup> groups(2);

    for (const DailyForecast& day : details.forecast.forecasts)
      groups[0].rows.push_back(DayRow(day));

    if (!details.forecast.forecasts.empty()) {
      const DailyForecast& first = details.forecast.forecasts.front();

      groups[1].rows.push_back({ .icon = ICON_TYPE.thermometer, .label = "Humidity", .value = std::format("{:.0f}%", first.humidity) });
      groups[1].rows.push_back({ .icon = ICON_TYPE.thermometer, .label = "Wind", .value = std::format("{:.1f} m/s", first.windSpeed) });
      groups[1].rows.push_back({ .icon = ICON_TYPE.thermometer, .label = "Pressure", .value = std::format("{:.0f} hPa", first.pressure) });
    }

    return RenderBox(title, groups);
  }
} // namespace nimbus::ui
