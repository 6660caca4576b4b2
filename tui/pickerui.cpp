/**
 * @file pickerui.cpp
 * @brief Implementation of the FTXUI frontend
 */

#include "pickerui.hpp"
#include "keybindings.hpp"

#include <spdlog/spdlog.h>
#include <utility>

PickerUI::PickerUI(const PickerConfig &config, const std::string &start_dir,
                   const std::optional<std::string> &home)
    : m_index(config.getIgnoredNames()), m_ops(home, config.getArchiveDir()),
      m_navigator(m_index, m_ops) {
  m_context.m_home = home;
  m_context.m_archive_dir = m_ops.archiveDirectory();
  m_context.m_version = FOLDERPICK_VERSION;

  m_state = m_navigator.start(start_dir, Terminal::Size().dimy);
}

// ============================================================================
// UI SETUP
// ============================================================================

void PickerUI::initialize() {
  // Ctrl+C is a regular key for the browser, not a signal
  m_screen.ForceHandleCtrlC(false);

  auto renderer = Renderer([this] {
    syncTerminalHeight();

    Elements rows;
    for (const auto &line : FrameView::render(m_state, m_context)) {
      rows.push_back(renderLine(line));
    }
    return vbox(std::move(rows));
  });

  m_document = CatchEvent(renderer, [this](Event event) {
    auto key = keyLabel(event);
    if (!key) {
      return false;
    }

    m_state = m_navigator.reduce(std::move(m_state), KeyEvent{*key});
    if (m_state.m_finished) {
      m_screen.Exit();
    }
    return true;
  });
}

void PickerUI::syncTerminalHeight() {
  int height = Terminal::Size().dimy;
  if (height != m_state.m_height) {
    m_state = m_navigator.reduce(std::move(m_state), ResizeEvent{height});
  }
}

/**
 * @brief Maps a frame row to colors
 *
 * The palette follows the row roles: blue for location and cursor, red for
 * errors and delete, yellow for filter and archive, green for create, dark
 * gray for hints, and a dark bar for footers.
 */
Element PickerUI::renderLine(const FrameLine &line) {
  switch (line.m_style) {
  case LineStyle::Blank:
    return text("");
  case LineStyle::Path:
  case LineStyle::Title:
  case LineStyle::SelectedItem:
    return text(line.m_text) | bold | color(Color::Blue);
  case LineStyle::Error:
    return text(line.m_text) | color(Color::Red);
  case LineStyle::Filter:
    return text(line.m_text) | color(Color::Yellow);
  case LineStyle::Placeholder:
  case LineStyle::Indicator:
  case LineStyle::Hint:
    return text(line.m_text) | color(Color::GrayDark);
  case LineStyle::Footer:
    return hbox({text(line.m_text) | bgcolor(Color::Grey19) |
                     color(Color::White),
                 filler()});
  case LineStyle::KeyHint:
  case LineStyle::Label:
    return hbox({text(line.m_key) | bold, text(line.m_text)});
  case LineStyle::Emphasis:
    return text(line.m_text) | bold;
  case LineStyle::Danger:
    return text(line.m_text) | bold | color(Color::Red);
  case LineStyle::Warning:
    return text(line.m_text) | bold | color(Color::Yellow);
  case LineStyle::Success:
    return text(line.m_text) | bold | color(Color::Green);
  case LineStyle::Item:
  default:
    return text(line.m_text);
  }
}

// ============================================================================
// MAIN LOOP
// ============================================================================

void PickerUI::run() {
  spdlog::debug("starting in {}", m_state.m_root);
  m_screen.Loop(m_document);
}

// ============================================================================
// KEY TRANSLATION
// ============================================================================

/**
 * @brief Translates an FTXUI event into a normalized key label
 *
 * Named keys come from FTXUI's event constants. Control combinations arrive
 * as raw bytes and are decoded by labelForControlInput(). Printable input,
 * including multi-byte UTF-8, is passed on as is.
 */
std::optional<std::string> PickerUI::keyLabel(const Event &event) {
  if (event == Event::ArrowUp)
    return keys::Up;
  if (event == Event::ArrowDown)
    return keys::Down;
  if (event == Event::Return)
    return keys::Enter;
  if (event == Event::Escape)
    return keys::Escape;
  if (event == Event::Tab)
    return keys::Tab;
  if (event == Event::F1)
    return keys::F1;
  if (event == Event::Backspace)
    return keys::Backspace;

  if (auto label = labelForControlInput(event.input()))
    return label;

  if (event.is_character())
    return event.character();

  return std::nullopt;
}
