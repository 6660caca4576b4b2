/**
 * @file frameview.cpp
 * @brief Implementation of the per-modal text frames
 */

#include "frameview.hpp"
#include "keybindings.hpp"
#include "pathutils.hpp"

#include <algorithm>

namespace {

FrameLine line(LineStyle style, const std::string &text = "",
               const std::string &key = "") {
  return FrameLine{style, text, key};
}

FrameLine blank() { return line(LineStyle::Blank); }

std::string padRight(const std::string &text, size_t width) {
  // Width in code points, so "↑ / ↓" lines up with ASCII hints
  size_t columns = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) {
      ++columns;
    }
  }
  return columns >= width ? text + " " : text + std::string(width - columns, ' ');
}

} // namespace

const std::string FrameView::FOOTER =
    " ↑↓ nav • Enter open • Tab select • ^N new • F1 help ";

std::string FrameLine::plain() const { return m_key + m_text; }

Frame FrameView::render(const NavigationState &state,
                        const ViewContext &context) {
  if (state.isIn<HelpScreen>()) {
    return helpView(context);
  }
  if (const auto *modal = std::get_if<ConfirmDelete>(&state.m_modal)) {
    return confirmDeleteView(*modal, context);
  }
  if (const auto *modal = std::get_if<ConfirmArchive>(&state.m_modal)) {
    return confirmArchiveView(*modal, context);
  }
  if (const auto *modal = std::get_if<CreateFolderPrompt>(&state.m_modal)) {
    return createFolderView(state, *modal, context);
  }
  return browsingView(state, context);
}

std::string FrameView::toText(const Frame &frame) {
  std::string text;
  for (size_t i = 0; i < frame.size(); ++i) {
    if (i > 0) {
      text += '\n';
    }
    text += frame[i].plain();
  }
  return text;
}

/**
 * @brief Builds the list screen
 *
 * Layout (RESERVED_LINES rows plus the list window):
 * 1. Current directory, home-relative
 * 2. Error message, else "Filter: <text>_", else the typing hint
 * 3. Spacer
 * 4. Visible slice of the filtered view, "> " marks the cursor
 * 5. "(start-end of total)" when the view does not fit, else a spacer
 * 6. Footer
 */
Frame FrameView::browsingView(const NavigationState &state,
                              const ViewContext &context) {
  Frame frame;
  frame.push_back(line(LineStyle::Path, displayPath(state.m_root, context.m_home)));

  if (!state.m_error.empty()) {
    frame.push_back(line(LineStyle::Error, state.m_error));
  } else if (!state.m_filter.empty()) {
    frame.push_back(line(LineStyle::Filter, "Filter: " + state.m_filter + "_"));
  } else {
    frame.push_back(line(LineStyle::Placeholder, "Type to filter..."));
  }
  frame.push_back(blank());

  const Listing view = state.filtered();
  const int total = static_cast<int>(view.size());
  const int visible = state.visibleLines();
  const int start = std::min(state.m_offset, total);
  const int end = std::min(start + visible, total);

  for (int i = start; i < end; ++i) {
    const auto &entry = view[static_cast<size_t>(i)];
    if (i == state.m_cursor) {
      frame.push_back(line(LineStyle::SelectedItem, "> " + entry.getDisplayName()));
    } else {
      frame.push_back(line(LineStyle::Item, "  " + entry.getDisplayName()));
    }
  }

  if (total > visible) {
    frame.push_back(line(LineStyle::Indicator,
                         "(" + std::to_string(start + 1) + "-" +
                             std::to_string(end) + " of " +
                             std::to_string(total) + ")"));
  } else {
    frame.push_back(blank());
  }

  frame.push_back(line(LineStyle::Footer, FOOTER));
  return frame;
}

Frame FrameView::helpView(const ViewContext &context) {
  Frame frame;
  frame.push_back(blank());
  frame.push_back(line(LineStyle::Title, "  pf - folder picker  v" + context.m_version));
  frame.push_back(blank());

  for (const auto &entry : getHelpEntries()) {
    std::string description = entry.m_description;
    if (entry.m_action == ActionID::ArchiveFolder && context.m_archive_dir) {
      description += " (" + displayPath(*context.m_archive_dir, context.m_home) + ")";
    }
    frame.push_back(line(LineStyle::KeyHint, description,
                         "  " + padRight(entry.m_key_hint, 12)));
  }

  frame.push_back(blank());
  frame.push_back(line(LineStyle::Hint, "  Type any text to filter folders"));
  frame.push_back(line(LineStyle::Hint, "  Multiple words = match all"));
  frame.push_back(blank());
  frame.push_back(line(LineStyle::Hint, "  Press Esc or F1 to close"));
  frame.push_back(blank());
  return frame;
}

Frame FrameView::confirmDeleteView(const ConfirmDelete &modal,
                                   const ViewContext &context) {
  Frame frame;
  frame.push_back(blank());
  frame.push_back(line(LineStyle::Danger, "  Delete folder?"));
  frame.push_back(blank());
  frame.push_back(line(LineStyle::Emphasis,
                       "  " + displayPath(modal.m_target, context.m_home)));
  frame.push_back(blank());
  frame.push_back(line(LineStyle::Hint, "  This will permanently delete the folder"));
  frame.push_back(line(LineStyle::Hint, "  and all its contents!"));
  frame.push_back(blank());
  frame.push_back(line(LineStyle::Footer, " y = delete • n/Esc = cancel "));
  frame.push_back(blank());
  return frame;
}

Frame FrameView::createFolderView(const NavigationState &state,
                                  const CreateFolderPrompt &modal,
                                  const ViewContext &context) {
  std::string parent = displayPath(state.m_root, context.m_home);
  if (parent.back() != '/') {
    parent += '/';
  }

  Frame frame;
  frame.push_back(blank());
  frame.push_back(line(LineStyle::Success, "  Create new folder"));
  frame.push_back(blank());
  frame.push_back(line(LineStyle::Hint, "  in " + parent));
  frame.push_back(blank());
  frame.push_back(line(LineStyle::Emphasis, "  Name: " + modal.m_draft + "_"));
  frame.push_back(blank());
  frame.push_back(line(LineStyle::Footer, " Enter = create • Esc = cancel "));
  frame.push_back(blank());
  return frame;
}

/**
 * @brief Builds the archive confirmation
 *
 * The destination is shown as it will be after the move: archive directory
 * plus the folder's base name. Without a resolvable archive directory the
 * destination reads "(unavailable)" and confirming will fail with a message.
 */
Frame FrameView::confirmArchiveView(const ConfirmArchive &modal,
                                    const ViewContext &context) {
  std::string destination = "(unavailable)";
  if (context.m_archive_dir) {
    destination = displayPath(joinPath(*context.m_archive_dir, baseName(modal.m_target)),
                              context.m_home);
  }

  Frame frame;
  frame.push_back(blank());
  frame.push_back(line(LineStyle::Warning, "  Move to Archive?"));
  frame.push_back(blank());
  frame.push_back(line(LineStyle::Label,
                       displayPath(modal.m_target, context.m_home), "  From: "));
  frame.push_back(line(LineStyle::Label, destination, "  To:   "));
  frame.push_back(blank());
  frame.push_back(line(LineStyle::Hint, "  The folder will be moved to your archive."));
  frame.push_back(blank());
  frame.push_back(line(LineStyle::Footer, " y = archive • n/Esc = cancel "));
  frame.push_back(blank());
  return frame;
}
