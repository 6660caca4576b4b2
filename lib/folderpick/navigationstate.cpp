/**
 * @file navigationstate.cpp
 * @brief Implementation of the browser reducer
 *
 * Dispatch order for a key press:
 * 1. An input/confirmation modal (create, delete, archive) takes every key
 * 2. Otherwise a pending error message is cleared first
 * 3. Then the help screen or the list handles the key
 *
 * @see Navigator
 */

#include "navigationstate.hpp"
#include "filterengine.hpp"
#include "keybindings.hpp"
#include "pathutils.hpp"
#include "utils.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

// ============================================================================
// STATE QUERIES
// ============================================================================

Listing NavigationState::filtered() const {
  return FilterEngine::filter(m_listing, m_filter);
}

int NavigationState::visibleLines() const {
  if (m_height <= RESERVED_LINES) {
    return RESERVED_LINES;
  }
  return m_height - RESERVED_LINES;
}

std::optional<Entry> NavigationState::cursorEntry() const {
  auto view = filtered();
  if (const Entry *entry = safe_at(view, m_cursor)) {
    return *entry;
  }
  return std::nullopt;
}

// ============================================================================
// REDUCER
// ============================================================================

NavigationState Navigator::start(const std::string &root, int height) const {
  NavigationState state;
  state.m_height = height;
  openDirectory(state, root);
  return state;
}

NavigationState Navigator::reduce(NavigationState state,
                                  const InputEvent &event) const {
  if (state.m_finished) {
    return state;
  }

  if (const auto *resize = std::get_if<ResizeEvent>(&event)) {
    state.m_height = std::max(0, resize->m_height);
    fixScroll(state);
    return state;
  }

  const std::string &key = std::get<KeyEvent>(event).m_key;

  if (state.isIn<CreateFolderPrompt>()) {
    onCreateKey(state, key);
  } else if (state.isIn<ConfirmDelete>() || state.isIn<ConfirmArchive>()) {
    onConfirmKey(state, key);
  } else {
    state.m_error.clear();
    if (state.isIn<HelpScreen>()) {
      onHelpKey(state, key);
    } else {
      onBrowsingKey(state, key);
    }
  }

  return state;
}

/**
 * @brief Handles a key while the list is shown
 *
 * Bound keys are looked up in ActionMap. Any unbound printable character
 * extends the filter; unbound named keys are ignored.
 *
 * Delete and archive are only offered for real children: never for the
 * self entry and never for "/".
 *
 * @param state State to update in place
 * @param key Normalized key label
 */
void Navigator::onBrowsingKey(NavigationState &state,
                              const std::string &key) const {
  auto action = actionForKey(key);
  if (!action) {
    if (isPrintableKey(key)) {
      state.m_filter += key;
      state.m_cursor = 0;
      state.m_offset = 0;
    }
    return;
  }

  const Listing view = state.filtered();
  const Entry *entry = safe_at(view, state.m_cursor);

  switch (*action) {
  case ActionID::MoveUp:
    if (state.m_cursor > 0) {
      state.m_cursor--;
      fixScroll(state);
    }
    break;

  case ActionID::MoveDown:
    if (state.m_cursor < static_cast<int>(view.size()) - 1) {
      state.m_cursor++;
      fixScroll(state);
    }
    break;

  case ActionID::Open:
    if (entry) {
      if (entry->getPath() == state.m_root) {
        goToParent(state);
      } else {
        openDirectory(state, entry->getPath());
      }
    }
    break;

  case ActionID::Select:
    if (entry) {
      state.m_selected = entry->getPath();
      state.m_finished = true;
      spdlog::info("selected {}", state.m_selected);
    }
    break;

  case ActionID::Parent:
    goToParent(state);
    break;

  case ActionID::FilterBackspace:
    if (!state.m_filter.empty()) {
      popLastCodepoint(state.m_filter);
      state.m_cursor = 0;
      state.m_offset = 0;
    }
    break;

  case ActionID::CreateFolder:
    state.m_modal = CreateFolderPrompt{};
    break;

  case ActionID::DeleteFolder:
  case ActionID::ArchiveFolder:
    if (entry && entry->getPath() != state.m_root && entry->getPath() != "/") {
      if (*action == ActionID::DeleteFolder) {
        state.m_modal = ConfirmDelete{entry->getPath()};
      } else {
        state.m_modal = ConfirmArchive{entry->getPath()};
      }
    }
    break;

  case ActionID::Quit:
    state.m_finished = true;
    break;

  case ActionID::ToggleHelp:
    state.m_modal = HelpScreen{};
    break;
  }
}

void Navigator::onHelpKey(NavigationState &state,
                          const std::string &key) const {
  if (key == keys::F1 || key == keys::Escape) {
    state.m_modal = Browsing{};
  } else if (key == keys::CtrlC) {
    state.m_finished = true;
  }
}

/**
 * @brief Handles a key while the folder name prompt is open
 *
 * Enter with an empty name keeps the prompt open. Otherwise the prompt
 * closes whatever the outcome: on success the new folder gets the cursor
 * (if the current filter shows it), on failure the error is kept for the
 * status line.
 *
 * @param state State to update in place
 * @param key Normalized key label
 */
void Navigator::onCreateKey(NavigationState &state,
                            const std::string &key) const {
  auto &prompt = std::get<CreateFolderPrompt>(state.m_modal);

  if (key == keys::CtrlC) {
    state.m_finished = true;
  } else if (key == keys::Escape) {
    state.m_modal = Browsing{};
  } else if (key == keys::Backspace) {
    popLastCodepoint(prompt.m_draft);
  } else if (key == keys::Enter) {
    if (prompt.m_draft.empty()) {
      return;
    }

    const std::string name = prompt.m_draft;
    state.m_modal = Browsing{};

    MutationResult result = m_ops.createFolder(state.m_root, name);
    if (!result.ok()) {
      state.m_error = result.m_message;
      return;
    }

    reload(state);
    moveCursorTo(state, joinPath(state.m_root, name));
    state.m_error.clear();
  } else if (isPrintableKey(key)) {
    prompt.m_draft += key;
  }
}

/**
 * @brief Handles a key while a delete or archive confirmation is shown
 *
 * Only y/Y, n/N, Esc and Ctrl+C do anything. After a successful mutation
 * the current directory is reloaded with the cursor at the top.
 *
 * @param state State to update in place
 * @param key Normalized key label
 */
void Navigator::onConfirmKey(NavigationState &state,
                             const std::string &key) const {
  if (key == keys::CtrlC) {
    state.m_finished = true;
    return;
  }

  if (key == "n" || key == "N" || key == keys::Escape) {
    state.m_modal = Browsing{};
    return;
  }

  if (key != "y" && key != "Y") {
    return;
  }

  MutationResult result;
  if (const auto *confirm = std::get_if<ConfirmDelete>(&state.m_modal)) {
    result = m_ops.deleteFolder(confirm->m_target);
  } else {
    const auto &archive = std::get<ConfirmArchive>(state.m_modal);
    result = m_ops.archiveFolder(archive.m_target);
  }
  state.m_modal = Browsing{};

  if (!result.ok()) {
    state.m_error = result.m_message;
    return;
  }

  reload(state);
  state.m_error.clear();
}

// ============================================================================
// NAVIGATION
// ============================================================================

void Navigator::openDirectory(NavigationState &state,
                              const std::string &path) const {
  spdlog::debug("open {}", path);
  state.m_root = path;
  state.m_filter.clear();
  reload(state);
}

/**
 * @brief Moves to the parent directory and re-selects the one just left
 *
 * At "/" nothing happens. If the departed directory is gone from the new
 * listing, the cursor simply stays on the first row.
 */
void Navigator::goToParent(NavigationState &state) const {
  const std::string parent = parentPath(state.m_root);
  if (parent == state.m_root) {
    return;
  }

  const std::string previous = state.m_root;
  openDirectory(state, parent);
  moveCursorTo(state, previous);
}

void Navigator::reload(NavigationState &state) const {
  state.m_listing = m_index.load(state.m_root);
  state.m_cursor = 0;
  state.m_offset = 0;
}

void Navigator::moveCursorTo(NavigationState &state, const std::string &path) {
  const Listing view = state.filtered();
  auto it = std::find_if(view.begin(), view.end(), [&path](const Entry &e) {
    return e.getPath() == path;
  });

  if (it != view.end()) {
    state.m_cursor = static_cast<int>(std::distance(view.begin(), it));
    fixScroll(state);
  }
}

void Navigator::fixScroll(NavigationState &state) {
  const int visible = state.visibleLines();
  if (state.m_cursor < state.m_offset) {
    state.m_offset = state.m_cursor;
  }
  if (state.m_cursor >= state.m_offset + visible) {
    state.m_offset = state.m_cursor - visible + 1;
  }
  state.m_offset = std::max(0, state.m_offset);
}
