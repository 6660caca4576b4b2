/**
 * @file navigationstate.hpp
 * @brief Browser state and the reducer that drives it
 *
 * The browser is a pure value (NavigationState) plus a reducer (Navigator)
 * that turns one input event into the next state. No terminal is involved,
 * so every transition can be exercised from tests.
 *
 * Key properties:
 * - Exactly one modal is active, enforced by std::variant
 * - Cursor and scroll offset always index the filtered view
 * - Listings are reloaded wholesale after navigation and mutations
 *
 * @see Navigator
 * @see FrameView
 */

#ifndef NAVIGATIONSTATE_HPP
#define NAVIGATIONSTATE_HPP

#include <optional>
#include <string>
#include <variant>

#include "directoryindex.hpp"
#include "entry.hpp"
#include "imutationops.hpp"

// ===== Modals =====

/** @brief Plain list navigation; the default modal */
struct Browsing {};

/** @brief Key reference screen */
struct HelpScreen {};

/** @brief Folder name input */
struct CreateFolderPrompt {
  /** @brief Name typed so far */
  std::string m_draft;
};

/** @brief Waiting for y/n before deleting m_target recursively */
struct ConfirmDelete {
  std::string m_target;
};

/** @brief Waiting for y/n before moving m_target into the archive */
struct ConfirmArchive {
  std::string m_target;
};

using Modal = std::variant<Browsing, HelpScreen, CreateFolderPrompt,
                           ConfirmDelete, ConfirmArchive>;

// ===== Input events =====

/** @brief A key press, as a normalized label (see keybindings.hpp) */
struct KeyEvent {
  std::string m_key;
};

/** @brief The terminal now has m_height rows */
struct ResizeEvent {
  int m_height;
};

using InputEvent = std::variant<KeyEvent, ResizeEvent>;

/**
 * @struct NavigationState
 * @brief Everything the browser knows between two events
 */
struct NavigationState {
  /** @brief Rows reserved for path, status line, spacer, indicator, footer */
  static constexpr int RESERVED_LINES = 5;

  /** @brief Directory currently shown */
  std::string m_root;

  /** @brief Listing of m_root, self entry first */
  Listing m_listing;

  /** @brief Filter text as typed */
  std::string m_filter;

  /** @brief Index into filtered() */
  int m_cursor = 0;

  /** @brief First row of filtered() shown in the window */
  int m_offset = 0;

  /** @brief Terminal height in rows; 0 while unknown */
  int m_height = 0;

  Modal m_modal;

  /** @brief Last create/delete/archive failure; empty when none */
  std::string m_error;

  /** @brief Path chosen with Tab; empty on quit */
  std::string m_selected;

  /** @brief Set once the user selected or quit */
  bool m_finished = false;

  /** @brief Entries of m_listing matching m_filter */
  Listing filtered() const;

  /**
   * @brief Number of list rows that fit on screen
   *
   * Terminal height minus RESERVED_LINES, or RESERVED_LINES itself when the
   * terminal is too small or its size is not known yet.
   */
  int visibleLines() const;

  /** @brief Entry under the cursor, if the filtered view is non-empty */
  std::optional<Entry> cursorEntry() const;

  template <typename T> bool isIn() const {
    return std::holds_alternative<T>(m_modal);
  }
};

/**
 * @class Navigator
 * @brief Reducer from (state, event) to the next state
 *
 * The navigator holds no state of its own, only its collaborators: the
 * directory index for (re)loading listings and the mutation backend for
 * create/delete/archive.
 *
 * @see NavigationState
 * @see ActionMap
 */
class Navigator {
private:
  const DirectoryIndex &m_index;
  IMutationOps &m_ops;

public:
  Navigator(const DirectoryIndex &index, IMutationOps &ops)
      : m_index(index), m_ops(ops) {}

  /**
   * @brief Creates the initial state for a directory
   *
   * @param root Absolute, normalized start directory
   * @param height Terminal height if already known, else 0
   */
  NavigationState start(const std::string &root, int height = 0) const;

  /**
   * @brief Applies one event
   *
   * A finished state is returned unchanged.
   *
   * @param state Current state (taken by value)
   * @param event Key press or resize
   * @return The next state
   */
  NavigationState reduce(NavigationState state, const InputEvent &event) const;

private:
  void onBrowsingKey(NavigationState &state, const std::string &key) const;
  void onHelpKey(NavigationState &state, const std::string &key) const;
  void onCreateKey(NavigationState &state, const std::string &key) const;
  void onConfirmKey(NavigationState &state, const std::string &key) const;

  void openDirectory(NavigationState &state, const std::string &path) const;
  void goToParent(NavigationState &state) const;
  void reload(NavigationState &state) const;

  /** @brief Places the cursor on the entry with this path, if visible */
  static void moveCursorTo(NavigationState &state, const std::string &path);

  /** @brief Scrolls just enough to keep the cursor in the window */
  static void fixScroll(NavigationState &state);
};

#endif // NAVIGATIONSTATE_HPP
