/**
 * @file keybindings.hpp
 * @brief Key labels, browser actions and their help texts
 *
 * The browser never sees terminal events directly. The frontend translates
 * each key press into a normalized label ("up", "ctrl+n", "a", ...), and
 * this header maps labels to actions.
 *
 * @see ActionID
 * @see ActionMap
 */

#ifndef KEYBINDINGS_HPP
#define KEYBINDINGS_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Normalized labels of the named keys
 *
 * Printable keys are not listed; they arrive as the character itself.
 */
namespace keys {
inline const std::string Up = "up";
inline const std::string Down = "down";
inline const std::string Enter = "enter";
inline const std::string Escape = "esc";
inline const std::string Tab = "tab";
inline const std::string F1 = "f1";
inline const std::string Backspace = "backspace";
inline const std::string AltBackspace = "alt+backspace";
inline const std::string CtrlBackspace = "ctrl+backspace";
inline const std::string CtrlA = "ctrl+a";
inline const std::string CtrlC = "ctrl+c";
inline const std::string CtrlN = "ctrl+n";
} // namespace keys

/**
 * @struct ActionInfo
 * @brief Key labels bound to an action and its line on the help screen
 */
struct ActionInfo {
  /** @brief Every key label that triggers the action */
  std::vector<std::string> m_keys;

  /** @brief Key column of the help screen; empty hides the action there */
  std::string m_key_hint;

  /** @brief Description column of the help screen */
  std::string m_description;
};

/**
 * @enum ActionID
 * @brief Actions available while browsing
 *
 * The enum order is the order of the help screen.
 */
enum class ActionID {
  MoveUp,
  MoveDown,
  Open,
  Select,
  Parent,
  FilterBackspace,
  CreateFolder,
  ArchiveFolder,
  DeleteFolder,
  Quit,
  ToggleHelp
};

/**
 * @brief Global mapping of actions to their keys and help lines
 *
 * MoveDown shares the "↑ / ↓" line of MoveUp and has no line of its own.
 */
inline const std::map<ActionID, ActionInfo> ActionMap = {
    {ActionID::MoveUp, {{keys::Up}, "↑ / ↓", "Navigate list"}},
    {ActionID::MoveDown, {{keys::Down}, "", ""}},
    {ActionID::Open, {{keys::Enter}, "Enter", "Open folder"}},
    {ActionID::Select, {{keys::Tab}, "Tab", "Select & cd to folder"}},
    {ActionID::Parent, {{keys::Escape}, "Esc", "Go to parent folder"}},
    {ActionID::FilterBackspace,
     {{keys::Backspace}, "Backspace", "Clear filter character"}},
    {ActionID::CreateFolder, {{keys::CtrlN}, "Ctrl+N", "Create new folder"}},
    {ActionID::ArchiveFolder,
     {{keys::CtrlA}, "Ctrl+A", "Archive folder"}},
    {ActionID::DeleteFolder,
     {{keys::AltBackspace, keys::CtrlBackspace}, "Alt+⌫",
      "Delete selected folder"}},
    {ActionID::Quit, {{keys::CtrlC}, "Ctrl+C", "Quit without select"}},
    {ActionID::ToggleHelp, {{keys::F1}, "F1", "Toggle this help"}}};

/**
 * @brief Looks up the action bound to a key label
 *
 * @param key Normalized key label
 * @return The bound action, or std::nullopt for unbound keys (including
 *         every printable character)
 */
inline std::optional<ActionID> actionForKey(const std::string &key) {
  for (const auto &[id, info] : ActionMap) {
    for (const auto &bound : info.m_keys) {
      if (bound == key) {
        return id;
      }
    }
  }
  return std::nullopt;
}

/**
 * @brief Translates a raw control sequence from the terminal into a label
 *
 * - Ctrl+A = 0x01, Ctrl+C = 0x03, Ctrl+N = 0x0E
 * - Alt+Backspace = ESC followed by DEL
 * - 0x08 (^H) is plain Backspace: many terminals send it for the Backspace
 *   key, so it must never reach the delete action
 *
 * @param input Bytes of one input event
 * @return The label, or std::nullopt for sequences the browser ignores
 */
inline std::optional<std::string>
labelForControlInput(const std::string &input) {
  if (input == "\x01")
    return keys::CtrlA;
  if (input == "\x03")
    return keys::CtrlC;
  if (input == "\x0E")
    return keys::CtrlN;
  if (input == "\x08")
    return keys::Backspace;
  if (input == "\x1B\x7F")
    return keys::AltBackspace;
  return std::nullopt;
}

/**
 * @brief One line of the help screen
 */
struct HelpEntry {
  ActionID m_action;
  std::string m_key_hint;
  std::string m_description;
};

/**
 * @brief Help screen lines in ActionID order
 */
inline std::vector<HelpEntry> getHelpEntries() {
  std::vector<HelpEntry> entries;
  entries.reserve(ActionMap.size());
  for (const auto &[id, info] : ActionMap) {
    if (!info.m_key_hint.empty()) {
      entries.push_back({id, info.m_key_hint, info.m_description});
    }
  }
  return entries;
}

#endif // KEYBINDINGS_HPP
