/**
 * @file pickerui.hpp
 * @brief Fullscreen terminal frontend of the folder picker, using FTXUI
 *
 * PickerUI owns the FTXUI screen and nothing else of interest: every key is
 * translated into a label and handed to the Navigator, and every frame is
 * drawn from FrameView output. All browser behavior lives in the core
 * library and is tested without a terminal.
 *
 * @see Navigator
 * @see FrameView
 */

#ifndef PICKERUI_HPP
#define PICKERUI_HPP

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>
#include <optional>
#include <string>

#include "config.hpp"
#include "directoryindex.hpp"
#include "frameview.hpp"
#include "mutationops.hpp"
#include "navigationstate.hpp"

using namespace ftxui;

/**
 * @class PickerUI
 * @brief Event loop glue between FTXUI and the browser reducer
 *
 * Lifecycle:
 * 1. Construct with configuration, start directory and home directory
 * 2. initialize() builds the component tree
 * 3. run() blocks until the user selects (Tab) or quits (Ctrl+C)
 * 4. selectedPath() tells which of the two happened
 */
class PickerUI {
private:
  // ===== Core =====

  /** @brief Lists directories, honoring the configured ignored names */
  DirectoryIndex m_index;

  /** @brief Filesystem backend for create/delete/archive */
  MutationOps m_ops;

  /** @brief Reducer; holds references to m_index and m_ops */
  Navigator m_navigator;

  /** @brief Current browser state, replaced after every event */
  NavigationState m_state;

  /** @brief Home and archive paths for rendering */
  ViewContext m_context;

  // ===== UI Components =====

  /** @brief FTXUI fullscreen terminal screen instance */
  ScreenInteractive m_screen = ScreenInteractive::Fullscreen();

  /** @brief Root component: frame renderer with key handling */
  Component m_document;

  /**
   * @brief Feeds the current terminal height to the reducer if it changed
   *
   * FTXUI has no resize event, so this runs at the start of every render.
   */
  void syncTerminalHeight();

  /** @brief Builds one FTXUI element for a frame row */
  static Element renderLine(const FrameLine &line);

public:
  /**
   * @brief Creates the UI and loads the start directory
   *
   * @param config Ignored names and archive directory
   * @param start_dir Absolute, normalized directory to open first
   * @param home Home directory for "~" display and the archive
   */
  PickerUI(const PickerConfig &config, const std::string &start_dir,
           const std::optional<std::string> &home);

  /**
   * @brief Builds the renderer and the key handler
   *
   * Must be called before run().
   */
  void initialize();

  /**
   * @brief Runs the FTXUI loop until the browser finishes
   */
  void run();

  /** @brief Path chosen with Tab, or empty after quitting */
  const std::string &selectedPath() const { return m_state.m_selected; }

  /**
   * @brief Translates an FTXUI event into a normalized key label
   *
   * @return The label, or std::nullopt for events the browser ignores
   *         (mouse, cursor reports, unbound special keys)
   *
   * @see keybindings.hpp
   */
  static std::optional<std::string> keyLabel(const Event &event);
};

#endif // PICKERUI_HPP
