/**
 * @file frameview.hpp
 * @brief Text frame derived from the browser state
 *
 * The frame is plain text with a semantic style per line; choosing colors is
 * left to the terminal frontend. A new frame is built for every state, there
 * is no partial redraw.
 */

#ifndef FRAMEVIEW_HPP
#define FRAMEVIEW_HPP

#include <optional>
#include <string>
#include <vector>

#include "navigationstate.hpp"

/**
 * @enum LineStyle
 * @brief Role of a frame line, mapped to colors by the frontend
 */
enum class LineStyle {
  Blank,
  Title,
  Path,
  Error,
  Filter,
  Placeholder,
  Item,
  SelectedItem,
  Indicator,
  Footer,
  Hint,
  KeyHint,
  Label,
  Emphasis,
  Danger,
  Warning,
  Success
};

/**
 * @struct FrameLine
 * @brief One rendered row
 *
 * KeyHint and Label rows carry a leading key/label column in m_key that
 * the frontend may emphasize; all other rows leave it empty.
 */
struct FrameLine {
  LineStyle m_style = LineStyle::Blank;
  std::string m_text;
  std::string m_key;

  /** @brief The row as plain text, key column included */
  std::string plain() const;
};

using Frame = std::vector<FrameLine>;

/**
 * @struct ViewContext
 * @brief Environment details the frame needs besides the state
 */
struct ViewContext {
  /** @brief Home directory for "~" shortening */
  std::optional<std::string> m_home;

  /** @brief Absolute archive directory, if resolvable */
  std::optional<std::string> m_archive_dir;

  /** @brief Version shown on the help screen */
  std::string m_version;
};

/**
 * @class FrameView
 * @brief Builds the frame for a state
 *
 * One screen per modal:
 * - Browsing: path, status line, list window, scroll indicator, footer
 * - HelpScreen: key reference built from ActionMap
 * - ConfirmDelete / ConfirmArchive: target (and destination) with y/n hint
 * - CreateFolderPrompt: parent directory and the draft name
 */
class FrameView {
public:
  /** @brief Fixed hint line under the list */
  static const std::string FOOTER;

  static Frame render(const NavigationState &state, const ViewContext &context);

  /** @brief Joins all rows with '\n' */
  static std::string toText(const Frame &frame);

private:
  static Frame browsingView(const NavigationState &state,
                            const ViewContext &context);
  static Frame helpView(const ViewContext &context);
  static Frame confirmDeleteView(const ConfirmDelete &modal,
                                 const ViewContext &context);
  static Frame createFolderView(const NavigationState &state,
                                const CreateFolderPrompt &modal,
                                const ViewContext &context);
  static Frame confirmArchiveView(const ConfirmArchive &modal,
                                  const ViewContext &context);
};

#endif // FRAMEVIEW_HPP
