/**
 * @file test_navigationstate.cpp
 * @brief Unit tests for the Navigator reducer
 *
 * The reducer is driven with key labels exactly as the terminal frontend
 * would send them. Listings come from a real temporary tree; mutations run
 * either against the filesystem (MutationOps with a fake home) or against
 * a stub that always fails.
 *
 * ## Test Coverage
 *
 * ### Browsing
 * - Cursor movement, clamping and scrolling
 * - Filter typing and backspace
 * - Open, parent navigation and re-selection of the departed folder
 * - Tab selection and quitting
 *
 * ### Modals
 * - Help toggling and key capture
 * - Create folder: success, failure, empty draft, cancel
 * - Delete/archive: guard, confirm, decline, failure
 * - Error message lifetime
 *
 * ### Invariants
 * - Cursor and scroll bounds over a long pseudo-random key sequence
 *
 * @see Navigator
 * @see NavigationState
 */

#include <gtest/gtest.h>
#include "directoryindex.hpp"
#include "keybindings.hpp"
#include "mutationops.hpp"
#include "navigationstate.hpp"
#include "pathutils.hpp"
#include <algorithm>
#include <filesystem>
#include <memory>
#include <random>

/**
 * @brief Mutation backend whose every call fails
 */
class FailingOps : public IMutationOps {
public:
    int calls = 0;

    MutationResult createFolder(const std::string&, const std::string&) override {
        ++calls;
        return MutationResult::failure(MutationStatus::PermissionDenied, "Error: create failed");
    }
    MutationResult deleteFolder(const std::string&) override {
        ++calls;
        return MutationResult::failure(MutationStatus::PermissionDenied, "Error: delete failed");
    }
    MutationResult archiveFolder(const std::string&) override {
        ++calls;
        return MutationResult::failure(MutationStatus::CrossDevice, "Error: archive failed");
    }
};

/**
 * @class NavigatorTest
 * @brief Fixture with a tree work/{alpha, Beta, .hidden, node_modules}
 *
 * The fake home directory lives next to "work" so archiving never touches
 * the real home.
 */
class NavigatorTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir;
    std::string work;
    std::string home;

    DirectoryIndex index;
    std::unique_ptr<MutationOps> ops;
    std::unique_ptr<Navigator> navigator;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = std::filesystem::temp_directory_path() /
                   (std::string("navigator_test_") + info->name());
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir / "work");
        std::filesystem::create_directories(test_dir / "home");

        const std::string base = normalizePath(std::filesystem::canonical(test_dir).string());
        work = base + "/work";
        home = base + "/home";

        for (const auto* name : {"alpha", "Beta", ".hidden", "node_modules"}) {
            std::filesystem::create_directory(std::filesystem::path(work) / name);
        }

        ops = std::make_unique<MutationOps>(home);
        navigator = std::make_unique<Navigator>(index, *ops);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    NavigationState press(NavigationState state, const std::string& key) const {
        return navigator->reduce(std::move(state), KeyEvent{key});
    }

    NavigationState type(NavigationState state, const std::string& text) const {
        for (char c : text) {
            state = press(std::move(state), std::string(1, c));
        }
        return state;
    }

    static std::vector<std::string> names(const Listing& listing) {
        std::vector<std::string> result;
        for (const auto& entry : listing) {
            result.push_back(entry.getDisplayName());
        }
        return result;
    }

    static void expectInvariants(const NavigationState& state) {
        const int size = static_cast<int>(state.filtered().size());
        EXPECT_GE(state.m_cursor, 0);
        EXPECT_LT(state.m_cursor, std::max(1, size));
        EXPECT_LE(state.m_offset, state.m_cursor);
        EXPECT_LE(state.m_cursor, state.m_offset + state.visibleLines() - 1);
    }
};

// ============================================================================
// BROWSING
// ============================================================================

TEST_F(NavigatorTest, StartsWithListingOfRoot) {
    auto state = navigator->start(work);

    EXPECT_EQ(state.m_root, work);
    EXPECT_EQ(names(state.m_listing), (std::vector<std::string>{"[work]", "Beta", "alpha"}));
    EXPECT_EQ(state.m_cursor, 0);
    EXPECT_EQ(state.m_offset, 0);
    EXPECT_TRUE(state.isIn<Browsing>());
    EXPECT_FALSE(state.m_finished);
}

TEST_F(NavigatorTest, CursorClampsAtBounds) {
    auto state = navigator->start(work);

    state = press(state, keys::Up);
    EXPECT_EQ(state.m_cursor, 0);

    state = press(state, keys::Down);
    state = press(state, keys::Down);
    EXPECT_EQ(state.m_cursor, 2);

    state = press(state, keys::Down);
    EXPECT_EQ(state.m_cursor, 2);

    state = press(state, keys::Up);
    EXPECT_EQ(state.m_cursor, 1);
}

/**
 * @test ScrollFollowsCursor
 * @brief With 5 visible rows the window slides to keep the cursor inside
 */
TEST_F(NavigatorTest, ScrollFollowsCursor) {
    for (int i = 0; i < 20; ++i) {
        std::filesystem::create_directory(std::filesystem::path(work) /
                                          ("dir" + std::to_string(10 + i)));
    }

    auto state = navigator->start(work, 10);
    ASSERT_EQ(state.visibleLines(), 5);

    for (int i = 0; i < 12; ++i) {
        state = press(state, keys::Down);
        expectInvariants(state);
    }
    EXPECT_EQ(state.m_cursor, 12);
    EXPECT_EQ(state.m_offset, 8);

    for (int i = 0; i < 10; ++i) {
        state = press(state, keys::Up);
        expectInvariants(state);
    }
    EXPECT_EQ(state.m_cursor, 2);
    EXPECT_EQ(state.m_offset, 2);
}

TEST_F(NavigatorTest, VisibleLinesReserveFiveRows) {
    NavigationState state;

    state.m_height = 0;
    EXPECT_EQ(state.visibleLines(), 5);
    state.m_height = 4;
    EXPECT_EQ(state.visibleLines(), 5);
    state.m_height = 5;
    EXPECT_EQ(state.visibleLines(), 5);
    state.m_height = 6;
    EXPECT_EQ(state.visibleLines(), 1);
    state.m_height = 40;
    EXPECT_EQ(state.visibleLines(), 35);
}

TEST_F(NavigatorTest, ResizeKeepsCursorVisible) {
    for (int i = 0; i < 10; ++i) {
        std::filesystem::create_directory(std::filesystem::path(work) /
                                          ("dir" + std::to_string(i)));
    }
    auto state = navigator->start(work, 40);
    for (int i = 0; i < 8; ++i) {
        state = press(state, keys::Down);
    }
    EXPECT_EQ(state.m_offset, 0);

    state = navigator->reduce(state, ResizeEvent{8});
    EXPECT_EQ(state.m_height, 8);
    EXPECT_EQ(state.m_cursor, 8);
    EXPECT_EQ(state.m_offset, 6);
    expectInvariants(state);
}

/**
 * @test FilterThenOpen
 * @brief Typing "al" leaves alpha; Enter opens it and clears the filter
 */
TEST_F(NavigatorTest, FilterThenOpen) {
    auto state = type(navigator->start(work), "al");

    EXPECT_EQ(state.m_filter, "al");
    EXPECT_EQ(names(state.filtered()), (std::vector<std::string>{"alpha"}));
    EXPECT_EQ(state.m_cursor, 0);

    state = press(state, keys::Enter);
    EXPECT_EQ(state.m_root, work + "/alpha");
    EXPECT_EQ(state.m_filter, "");
    EXPECT_EQ(state.m_cursor, 0);
    EXPECT_EQ(state.m_offset, 0);
    EXPECT_EQ(names(state.m_listing), (std::vector<std::string>{"[alpha]"}));
}

TEST_F(NavigatorTest, TypingResetsCursor) {
    auto state = navigator->start(work);
    state = press(state, keys::Down);
    state = press(state, keys::Down);
    ASSERT_EQ(state.m_cursor, 2);

    state = type(state, "a");
    EXPECT_EQ(state.m_cursor, 0);
    EXPECT_EQ(state.m_offset, 0);
}

TEST_F(NavigatorTest, BackspaceEditsFilter) {
    auto state = type(navigator->start(work), "alx");
    EXPECT_TRUE(state.filtered().empty());
    EXPECT_EQ(state.m_cursor, 0);

    state = press(state, keys::Backspace);
    EXPECT_EQ(state.m_filter, "al");
    EXPECT_EQ(state.filtered().size(), 1u);

    state = press(press(state, keys::Backspace), keys::Backspace);
    EXPECT_EQ(state.m_filter, "");

    // Nothing left to remove: no-op
    state = press(state, keys::Down);
    state = press(state, keys::Backspace);
    EXPECT_EQ(state.m_cursor, 1);
}

TEST_F(NavigatorTest, BackspaceRemovesWholeCodepoint) {
    auto state = navigator->start(work);
    state = press(state, "a");
    state = press(state, "\xC3\xA9"); // é

    EXPECT_EQ(state.m_filter, "a\xC3\xA9");
    state = press(state, keys::Backspace);
    EXPECT_EQ(state.m_filter, "a");
}

TEST_F(NavigatorTest, UnboundNamedKeysIgnored) {
    auto state = navigator->start(work);
    state = press(state, "pgup");
    state = press(state, "ctrl+z");

    EXPECT_EQ(state.m_filter, "");
    EXPECT_TRUE(state.isIn<Browsing>());
}

/**
 * @test EscapeReturnsToDepartedFolder
 * @brief Going up lands the cursor on the folder just left
 */
TEST_F(NavigatorTest, EscapeReturnsToDepartedFolder) {
    auto state = navigator->start(work + "/alpha");

    state = press(state, keys::Escape);
    EXPECT_EQ(state.m_root, work);
    ASSERT_EQ(names(state.filtered()), (std::vector<std::string>{"[work]", "Beta", "alpha"}));
    EXPECT_EQ(state.m_cursor, 2);
}

TEST_F(NavigatorTest, EnterOnSelfEntryGoesUp) {
    auto state = navigator->start(work + "/alpha");
    ASSERT_EQ(state.m_cursor, 0);

    state = press(state, keys::Enter);
    EXPECT_EQ(state.m_root, work);
    EXPECT_EQ(state.m_cursor, 2);
}

TEST_F(NavigatorTest, EscapeClearsFilter) {
    auto state = type(navigator->start(work + "/alpha"), "zzz");

    state = press(state, keys::Escape);
    EXPECT_EQ(state.m_root, work);
    EXPECT_EQ(state.m_filter, "");
}

TEST_F(NavigatorTest, DepartedFolderGoneLeavesCursorAtTop) {
    const std::string gamma = work + "/gamma";
    std::filesystem::create_directory(gamma);
    auto state = navigator->start(gamma);
    std::filesystem::remove(gamma);

    state = press(state, keys::Escape);
    EXPECT_EQ(state.m_root, work);
    EXPECT_EQ(state.m_cursor, 0);
}

/**
 * @test ParentOfFilesystemRootIsNoop
 * @brief Going up from "/" keeps "/" as the root
 */
TEST_F(NavigatorTest, ParentOfFilesystemRootIsNoop) {
    auto state = navigator->start("/");

    state = press(state, keys::Escape);
    EXPECT_EQ(state.m_root, "/");

    state = press(state, keys::Enter);
    EXPECT_EQ(state.m_root, "/");
    EXPECT_EQ(state.m_cursor, 0);
}

TEST_F(NavigatorTest, TabSelectsAndFinishes) {
    auto state = press(navigator->start(work), keys::Down);

    state = press(state, keys::Tab);
    EXPECT_TRUE(state.m_finished);
    EXPECT_EQ(state.m_selected, work + "/Beta");

    // Finished states ignore further input
    auto after = press(state, keys::Down);
    EXPECT_EQ(after.m_cursor, state.m_cursor);
    EXPECT_EQ(after.m_selected, state.m_selected);
}

TEST_F(NavigatorTest, TabOnSelfEntrySelectsCurrentDirectory) {
    auto state = press(navigator->start(work), keys::Tab);
    EXPECT_TRUE(state.m_finished);
    EXPECT_EQ(state.m_selected, work);
}

TEST_F(NavigatorTest, TabWithEmptyViewDoesNothing) {
    auto state = type(navigator->start(work), "nomatch");
    ASSERT_TRUE(state.filtered().empty());

    state = press(state, keys::Tab);
    EXPECT_FALSE(state.m_finished);
    EXPECT_EQ(state.m_selected, "");

    state = press(state, keys::Enter);
    EXPECT_EQ(state.m_root, work);
}

TEST_F(NavigatorTest, CtrlCQuitsWithoutSelection) {
    auto state = press(navigator->start(work), keys::CtrlC);
    EXPECT_TRUE(state.m_finished);
    EXPECT_EQ(state.m_selected, "");
}

// ============================================================================
// HELP
// ============================================================================

TEST_F(NavigatorTest, HelpToggles) {
    auto state = press(navigator->start(work), keys::F1);
    EXPECT_TRUE(state.isIn<HelpScreen>());

    state = press(state, keys::F1);
    EXPECT_TRUE(state.isIn<Browsing>());
}

/**
 * @test HelpCapturesKeys
 * @brief Only F1, Esc and Ctrl+C do anything on the help screen
 */
TEST_F(NavigatorTest, HelpCapturesKeys) {
    auto state = press(navigator->start(work + "/alpha"), keys::F1);

    state = type(state, "abc");
    state = press(state, keys::Down);
    state = press(state, keys::Tab);
    EXPECT_TRUE(state.isIn<HelpScreen>());
    EXPECT_EQ(state.m_filter, "");
    EXPECT_FALSE(state.m_finished);

    // Esc closes help without going up
    state = press(state, keys::Escape);
    EXPECT_TRUE(state.isIn<Browsing>());
    EXPECT_EQ(state.m_root, work + "/alpha");
}

TEST_F(NavigatorTest, CtrlCQuitsFromHelp) {
    auto state = press(press(navigator->start(work), keys::F1), keys::CtrlC);
    EXPECT_TRUE(state.m_finished);
}

// ============================================================================
// CREATE FOLDER
// ============================================================================

TEST_F(NavigatorTest, CreateFolderSelectsNewEntry) {
    auto state = press(navigator->start(work), keys::CtrlN);
    ASSERT_TRUE(state.isIn<CreateFolderPrompt>());

    state = type(state, "newdir");
    EXPECT_EQ(std::get<CreateFolderPrompt>(state.m_modal).m_draft, "newdir");

    state = press(state, keys::Enter);
    EXPECT_TRUE(state.isIn<Browsing>());
    EXPECT_TRUE(std::filesystem::is_directory(work + "/newdir"));
    EXPECT_EQ(state.m_error, "");

    auto entry = state.cursorEntry();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->getPath(), work + "/newdir");
}

/**
 * @test CreateExistingFolderReportsError
 * @brief A failed create returns to browsing with an error that the next
 *        key press clears
 */
TEST_F(NavigatorTest, CreateExistingFolderReportsError) {
    std::filesystem::create_directory(work + "/newdir");
    auto before = navigator->start(work);

    auto state = type(press(before, keys::CtrlN), "newdir");
    state = press(state, keys::Enter);

    EXPECT_TRUE(state.isIn<Browsing>());
    EXPECT_FALSE(state.m_error.empty());
    EXPECT_EQ(state.m_listing, before.m_listing);

    state = press(state, keys::Down);
    EXPECT_EQ(state.m_error, "");
    EXPECT_EQ(state.m_cursor, 1);
}

TEST_F(NavigatorTest, CreateWithEmptyDraftKeepsPrompt) {
    auto state = press(press(navigator->start(work), keys::CtrlN), keys::Enter);
    EXPECT_TRUE(state.isIn<CreateFolderPrompt>());
}

TEST_F(NavigatorTest, CreateEscapeDiscardsDraft) {
    auto state = type(press(navigator->start(work), keys::CtrlN), "tmp");

    state = press(state, keys::Escape);
    EXPECT_TRUE(state.isIn<Browsing>());
    EXPECT_FALSE(std::filesystem::exists(work + "/tmp"));
    EXPECT_EQ(state.m_root, work);

    state = press(state, keys::CtrlN);
    EXPECT_EQ(std::get<CreateFolderPrompt>(state.m_modal).m_draft, "");
}

TEST_F(NavigatorTest, CreatePromptCapturesKeys) {
    auto state = press(navigator->start(work), keys::CtrlN);

    state = press(state, keys::Down);
    state = press(state, keys::Tab);
    state = press(state, keys::F1);
    state = type(state, "ab");
    state = press(state, keys::Backspace);

    EXPECT_TRUE(state.isIn<CreateFolderPrompt>());
    EXPECT_EQ(std::get<CreateFolderPrompt>(state.m_modal).m_draft, "a");
    EXPECT_EQ(state.m_cursor, 0);
    EXPECT_EQ(state.m_filter, "");
    EXPECT_FALSE(state.m_finished);
}

TEST_F(NavigatorTest, CreateUnderFilterThatHidesNewFolder) {
    auto state = type(navigator->start(work), "alp");
    state = type(press(state, keys::CtrlN), "zeta");
    state = press(state, keys::Enter);

    EXPECT_TRUE(std::filesystem::is_directory(work + "/zeta"));
    EXPECT_EQ(state.m_filter, "alp");
    EXPECT_EQ(state.m_cursor, 0);
}

// ============================================================================
// DELETE / ARCHIVE
// ============================================================================

TEST_F(NavigatorTest, DeleteNotOfferedForSelfEntry) {
    auto state = press(navigator->start(work), keys::AltBackspace);
    EXPECT_TRUE(state.isIn<Browsing>());

    state = press(state, keys::CtrlA);
    EXPECT_TRUE(state.isIn<Browsing>());
}

TEST_F(NavigatorTest, DeleteNotOfferedForFilesystemRoot) {
    auto state = press(navigator->start("/"), keys::CtrlBackspace);
    EXPECT_TRUE(state.isIn<Browsing>());
}

/**
 * @test DeleteConfirmed
 * @brief y deletes alpha, reloads work and puts the cursor at the top
 */
TEST_F(NavigatorTest, DeleteConfirmed) {
    auto state = type(navigator->start(work), "alpha");
    state = press(state, keys::AltBackspace);

    ASSERT_TRUE(state.isIn<ConfirmDelete>());
    EXPECT_EQ(std::get<ConfirmDelete>(state.m_modal).m_target, work + "/alpha");

    state = press(state, "y");
    EXPECT_TRUE(state.isIn<Browsing>());
    EXPECT_FALSE(std::filesystem::exists(work + "/alpha"));
    EXPECT_EQ(state.m_root, work);
    EXPECT_EQ(names(state.m_listing), (std::vector<std::string>{"[work]", "Beta"}));
    EXPECT_EQ(state.m_cursor, 0);
    EXPECT_EQ(state.m_offset, 0);
    EXPECT_EQ(state.m_error, "");
}

TEST_F(NavigatorTest, DeleteDeclined) {
    for (const auto& decline : {std::string("n"), std::string("N"), keys::Escape}) {
        auto state = press(press(navigator->start(work), keys::Down), keys::CtrlBackspace);
        ASSERT_TRUE(state.isIn<ConfirmDelete>());

        state = press(state, decline);
        EXPECT_TRUE(state.isIn<Browsing>());
        EXPECT_EQ(state.m_error, "");
        EXPECT_EQ(state.m_root, work);
        EXPECT_TRUE(std::filesystem::exists(work + "/Beta"));
    }
}

TEST_F(NavigatorTest, ConfirmationIgnoresOtherKeys) {
    auto state = press(press(navigator->start(work), keys::Down), keys::AltBackspace);

    state = press(state, "x");
    state = press(state, keys::Enter);
    state = press(state, keys::Up);
    EXPECT_TRUE(state.isIn<ConfirmDelete>());
    EXPECT_EQ(state.m_filter, "");
    EXPECT_TRUE(std::filesystem::exists(work + "/Beta"));

    state = press(state, keys::CtrlC);
    EXPECT_TRUE(state.m_finished);
    EXPECT_EQ(state.m_selected, "");
    EXPECT_TRUE(std::filesystem::exists(work + "/Beta"));
}

TEST_F(NavigatorTest, ArchiveConfirmed) {
    auto state = press(press(press(navigator->start(work), keys::Down), keys::Down), keys::CtrlA);
    ASSERT_TRUE(state.isIn<ConfirmArchive>());
    EXPECT_EQ(std::get<ConfirmArchive>(state.m_modal).m_target, work + "/alpha");

    state = press(state, "Y");
    EXPECT_TRUE(state.isIn<Browsing>());
    EXPECT_EQ(state.m_error, "");
    EXPECT_FALSE(std::filesystem::exists(work + "/alpha"));
    EXPECT_TRUE(std::filesystem::is_directory(home + "/Dev-Archive/alpha"));
    EXPECT_EQ(names(state.m_listing), (std::vector<std::string>{"[work]", "Beta"}));
}

TEST_F(NavigatorTest, ArchiveOntoExistingNameFails) {
    std::filesystem::create_directories(home + "/Dev-Archive/alpha");

    auto state = type(navigator->start(work), "alpha");
    state = press(press(state, keys::CtrlA), "y");

    EXPECT_TRUE(state.isIn<Browsing>());
    EXPECT_FALSE(state.m_error.empty());
    EXPECT_TRUE(std::filesystem::exists(work + "/alpha"));
}

/**
 * @test MutationFailuresSurfaceAsErrors
 * @brief Failures from the backend end up in m_error and never throw
 */
TEST_F(NavigatorTest, MutationFailuresSurfaceAsErrors) {
    FailingOps failing;
    Navigator broken(index, failing);

    auto state = broken.start(work);
    state = broken.reduce(state, KeyEvent{keys::Down});
    state = broken.reduce(state, KeyEvent{keys::AltBackspace});
    state = broken.reduce(state, KeyEvent{"y"});
    EXPECT_EQ(state.m_error, "Error: delete failed");
    EXPECT_TRUE(state.isIn<Browsing>());

    state = broken.reduce(state, KeyEvent{keys::CtrlA});
    EXPECT_EQ(state.m_error, "");
    state = broken.reduce(state, KeyEvent{"y"});
    EXPECT_EQ(state.m_error, "Error: archive failed");

    state = broken.reduce(state, KeyEvent{keys::CtrlN});
    state = broken.reduce(state, KeyEvent{"x"});
    state = broken.reduce(state, KeyEvent{keys::Enter});
    EXPECT_EQ(state.m_error, "Error: create failed");

    EXPECT_EQ(failing.calls, 3);
    EXPECT_TRUE(std::filesystem::exists(work + "/Beta"));
}

TEST_F(NavigatorTest, ModalKeepsPendingError) {
    auto state = navigator->start(work);
    state.m_error = "Error: earlier";
    state.m_modal = CreateFolderPrompt{};

    state = press(state, "a");
    EXPECT_EQ(state.m_error, "Error: earlier");

    state = press(state, keys::Escape);
    EXPECT_EQ(state.m_error, "Error: earlier");

    state = press(state, "b");
    EXPECT_EQ(state.m_error, "");
    EXPECT_EQ(state.m_filter, "b");
}

TEST_F(NavigatorTest, ResizeKeepsError) {
    auto state = navigator->start(work);
    state.m_error = "Error: earlier";

    state = navigator->reduce(state, ResizeEvent{30});
    EXPECT_EQ(state.m_error, "Error: earlier");
}

// ============================================================================
// INVARIANTS
// ============================================================================

/**
 * @test InvariantsHoldOverRandomInput
 * @brief Cursor and scroll bounds hold after every event
 *
 * Drives a deterministic pseudo-random mix of navigation, filter and resize
 * events over a small tree. Parent navigation is only issued below the test
 * directory so the walk never leaves it.
 */
TEST_F(NavigatorTest, InvariantsHoldOverRandomInput) {
    for (int i = 0; i < 15; ++i) {
        std::filesystem::create_directories(std::filesystem::path(work) / "alpha" /
                                            ("sub" + std::to_string(i)));
        std::filesystem::create_directory(std::filesystem::path(work) /
                                          ("b" + std::to_string(i)));
    }

    const std::vector<std::string> pool = {keys::Up, keys::Down, keys::Down,
                                           keys::Enter, keys::Escape,
                                           keys::Backspace, "a", "b", "1", " ",
                                           "resize"};
    std::mt19937 rng(1234);
    std::uniform_int_distribution<size_t> pick(0, pool.size() - 1);
    std::uniform_int_distribution<int> heights(0, 30);

    auto state = navigator->start(work, 12);
    for (int step = 0; step < 2000; ++step) {
        const std::string& key = pool[pick(rng)];

        if (key == "resize") {
            state = navigator->reduce(state, ResizeEvent{heights(rng)});
        } else if (key == keys::Escape || key == keys::Enter) {
            auto entry = state.cursorEntry();
            bool goes_up = key == keys::Escape || (entry && entry->isSelf());
            if (goes_up && state.m_root == work) {
                continue;
            }
            state = press(state, key);
        } else {
            state = press(state, key);
        }

        expectInvariants(state);
        ASSERT_EQ(state.m_root.compare(0, work.size(), work), 0);
    }
}

// ============================================================================
// TERMINAL INPUT
// ============================================================================

TEST_F(NavigatorTest, ControlInputLabels) {
    EXPECT_EQ(labelForControlInput("\x01"), keys::CtrlA);
    EXPECT_EQ(labelForControlInput("\x03"), keys::CtrlC);
    EXPECT_EQ(labelForControlInput("\x0E"), keys::CtrlN);
    EXPECT_EQ(labelForControlInput("\x1B\x7F"), keys::AltBackspace);
    EXPECT_EQ(labelForControlInput("\x08"), keys::Backspace);
    EXPECT_EQ(labelForControlInput("a"), std::nullopt);
    EXPECT_EQ(labelForControlInput("\x1B"), std::nullopt);
}

/**
 * @test CaretHEditsFilter
 * @brief A terminal sending ^H for Backspace edits the filter instead of
 *        opening the delete prompt
 */
TEST_F(NavigatorTest, CaretHEditsFilter) {
    auto state = press(type(navigator->start(work), "alp"), keys::Down);
    auto label = labelForControlInput("\x08");
    ASSERT_TRUE(label.has_value());

    state = press(state, *label);
    EXPECT_TRUE(state.isIn<Browsing>());
    EXPECT_EQ(state.m_filter, "al");
    EXPECT_TRUE(std::filesystem::exists(work + "/alpha"));
}
