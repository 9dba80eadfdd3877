// tests/test_track_editor.cpp
#include <doctest/doctest.h>

#include "TestTracks.h"
#include "racetrack/editor/TrackEditor.h"
#include "racetrack/track/TrackFile.h"

#include <filesystem>
#include <fstream>
#include <set>

using racetrack::editor::BrushKind;
using racetrack::editor::TrackEditor;
using racetrack::input::InputState;
using racetrack::track::Cell;

namespace {

// Canvas is 600x900 with 60px cells; these return the centre of a cell.
int cellX(int col) { return col * 60 + 30; }
int cellY(int row) { return row * 60 + 30; }

InputState press(int x, int y) {
    InputState state{};
    state.mouseX = x;
    state.mouseY = y;
    state.pointerPressed = true;
    return state;
}

InputState hold(int x, int y) {
    InputState state{};
    state.mouseX = x;
    state.mouseY = y;
    return state;
}

InputState release(int x, int y) {
    InputState state = hold(x, y);
    state.pointerReleased = true;
    return state;
}

TrackEditor makeEditor(const std::filesystem::path& savePath = "unused.rtrk") {
    return TrackEditor{racetrack::test::StandardBlank(), savePath, 8};
}

void selectKind(TrackEditor& editor, BrushKind kind) {
    const auto& button = editor.palette().kindButtons()[static_cast<std::size_t>(kind)];
    const int x = static_cast<int>(button.x + button.width / 2.0F);
    const int y = static_cast<int>(button.y + button.height / 2.0F);
    editor.handleInput(press(x, y));
    editor.handleInput(release(x, y));
}

void selectColor(TrackEditor& editor, int color) {
    const auto& button = editor.palette().colorButtons()[static_cast<std::size_t>(color)];
    const int x = static_cast<int>(button.x + button.width / 2.0F);
    const int y = static_cast<int>(button.y + button.height / 2.0F);
    editor.handleInput(press(x, y));
    editor.handleInput(release(x, y));
}

void click(TrackEditor& editor, Cell cell) {
    editor.handleInput(press(cellX(cell.col), cellY(cell.row)));
    editor.handleInput(release(cellX(cell.col), cellY(cell.row)));
}

} // namespace

TEST_CASE("Editor starts with a black wall brush of radius one") {
    const auto editor = makeEditor();
    CHECK(editor.selectedColor() == 1);
    CHECK(editor.selectedKind() == BrushKind::Wall);
    CHECK(editor.brushRadius() == 1);
    CHECK_FALSE(editor.painting());
}

TEST_CASE("Clicking the canvas paints an active wall") {
    auto editor = makeEditor();
    click(editor, {2, 3});
    CHECK(editor.track().findWalls(1, true) == std::set<Cell>{{2, 3}});
    CHECK_FALSE(editor.painting());
}

TEST_CASE("Holding the modifier paints inactive walls") {
    auto editor = makeEditor();
    InputState state = press(cellX(3), cellY(2));
    state.placeInactive = true;
    editor.handleInput(state);
    CHECK(editor.track().findWalls(1, false) == std::set<Cell>{{2, 3}});
    CHECK(editor.track().findTraversableCells().count(Cell{2, 3}) == 1);
}

TEST_CASE("Dragging paints every cell under the pointer") {
    auto editor = makeEditor();
    editor.handleInput(press(cellX(1), cellY(4)));
    editor.handleInput(hold(cellX(2), cellY(4)));
    editor.handleInput(hold(cellX(3), cellY(4)));
    editor.handleInput(release(cellX(3), cellY(4)));
    editor.handleInput(hold(cellX(5), cellY(4)));

    CHECK(editor.track().findWalls() == std::set<Cell>{{4, 1}, {4, 2}, {4, 3}});
}

TEST_CASE("Brush covers a square neighbourhood clipped to the grid") {
    auto editor = makeEditor();
    InputState grow{};
    grow.brushGrow = true;
    editor.handleInput(grow);
    REQUIRE(editor.brushRadius() == 2);

    click(editor, {5, 5});
    CHECK(editor.track().findWalls().size() == 9);
    CHECK(editor.track().findWalls().count(Cell{4, 4}) == 1);
    CHECK(editor.track().findWalls().count(Cell{6, 6}) == 1);

    click(editor, {0, 9});
    CHECK(editor.track().findWalls().size() == 13);
}

TEST_CASE("Brush radius never drops below one") {
    auto editor = makeEditor();
    InputState shrink{};
    shrink.brushShrink = true;
    editor.handleInput(shrink);
    editor.handleInput(shrink);
    CHECK(editor.brushRadius() == 1);
}

TEST_CASE("A cell is edited once per stroke") {
    auto editor = makeEditor();
    editor.handleInput(press(cellX(3), cellY(2)));
    editor.track().toggle(1);
    editor.handleInput(hold(cellX(3) + 5, cellY(2)));
    CHECK(editor.track().findWalls(1, false) == std::set<Cell>{{2, 3}});
    editor.handleInput(release(cellX(3), cellY(2)));

    click(editor, {2, 3});
    CHECK(editor.track().findWalls(1, true) == std::set<Cell>{{2, 3}});
}

TEST_CASE("Pointer outside the canvas leaves the track alone") {
    auto editor = makeEditor();
    const auto revision = editor.track().revision();
    editor.handleInput(press(650, 890));
    editor.handleInput(hold(-5, 40));
    editor.handleInput(release(300, 950));
    CHECK(editor.track().revision() == revision);
}

TEST_CASE("Sidebar clicks select color and kind without painting") {
    auto editor = makeEditor();
    const auto revision = editor.track().revision();

    selectColor(editor, 3);
    CHECK(editor.selectedColor() == 3);
    selectKind(editor, BrushKind::Button);
    CHECK(editor.selectedKind() == BrushKind::Button);
    CHECK(editor.track().revision() == revision);

    click(editor, {6, 2});
    CHECK(editor.track().findButtons(3) == std::set<Cell>{{6, 2}});
}

TEST_CASE("Each brush kind applies its edit") {
    auto editor = makeEditor();
    click(editor, {3, 3});

    SUBCASE("button replaces wall") {
        selectKind(editor, BrushKind::Button);
        click(editor, {3, 3});
        CHECK_FALSE(editor.track().hasWall({3, 3}));
        CHECK(editor.track().isButton({3, 3}));
    }
    SUBCASE("target moves onto a cleared cell") {
        selectKind(editor, BrushKind::Target);
        click(editor, {3, 3});
        CHECK(editor.track().target() == Cell{3, 3});
        CHECK_FALSE(editor.track().hasWall({3, 3}));
    }
    SUBCASE("spawn moves onto a cleared cell") {
        selectKind(editor, BrushKind::Spawn);
        click(editor, {3, 3});
        CHECK(editor.track().spawn() == Cell{3, 3});
        CHECK(editor.track().findWalls().empty());
    }
    SUBCASE("color zero erases") {
        selectColor(editor, 0);
        click(editor, {3, 3});
        CHECK(editor.track().findWalls().empty());
    }
}

TEST_CASE("Return saves the track to the configured path") {
    racetrack::test::ScratchDir dir{"editor_save"};
    const auto path = dir.path() / "tracks" / "mine.rtrk";
    auto editor = makeEditor(path);
    click(editor, {2, 3});

    InputState save{};
    save.saveRequested = true;
    editor.handleInput(save);

    REQUIRE(std::filesystem::exists(path));
    CHECK(racetrack::track::LoadTrack(path) == editor.track());
}

TEST_CASE("Save failure is reported and the session keeps its track") {
    racetrack::test::ScratchDir dir{"editor_save_fail"};
    const auto blocker = dir.path() / "blocker";
    {
        std::ofstream out(blocker);
        out << "x";
    }
    auto editor = makeEditor(blocker / "mine.rtrk");
    click(editor, {2, 3});
    const auto before = editor.track();

    CHECK_FALSE(editor.save());
    CHECK(editor.track() == before);
}

TEST_CASE("Sidebar HUD mirrors the current selection") {
    auto editor = makeEditor();
    selectColor(editor, 4);
    selectKind(editor, BrushKind::Spawn);

    racetrack::rendering::SidebarHud hud{};
    editor.fillHud(hud);
    REQUIRE(hud.swatches.size() == 8);
    REQUIRE(hud.tools.size() == 4);
    CHECK(hud.swatches[4].selected);
    CHECK_FALSE(hud.swatches[1].selected);
    CHECK(hud.swatches[4].color == racetrack::rendering::PaletteColor(4));
    CHECK(hud.tools[3].icon == racetrack::rendering::ToolIcon::Spawn);
    CHECK(hud.tools[3].selected);
    CHECK_FALSE(hud.tools[0].selected);
    CHECK(hud.brushRadius == 1);
}
