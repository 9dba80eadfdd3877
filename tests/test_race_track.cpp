// tests/test_race_track.cpp
#include <doctest/doctest.h>

#include "TestTracks.h"
#include "racetrack/track/Errors.h"
#include "racetrack/track/RaceTrack.h"

#include <set>
#include <stdexcept>

using racetrack::track::BlankTrack;
using racetrack::track::BoundsError;
using racetrack::track::CanvasSize;
using racetrack::track::Cell;
using racetrack::track::ColorLayer;
using racetrack::track::FlagLayer;
using racetrack::track::RaceTrack;
using racetrack::track::Shape;
using racetrack::track::ShapeMismatchError;
using racetrack::track::WallLayer;

TEST_CASE("Blank track puts spawn top-left and target bottom-right") {
    const auto track = racetrack::test::StandardBlank();
    CHECK(track.shape() == Shape{15, 10});
    CHECK(track.target() == Cell{14, 9});
    CHECK(track.spawn() == Cell{0, 0});
    CHECK(track.findWalls().empty());
    CHECK(track.findButtons().empty());
    CHECK(track.findTraversableCells().size() == 150);
    CHECK(track.canvasSize() == CanvasSize{600, 900});
}

TEST_CASE("Active wall is found and blocks traversal") {
    auto track = racetrack::test::StandardBlank();
    track.placeWall({2, 3}, 1, true);

    CHECK(track.findWalls(1) == std::set<Cell>{{2, 3}});
    CHECK(track.findTraversableCells().count(Cell{2, 3}) == 0);
    CHECK(track.findTraversableCells().size() == 149);
}

TEST_CASE("Toggling a color opens its walls") {
    auto track = racetrack::test::StandardBlank();
    track.placeWall({2, 3}, 1, true);
    track.toggle(1);

    CHECK(track.findTraversableCells().count(Cell{2, 3}) == 1);
    CHECK(track.findWalls(1, false) == std::set<Cell>{{2, 3}});
    CHECK(track.findWalls(1, true).empty());

    track.toggle(1);
    CHECK(track.findTraversableCells().count(Cell{2, 3}) == 0);
}

TEST_CASE("Toggle inverts exactly the walls of one color") {
    auto track = racetrack::test::DecoratedTrack();
    const RaceTrack before = track;
    const auto red = track.findWalls(2);
    REQUIRE(red.size() == 2);

    track.toggle(2);

    for (int row = 0; row < track.rows(); ++row) {
        for (int col = 0; col < track.cols(); ++col) {
            const Cell cell{row, col};
            if (red.count(cell) != 0) {
                CHECK(track.isActive(cell) != before.isActive(cell));
            } else {
                CHECK(track.isActive(cell) == before.isActive(cell));
            }
            CHECK(track.hasWall(cell) == before.hasWall(cell));
            CHECK(track.colorAt(cell) == before.colorAt(cell));
        }
    }
}

TEST_CASE("Toggling an unused color changes nothing") {
    auto track = racetrack::test::DecoratedTrack();
    const RaceTrack before = track;
    track.toggle(6);
    CHECK(track == before);
}

TEST_CASE("Traversable cells cover buttons and empty cells, never active walls") {
    const auto track = racetrack::test::DecoratedTrack();
    const auto open = track.findTraversableCells();

    for (const Cell& button : track.findButtons()) {
        CHECK(open.count(button) == 1);
    }
    for (int row = 0; row < track.rows(); ++row) {
        for (int col = 0; col < track.cols(); ++col) {
            const Cell cell{row, col};
            const bool blocking = track.hasWall(cell) && track.isActive(cell);
            CHECK((open.count(cell) == 0) == blocking);
        }
    }
    CHECK(open.count(Cell{3, 4}) == 1);
}

TEST_CASE("Wall and button queries honour their filters") {
    const auto track = racetrack::test::DecoratedTrack();

    CHECK(track.findWalls().size() == 4);
    CHECK(track.findWalls(2) == std::set<Cell>{{2, 4}, {3, 4}});
    CHECK(track.findWalls(std::nullopt, false) == std::set<Cell>{{3, 4}});
    CHECK(track.findWalls(2, true) == std::set<Cell>{{2, 4}});
    CHECK(track.findWalls(3).empty());

    CHECK(track.findButtons() == std::set<Cell>{{5, 5}, {9, 8}});
    CHECK(track.findButtons(5) == std::set<Cell>{{9, 8}});
    CHECK(track.findButtons(1).empty());
}

TEST_CASE("Layers of different shapes are rejected") {
    SUBCASE("active narrower than walls") {
        CHECK_THROWS_AS(RaceTrack(WallLayer{5, 5}, FlagLayer{5, 4, 1}, FlagLayer{5, 5}, ColorLayer{5, 5},
                                  Cell{4, 4}, Cell{0, 0}, CanvasSize{100, 100}),
                        ShapeMismatchError);
    }
    SUBCASE("colors taller than walls") {
        CHECK_THROWS_AS(RaceTrack(WallLayer{5, 5}, FlagLayer{5, 5, 1}, FlagLayer{5, 5}, ColorLayer{6, 5},
                                  Cell{4, 4}, Cell{0, 0}, CanvasSize{100, 100}),
                        ShapeMismatchError);
    }
    SUBCASE("shape errors are invalid arguments") {
        CHECK_THROWS_AS(RaceTrack(WallLayer{2, 2}, FlagLayer{2, 2, 1}, FlagLayer{3, 2}, ColorLayer{2, 2},
                                  Cell{1, 1}, Cell{0, 0}, CanvasSize{100, 100}),
                        std::invalid_argument);
    }
}

TEST_CASE("Grids larger than the dimension limit are rejected") {
    using racetrack::track::kMaxGridDimension;
    CHECK_NOTHROW(BlankTrack(Shape{kMaxGridDimension, 1}, CanvasSize{10, 40960}));
    CHECK_THROWS_AS(BlankTrack(Shape{kMaxGridDimension + 1, 1}, CanvasSize{10, 40970}), BoundsError);
    CHECK_THROWS_AS(BlankTrack(Shape{1, kMaxGridDimension + 1}, CanvasSize{40970, 10}), BoundsError);
}

TEST_CASE("Construction rejects points outside the grid") {
    CHECK_THROWS_AS(RaceTrack(WallLayer{3, 3}, FlagLayer{3, 3, 1}, FlagLayer{3, 3}, ColorLayer{3, 3},
                              Cell{3, 0}, Cell{0, 0}, CanvasSize{90, 90}),
                    BoundsError);
    CHECK_THROWS_AS(RaceTrack(WallLayer{3, 3}, FlagLayer{3, 3, 1}, FlagLayer{3, 3}, ColorLayer{3, 3},
                              Cell{2, 2}, Cell{0, -1}, CanvasSize{90, 90}),
                    BoundsError);
    CHECK_THROWS_AS(BlankTrack(Shape{3, 3}, CanvasSize{0, 90}), BoundsError);
}

TEST_CASE("Pixel coordinates map to cells by truncation") {
    const auto track = racetrack::test::StandardBlank();
    CHECK(track.gridCoordFromPixel(0.0F, 0.0F) == Cell{0, 0});
    CHECK(track.gridCoordFromPixel(59.9F, 59.9F) == Cell{0, 0});
    CHECK(track.gridCoordFromPixel(60.0F, 125.0F) == Cell{2, 1});
    CHECK(track.gridCoordFromPixel(210.0F, 150.0F) == Cell{2, 3});
    CHECK(track.gridCoordFromPixel(599.0F, 899.0F) == Cell{14, 9});

    CHECK_THROWS_AS(track.gridCoordFromPixel(600.0F, 10.0F), BoundsError);
    CHECK_THROWS_AS(track.gridCoordFromPixel(10.0F, 900.0F), BoundsError);
    CHECK_THROWS_AS(track.gridCoordFromPixel(-1.0F, 10.0F), BoundsError);
}

TEST_CASE("Typed edits keep walls and buttons exclusive") {
    auto track = racetrack::test::StandardBlank();

    track.placeWall({4, 4}, 3, true);
    track.placeButton({4, 4}, 5);
    CHECK_FALSE(track.hasWall({4, 4}));
    CHECK(track.isButton({4, 4}));
    CHECK(track.colorAt({4, 4}) == 5);

    track.placeWall({4, 4}, 2, false);
    CHECK(track.hasWall({4, 4}));
    CHECK_FALSE(track.isButton({4, 4}));
    CHECK_FALSE(track.isActive({4, 4}));
    CHECK(track.colorAt({4, 4}) == 2);
}

TEST_CASE("Color zero erases walls and buttons") {
    auto track = racetrack::test::StandardBlank();
    track.placeWall({1, 1}, 4, true);
    track.placeWall({1, 1}, 0, true);
    CHECK_FALSE(track.hasWall({1, 1}));
    CHECK(track.colorAt({1, 1}) == 0);

    track.placeButton({2, 2}, 4);
    track.placeButton({2, 2}, 0);
    CHECK_FALSE(track.isButton({2, 2}));
    CHECK(track.findButtons().empty());
}

TEST_CASE("Placing target or spawn clears the cell") {
    auto track = racetrack::test::StandardBlank();
    track.placeWall({6, 6}, 2, true);
    track.placeButton({7, 7}, 3);

    track.placeTarget({6, 6});
    track.placeSpawn({7, 7});

    CHECK(track.target() == Cell{6, 6});
    CHECK(track.spawn() == Cell{7, 7});
    CHECK_FALSE(track.hasWall({6, 6}));
    CHECK_FALSE(track.isButton({7, 7}));
    CHECK(track.colorAt({6, 6}) == 0);
    CHECK(track.colorAt({7, 7}) == 0);
}

TEST_CASE("Edits outside the grid raise BoundsError") {
    auto track = racetrack::test::StandardBlank();
    const RaceTrack before = track;
    CHECK_THROWS_AS(track.placeWall({15, 0}, 1, true), BoundsError);
    CHECK_THROWS_AS(track.placeButton({0, 10}, 1), BoundsError);
    CHECK_THROWS_AS(track.placeTarget({-1, 0}), BoundsError);
    CHECK_THROWS_AS(track.placeSpawn({0, -1}), BoundsError);
    CHECK_THROWS_AS(static_cast<void>(track.hasWall({20, 20})), std::out_of_range);
    CHECK(track == before);
}

TEST_CASE("Every mutation bumps the revision") {
    auto track = racetrack::test::StandardBlank();
    auto last = track.revision();
    const auto bumped = [&]() {
        const bool changed = track.revision() > last;
        last = track.revision();
        return changed;
    };

    track.placeWall({0, 1}, 1, true);
    CHECK(bumped());
    track.toggle(1);
    CHECK(bumped());
    track.placeButton({0, 2}, 1);
    CHECK(bumped());
    track.placeTarget({5, 5});
    CHECK(bumped());
    track.placeSpawn({6, 6});
    CHECK(bumped());
    track.setCanvasSize({300, 450});
    CHECK(bumped());

    static_cast<void>(track.findWalls());
    static_cast<void>(track.findTraversableCells());
    CHECK_FALSE(bumped());
}

TEST_CASE("Layer bounds are checked") {
    racetrack::track::Layer<int> layer{2, 3, 7};
    CHECK(layer.rows() == 2);
    CHECK(layer.cols() == 3);
    CHECK(layer.at(1, 2) == 7);
    layer.at(1, 2) = 9;
    CHECK(layer.at(Cell{1, 2}) == 9);
    CHECK_THROWS_AS(layer.at(2, 0), BoundsError);
    CHECK_THROWS_AS(layer.at(0, 3), BoundsError);
    CHECK_THROWS_AS(racetrack::track::Layer<int>(-1, 2), std::invalid_argument);
}
