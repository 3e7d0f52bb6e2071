#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <vector>

#include "timegrid/gesture/TrackGestureController.hpp"

using namespace timegrid;

namespace {
TempoContext defaultTempo() {
    return TempoContext(120.0, TimeSignature{4, 4}, 200.0);
}

TrackGeometry makeTrack(TrackId id, double positionTicks) {
    TrackGeometry track;
    track.id = id;
    track.type = TrackType::Midi;
    track.positionTicks = {positionTicks, 0.0};
    track.contentExtent = 1920.0;
    track.originalDurationTicks = 1920.0;
    return track;
}

class RecordingListener : public TrackGestureListener {
  public:
    void trackDragUpdated(TrackId, const PixelPoint& position) override {
        dragUpdates.push_back(position);
    }
    void trackMoveCommitted(const DragResult& result) override {
        moves.push_back(result);
    }
    void trackResizeUpdated(TrackId, const ResizeUpdate& update) override {
        resizeUpdates.push_back(update);
    }
    void trackResizeCommitted(const ResizeResult& result) override {
        resizes.push_back(result);
    }
    void trackGestureDiscarded(TrackId trackId) override {
        discarded.push_back(trackId);
    }

    std::vector<PixelPoint> dragUpdates;
    std::vector<DragResult> moves;
    std::vector<ResizeUpdate> resizeUpdates;
    std::vector<ResizeResult> resizes;
    std::vector<TrackId> discarded;
};

// Unregisters itself on the first commit it sees
class OneShotListener : public TrackGestureListener {
  public:
    explicit OneShotListener(TrackGestureController& c) : controller(c) {}

    void trackMoveCommitted(const DragResult&) override {
        ++calls;
        controller.removeListener(this);
    }
    void trackResizeCommitted(const ResizeResult&) override {
        ++calls;
        controller.removeListener(this);
    }

    TrackGestureController& controller;
    int calls = 0;
};
}  // namespace

// ============================================================================
// Drag
// ============================================================================

TEST_CASE("TrackGestureController - drag lifecycle", "[controller][drag]") {
    TrackGestureController controller(80.0, 1);
    RecordingListener listener;
    controller.addListener(&listener);

    auto track = makeTrack(1, 960.0);  // 100 px
    controller.beginDrag(track, {100.0, 0.0}, defaultTempo());
    REQUIRE(controller.isDragging(1));

    auto position = controller.dragTo(1, {137.0, 5.0}, defaultTempo());
    REQUIRE(position.x == 137.5);
    REQUIRE(listener.dragUpdates.size() == 1);

    auto result = controller.endDrag(1, defaultTempo());
    REQUIRE(result.moved);
    REQUIRE(result.positionTicks.x == Catch::Approx(1320.0));
    REQUIRE_FALSE(controller.isDragging(1));
    REQUIRE(listener.moves.size() == 1);
    REQUIRE(listener.moves[0].trackId == 1);

    controller.removeListener(&listener);
}

TEST_CASE("TrackGestureController - release in place sends no commit", "[controller][noop]") {
    TrackGestureController controller(80.0, 1);
    RecordingListener listener;
    controller.addListener(&listener);

    auto track = makeTrack(1, 1000.0);
    controller.beginDrag(track, {50.0, 10.0}, defaultTempo());
    auto result = controller.endDrag(1, defaultTempo());

    REQUIRE_FALSE(result.moved);
    REQUIRE(result.positionTicks.x == 1000.0);
    REQUIRE(listener.moves.empty());

    controller.removeListener(&listener);
}

TEST_CASE("TrackGestureController - one gesture of each kind per track", "[controller][errors]") {
    TrackGestureController controller(80.0, 1);
    auto track = makeTrack(1, 0.0);

    controller.beginDrag(track, {0.0, 0.0}, defaultTempo());
    REQUIRE_THROWS_AS(controller.beginDrag(track, {0.0, 0.0}, defaultTempo()), std::logic_error);

    // A resize may run alongside the drag
    REQUIRE(controller.beginResize(track, ResizeEdge::Right, 200.0, defaultTempo()));
    REQUIRE_THROWS_AS(controller.beginResize(track, ResizeEdge::Left, 0.0, defaultTempo()),
                      std::logic_error);
    REQUIRE(controller.getNumActiveGestures() == 2);

    REQUIRE_THROWS_AS(controller.dragTo(2, {0.0, 0.0}, defaultTempo()), std::logic_error);
    REQUIRE_THROWS_AS(controller.endResize(2), std::logic_error);
}

TEST_CASE("TrackGestureController - tracks are independent", "[controller]") {
    TrackGestureController controller(80.0, 1);
    auto first = makeTrack(1, 0.0);
    auto second = makeTrack(2, 1920.0);  // 200 px

    controller.beginDrag(first, {0.0, 0.0}, defaultTempo());
    controller.beginDrag(second, {200.0, 0.0}, defaultTempo());

    controller.dragTo(1, {50.0, 0.0}, defaultTempo());
    controller.dragTo(2, {175.0, 80.0}, defaultTempo());

    auto secondResult = controller.endDrag(2, defaultTempo());
    REQUIRE(secondResult.positionTicks.x == Catch::Approx(1680.0));
    REQUIRE(secondResult.laneIndex == 1);

    REQUIRE(controller.isDragging(1));
    auto firstResult = controller.endDrag(1, defaultTempo());
    REQUIRE(firstResult.positionTicks.x == Catch::Approx(480.0));
    REQUIRE(firstResult.laneIndex == 0);
}

// ============================================================================
// Resize
// ============================================================================

TEST_CASE("TrackGestureController - resize lifecycle", "[controller][resize]") {
    TrackGestureController controller(80.0, 1);
    RecordingListener listener;
    controller.addListener(&listener);

    auto track = makeTrack(3, 0.0);
    REQUIRE(controller.beginResize(track, ResizeEdge::Left, 0.0, defaultTempo()));

    auto update = controller.resizeTo(3, 50.0, defaultTempo());
    REQUIRE(update.positionPixel == 50.0);
    REQUIRE(update.widthPixel == 150.0);
    REQUIRE(listener.resizeUpdates.size() == 1);

    auto result = controller.endResize(3);
    REQUIRE(result.deltaPixels == 50.0);
    REQUIRE(listener.resizes.size() == 1);
    REQUIRE_FALSE(controller.isResizing(3));

    SECTION("Unmoved resize sends no commit") {
        controller.beginResize(3, ResizeEdge::Right, 200.0, 0.0, 200.0, 0.0);
        REQUIRE(controller.endResize(3).deltaPixels == 0.0);
        REQUIRE(listener.resizes.size() == 1);
    }

    controller.removeListener(&listener);
}

TEST_CASE("TrackGestureController - resize suppressed without content", "[controller][edge]") {
    TrackGestureController controller(80.0, 1);

    TrackGeometry empty;
    empty.id = 5;
    empty.type = TrackType::Drum;

    REQUIRE_FALSE(controller.beginResize(empty, ResizeEdge::Right, 0.0, defaultTempo()));
    REQUIRE_FALSE(controller.isResizing(5));
}

TEST_CASE("TrackGestureController - resize honours the minimum width", "[controller][min]") {
    TrackGestureController controller(80.0, 2);
    auto track = makeTrack(1, 0.0);

    controller.beginResize(track, ResizeEdge::Right, 200.0, defaultTempo());
    REQUIRE(controller.resizeTo(1, -300.0, defaultTempo()).widthPixel == 25.0);
}

// ============================================================================
// Discarding
// ============================================================================

TEST_CASE("TrackGestureController - discard drops sessions without commit",
          "[controller][discard]") {
    TrackGestureController controller(80.0, 1);
    RecordingListener listener;
    controller.addListener(&listener);

    auto first = makeTrack(1, 0.0);
    auto second = makeTrack(2, 0.0);
    controller.beginDrag(first, {0.0, 0.0}, defaultTempo());
    controller.beginResize(first, ResizeEdge::Right, 200.0, defaultTempo());
    controller.beginResize(second, ResizeEdge::Left, 0.0, defaultTempo());

    controller.discardGestures(1);
    REQUIRE_FALSE(controller.isDragging(1));
    REQUIRE_FALSE(controller.isResizing(1));
    REQUIRE(controller.isResizing(2));
    REQUIRE(listener.discarded == std::vector<TrackId>{1});

    controller.discardGestures(1);
    REQUIRE(listener.discarded.size() == 1);

    controller.discardAll();
    REQUIRE(controller.getNumActiveGestures() == 0);
    REQUIRE(listener.discarded == std::vector<TrackId>{1, 2});
    REQUIRE(listener.moves.empty());
    REQUIRE(listener.resizes.empty());

    controller.removeListener(&listener);
}

// ============================================================================
// Listeners
// ============================================================================

TEST_CASE("TrackGestureController - listener management", "[controller][listeners]") {
    TrackGestureController controller(80.0, 1);
    RecordingListener listener;
    OneShotListener oneShot(controller);

    // Duplicates and null are ignored
    controller.addListener(&listener);
    controller.addListener(&listener);
    controller.addListener(nullptr);
    controller.addListener(&oneShot);

    auto track = makeTrack(1, 0.0);
    for (int i = 0; i < 2; ++i) {
        controller.beginDrag(track, {0.0, 0.0}, defaultTempo());
        controller.dragTo(1, {100.0, 0.0}, defaultTempo());
        controller.endDrag(1, defaultTempo());
    }

    REQUIRE(listener.moves.size() == 2);
    REQUIRE(oneShot.calls == 1);

    controller.removeListener(&listener);
    controller.beginDrag(track, {0.0, 0.0}, defaultTempo());
    controller.dragTo(1, {100.0, 0.0}, defaultTempo());
    controller.endDrag(1, defaultTempo());
    REQUIRE(listener.moves.size() == 2);
}

TEST_CASE("TrackGestureController - invalid construction", "[controller][errors]") {
    REQUIRE_THROWS_AS(TrackGestureController(0.0, 1), std::invalid_argument);
    REQUIRE_THROWS_AS(TrackGestureController(80.0, 0), std::invalid_argument);
}
