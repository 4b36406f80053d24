#include "interaction_engine.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

using namespace annot;

namespace {

// 200x100 image at the top-left of the canvas, 1x zoom.
class InteractionEngineTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        engine.setImageSize(QSizeF(200, 100));
        engine.attach(&set);
    }

    // normalized (0.1,0.1,0.2,0.2) -> display (20,10,40,20)
    BoxId addSampleBox(ClassLabel label = ClassLabel::Good)
    {
        return set.append(QRectF(0.1, 0.1, 0.2, 0.2), label);
    }

    AnnotationSet     set;
    InteractionEngine engine;
};

} // namespace

TEST_F(InteractionEngineTest, DrawingCreatesBoxWithDefaultClass)
{
    int changes = 0;
    QObject::connect(&engine, &InteractionEngine::annotationsChanged, [&]{ ++changes; });

    ASSERT_EQ(engine.pointerDown(QPointF(10, 10)), Status::Ok);
    EXPECT_TRUE(std::holds_alternative<DrawingState>(engine.mode()));
    ASSERT_EQ(engine.pointerMove(QPointF(40, 30)), Status::Ok);
    ASSERT_EQ(engine.pointerUp(QPointF(60, 40)), Status::Ok);

    EXPECT_TRUE(engine.isIdle());
    ASSERT_EQ(set.size(), 1);
    const Box& b = set.boxes().first();
    EXPECT_EQ(b.label, ClassLabel::Good);
    EXPECT_TRUE(RectNear(b.rect(), QRectF(0.05, 0.1, 0.25, 0.3)));
    EXPECT_TRUE(set.isModified());
    EXPECT_EQ(changes, 1);
}

TEST_F(InteractionEngineTest, DefaultClassIsUsedForNewBoxes)
{
    engine.setDefaultClass(ClassLabel::Bad);
    engine.pointerDown(QPointF(10, 10));
    ASSERT_EQ(engine.pointerUp(QPointF(60, 40)), Status::Ok);
    EXPECT_EQ(set.boxes().first().label, ClassLabel::Bad);
}

TEST_F(InteractionEngineTest, RubberBandOnlyWhileDrawing)
{
    EXPECT_FALSE(engine.rubberBand().has_value());
    engine.pointerDown(QPointF(60, 40));
    engine.pointerMove(QPointF(10, 10));

    const auto band = engine.rubberBand();
    ASSERT_TRUE(band.has_value());
    EXPECT_TRUE(RectNear(*band, QRectF(10, 10, 50, 30)));

    engine.pointerUp(QPointF(10, 10));
    EXPECT_FALSE(engine.rubberBand().has_value());
}

TEST_F(InteractionEngineTest, DrawingBackwardsGivesSameBox)
{
    engine.pointerDown(QPointF(60, 40));
    ASSERT_EQ(engine.pointerUp(QPointF(10, 10)), Status::Ok);
    EXPECT_TRUE(RectNear(set.boxes().first().rect(), QRectF(0.05, 0.1, 0.25, 0.3)));
}

TEST_F(InteractionEngineTest, TinyDragIsDiscarded)
{
    engine.pointerDown(QPointF(10, 10));
    EXPECT_EQ(engine.pointerUp(QPointF(11, 11)), Status::DegenerateBox);
    EXPECT_TRUE(engine.isIdle());
    EXPECT_TRUE(set.isEmpty());
    EXPECT_FALSE(set.isModified());
}

TEST_F(InteractionEngineTest, DrawingOutsideImageIsClamped)
{
    engine.pointerDown(QPointF(-20, -20));
    ASSERT_EQ(engine.pointerUp(QPointF(40, 40)), Status::Ok);
    EXPECT_TRUE(RectNear(set.boxes().first().rect(), QRectF(0, 0, 0.2, 0.4)));
}

TEST_F(InteractionEngineTest, DragInsideBoxMovesIt)
{
    const BoxId id = addSampleBox();

    ASSERT_EQ(engine.pointerDown(QPointF(30, 15)), Status::Ok);
    const auto* mv = std::get_if<MovingState>(&engine.mode());
    ASSERT_NE(mv, nullptr);
    EXPECT_EQ(mv->box, id);
    EXPECT_EQ(set.selected(), id);

    ASSERT_EQ(engine.pointerMove(QPointF(50, 25)), Status::Ok);
    EXPECT_TRUE(RectNear(set.find(id)->rect(), QRectF(0.2, 0.2, 0.2, 0.2)));

    engine.pointerUp(QPointF(50, 25));
    EXPECT_TRUE(engine.isIdle());
    EXPECT_EQ(set.size(), 1);
    EXPECT_TRUE(set.isModified());
}

TEST_F(InteractionEngineTest, MoveStopsAtImageBorderKeepingSize)
{
    const BoxId id = addSampleBox();
    engine.pointerDown(QPointF(30, 15));
    engine.pointerMove(QPointF(500, 500));

    EXPECT_TRUE(RectNear(set.find(id)->rect(), QRectF(0.8, 0.8, 0.2, 0.2)));
    engine.pointerUp(QPointF(500, 500));
}

TEST_F(InteractionEngineTest, CornerResizesOnlyWithHandlesEnabled)
{
    const BoxId id = addSampleBox();

    // handles off: the corner is just part of the box body
    engine.pointerDown(QPointF(60, 30));
    EXPECT_TRUE(std::holds_alternative<MovingState>(engine.mode()));
    engine.pointerUp(QPointF(60, 30));

    engine.setResizeHandlesEnabled(true);
    engine.pointerMove(QPointF(58, 28));
    ASSERT_EQ(engine.pointerDown(QPointF(60, 30)), Status::Ok);
    const auto* rs = std::get_if<ResizingState>(&engine.mode());
    ASSERT_NE(rs, nullptr);
    EXPECT_EQ(rs->box, id);
    EXPECT_EQ(rs->corner, Corner::BottomRight);
    EXPECT_EQ(rs->pinned, QPointF(20, 10));

    ASSERT_EQ(engine.pointerMove(QPointF(100, 50)), Status::Ok);
    EXPECT_TRUE(RectNear(set.find(id)->rect(), QRectF(0.1, 0.1, 0.4, 0.4)));
    engine.pointerUp(QPointF(100, 50));
}

TEST_F(InteractionEngineTest, HandleOutsideBoxBodyKeepsHover)
{
    const BoxId id = addSampleBox();
    engine.setResizeHandlesEnabled(true);

    // inside the handle square, outside the box, nothing hovered yet
    engine.pointerDown(QPointF(64, 34));
    EXPECT_TRUE(std::holds_alternative<DrawingState>(engine.mode()));
    engine.cancelInteraction();

    // coming from inside the box, the hover survives onto the handle
    engine.pointerMove(QPointF(58, 28));
    engine.pointerMove(QPointF(64, 34));
    ASSERT_EQ(set.hovered(), id);
    engine.pointerDown(QPointF(64, 34));
    const auto* rs = std::get_if<ResizingState>(&engine.mode());
    ASSERT_NE(rs, nullptr);
    EXPECT_EQ(rs->box, id);

    engine.pointerUp(QPointF(64, 34));
    engine.pointerMove(QPointF(150, 80));
    EXPECT_EQ(set.hovered(), kNoBox);
}

TEST_F(InteractionEngineTest, OnlyHoveredBoxHasHandles)
{
    // older box A's bottom-right corner (100,50) lies inside newer box B
    const BoxId a = set.append(QRectF(0.1, 0.1, 0.4, 0.4), ClassLabel::Good);
    const BoxId b = set.append(QRectF(0.45, 0.4, 0.3, 0.4), ClassLabel::Bad);
    engine.setResizeHandlesEnabled(true);

    engine.pointerMove(QPointF(100, 50));
    ASSERT_EQ(set.hovered(), b);

    ASSERT_EQ(engine.pointerDown(QPointF(100, 50)), Status::Ok);
    const auto* mv = std::get_if<MovingState>(&engine.mode());
    ASSERT_NE(mv, nullptr);
    EXPECT_EQ(mv->box, b);
    engine.pointerUp(QPointF(100, 50));
    EXPECT_TRUE(RectNear(set.find(a)->rect(), QRectF(0.1, 0.1, 0.4, 0.4)));
}

TEST_F(InteractionEngineTest, ResizePastPinnedCornerFlips)
{
    const BoxId id = addSampleBox();
    engine.setResizeHandlesEnabled(true);

    engine.pointerMove(QPointF(58, 28));
    engine.pointerDown(QPointF(60, 30));
    ASSERT_EQ(engine.pointerMove(QPointF(10, 5)), Status::Ok);

    const QRectF r = set.find(id)->rect();
    EXPECT_GT(r.width(), 0.0);
    EXPECT_GT(r.height(), 0.0);
    EXPECT_TRUE(RectNear(r, QRectF(0.05, 0.05, 0.05, 0.05)));
}

TEST_F(InteractionEngineTest, ResizeNeverCollapsesBelowMinimum)
{
    const BoxId id = addSampleBox();
    engine.setResizeHandlesEnabled(true);

    engine.pointerMove(QPointF(58, 28));
    engine.pointerDown(QPointF(60, 30));
    ASSERT_EQ(engine.pointerMove(QPointF(20, 10)), Status::Ok);

    const auto d = set.displayRect(id, engine.view());
    ASSERT_TRUE(d.has_value());
    EXPECT_GE(d->width(), engine.options().minBoxSizePx - 1e-9);
    EXPECT_GE(d->height(), engine.options().minBoxSizePx - 1e-9);
}

TEST_F(InteractionEngineTest, TopmostBoxWinsOnOverlap)
{
    set.append(QRectF(0.1, 0.1, 0.3, 0.3), ClassLabel::Good);
    const BoxId top = set.append(QRectF(0.2, 0.2, 0.3, 0.3), ClassLabel::Bad);

    engine.pointerDown(QPointF(60, 30));     // inside both
    const auto* mv = std::get_if<MovingState>(&engine.mode());
    ASSERT_NE(mv, nullptr);
    EXPECT_EQ(mv->box, top);
}

TEST_F(InteractionEngineTest, HoverFollowsPointer)
{
    const BoxId id = addSampleBox();
    QList<int> hovers;
    QObject::connect(&engine, &InteractionEngine::hoverChanged, [&](int b){ hovers << b; });

    engine.pointerMove(QPointF(30, 15));
    engine.pointerMove(QPointF(31, 16));
    engine.pointerMove(QPointF(150, 80));

    EXPECT_EQ(hovers, QList<int>({id, kNoBox}));
    EXPECT_EQ(set.hovered(), kNoBox);
}

TEST_F(InteractionEngineTest, DeleteAndToggleActOnHoveredBox)
{
    EXPECT_EQ(engine.deleteHovered(), Status::NoHoveredBox);
    EXPECT_EQ(engine.toggleClassOfHovered(), Status::NoHoveredBox);

    const BoxId id = addSampleBox(ClassLabel::Good);
    engine.pointerMove(QPointF(30, 15));
    ASSERT_EQ(set.hovered(), id);

    ASSERT_EQ(engine.toggleClassOfHovered(), Status::Ok);
    EXPECT_EQ(set.find(id)->label, ClassLabel::Bad);

    ASSERT_EQ(engine.deleteHovered(), Status::Ok);
    EXPECT_TRUE(set.isEmpty());
    EXPECT_EQ(set.hovered(), kNoBox);
}

TEST_F(InteractionEngineTest, DeleteSelectedRemovesClickedBox)
{
    EXPECT_EQ(engine.deleteSelected(), Status::NoSuchBox);

    const BoxId keep = addSampleBox();
    const BoxId gone = set.append(QRectF(0.6, 0.6, 0.2, 0.2), ClassLabel::Bad);
    engine.pointerDown(QPointF(140, 70));
    engine.pointerUp(QPointF(140, 70));
    ASSERT_EQ(set.selected(), gone);

    engine.pointerMove(QPointF(300, 300));          // off the image, nothing hovered
    ASSERT_EQ(engine.deleteSelected(), Status::Ok);
    ASSERT_EQ(set.size(), 1);
    EXPECT_EQ(set.boxes().first().id, keep);
    EXPECT_EQ(set.selected(), kNoBox);
}

TEST_F(InteractionEngineTest, CommandsDuringDragAreBusy)
{
    const BoxId id = addSampleBox();
    engine.pointerMove(QPointF(30, 15));
    engine.pointerDown(QPointF(30, 15));
    ASSERT_FALSE(engine.isIdle());

    EXPECT_EQ(engine.deleteHovered(), Status::Busy);
    EXPECT_EQ(engine.toggleClassOfHovered(), Status::Busy);
    EXPECT_EQ(engine.toggleZoom(), Status::Busy);
    EXPECT_EQ(engine.requestRefresh(), Status::Busy);
    EXPECT_EQ(engine.clearAll(), Status::Busy);
    EXPECT_EQ(set.size(), 1);
    EXPECT_EQ(engine.view().zoomFactor, 1);

    // allowed: only affects the next pointer-down
    EXPECT_EQ(engine.toggleResizeHandles(), Status::Ok);
    EXPECT_TRUE(engine.resizeHandlesEnabled());
    EXPECT_TRUE(std::holds_alternative<MovingState>(engine.mode()));

    engine.pointerUp(QPointF(30, 15));
    EXPECT_NE(set.find(id), nullptr);
}

TEST_F(InteractionEngineTest, ZoomDoublesDisplayAndKeepsNormalized)
{
    const BoxId id = addSampleBox();
    engine.pointerMove(QPointF(30, 15));
    ASSERT_EQ(set.hovered(), id);

    int zoomSignal = 0;
    QObject::connect(&engine, &InteractionEngine::zoomChanged, [&](int z){ zoomSignal = z; });

    const auto before = set.displayRect(id, engine.view());
    ASSERT_EQ(engine.toggleZoom(), Status::Ok);
    EXPECT_EQ(engine.view().zoomFactor, 2);
    EXPECT_EQ(zoomSignal, 2);

    const auto after = set.displayRect(id, engine.view());
    ASSERT_TRUE(before && after);
    EXPECT_TRUE(RectNear(*before, QRectF(20, 10, 40, 20)));
    EXPECT_TRUE(RectNear(*after, QRectF(40, 20, 80, 40)));
    EXPECT_TRUE(RectNear(set.find(id)->rect(), QRectF(0.1, 0.1, 0.2, 0.2)));
    EXPECT_EQ(set.hovered(), kNoBox);
    EXPECT_FALSE(set.isModified());

    ASSERT_EQ(engine.toggleZoom(), Status::Ok);
    EXPECT_EQ(engine.view().zoomFactor, 1);
}

TEST_F(InteractionEngineTest, DrawingAtZoomTwoStoresImageRelativeBox)
{
    ASSERT_EQ(engine.setZoom(2), Status::Ok);
    engine.pointerDown(QPointF(40, 20));
    ASSERT_EQ(engine.pointerUp(QPointF(120, 60)), Status::Ok);
    EXPECT_TRUE(RectNear(set.boxes().first().rect(), QRectF(0.1, 0.1, 0.2, 0.2)));
}

TEST_F(InteractionEngineTest, ViewportOriginIsHonoured)
{
    engine.setViewportOrigin(QPointF(100, 50));
    engine.pointerDown(QPointF(120, 60));
    ASSERT_EQ(engine.pointerUp(QPointF(160, 80)), Status::Ok);
    EXPECT_TRUE(RectNear(set.boxes().first().rect(), QRectF(0.1, 0.1, 0.2, 0.2)));
}

TEST_F(InteractionEngineTest, UnsupportedZoomRejected)
{
    EXPECT_EQ(engine.setZoom(3), Status::InvalidGeometry);
    EXPECT_EQ(engine.view().zoomFactor, 1);
}

TEST_F(InteractionEngineTest, RefreshAndClearAll)
{
    addSampleBox();
    addSampleBox(ClassLabel::Bad);

    int refreshes = 0;
    QObject::connect(&engine, &InteractionEngine::refreshRequested, [&]{ ++refreshes; });
    EXPECT_EQ(engine.requestRefresh(), Status::Ok);
    EXPECT_EQ(refreshes, 1);

    EXPECT_EQ(engine.clearAll(), Status::Ok);
    EXPECT_TRUE(set.isEmpty());
    EXPECT_TRUE(set.isModified());
}

TEST_F(InteractionEngineTest, DetachedEngineIgnoresInput)
{
    engine.detach();
    EXPECT_FALSE(engine.isAttached());
    EXPECT_EQ(engine.pointerDown(QPointF(10, 10)), Status::Ignored);
    EXPECT_EQ(engine.pointerMove(QPointF(20, 20)), Status::Ignored);
    EXPECT_EQ(engine.pointerUp(QPointF(60, 60)), Status::Ignored);
    EXPECT_EQ(engine.deleteHovered(), Status::Ignored);
    EXPECT_EQ(engine.clearAll(), Status::Ignored);
    EXPECT_TRUE(engine.isIdle());
    EXPECT_TRUE(set.isEmpty());
}

TEST_F(InteractionEngineTest, NoImageMeansInvalidGeometry)
{
    InteractionEngine bare;
    AnnotationSet other;
    bare.attach(&other);
    EXPECT_EQ(bare.pointerDown(QPointF(10, 10)), Status::InvalidGeometry);
    EXPECT_TRUE(bare.isIdle());
}

TEST_F(InteractionEngineTest, RemovedBoxEndsDrag)
{
    const BoxId id = addSampleBox();
    engine.pointerDown(QPointF(30, 15));
    ASSERT_EQ(set.removeBox(id), Status::Ok);

    EXPECT_EQ(engine.pointerMove(QPointF(50, 25)), Status::NoSuchBox);
    EXPECT_TRUE(engine.isIdle());
}
