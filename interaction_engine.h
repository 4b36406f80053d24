#pragma once

#include "annot_status.h"
#include "box_model.h"
#include "geometry.h"

#include <QObject>
#include <QPointF>
#include <QRectF>
#include <QSizeF>

#include <optional>
#include <variant>

namespace annot {

// ===========================
// Interaction modes
// ===========================
struct IdleState {};

struct DrawingState {
    QPointF anchor;             // pointer-down, display px
    QPointF current;
};

struct MovingState {
    BoxId   box = kNoBox;
    QPointF press;              // pointer-down, display px
    QRectF  startRect;          // box before the drag, display px
};

struct ResizingState {
    BoxId   box = kNoBox;
    Corner  corner = Corner::BottomRight;   // the one being dragged
    QPointF pinned;                         // opposite corner, display px
};

using InteractionMode = std::variant<IdleState, DrawingState, MovingState, ResizingState>;

struct EngineOptions {
    double handleSizePx     = 10.0;   // full side of a corner handle
    double hoverTolerancePx = 0.0;
    double minBoxSizePx     = 2.0;
};

// Turns pointer and keyboard events into AnnotationSet edits. The set is
// owned by the session; while none is attached (inference pending) every
// pointer event is Ignored.
class InteractionEngine : public QObject
{
    Q_OBJECT
public:
    explicit InteractionEngine(QObject* parent = nullptr);

    void                 setOptions(const EngineOptions& o) { m_opts = o; }
    const EngineOptions& options() const { return m_opts; }

    void           attach(AnnotationSet* set);
    void           detach();
    AnnotationSet* annotations() const { return m_set; }
    bool           isAttached() const  { return m_set != nullptr; }

    // --- View ---
    void                 setImageSize(const QSizeF& size);
    void                 setViewportOrigin(const QPointF& origin);
    Status               setZoom(int zoom);
    const ViewTransform& view() const { return m_view; }

    void       setDefaultClass(ClassLabel c) { m_defaultClass = c; }
    ClassLabel defaultClass() const          { return m_defaultClass; }

    bool resizeHandlesEnabled() const { return m_handlesEnabled; }
    void setResizeHandlesEnabled(bool on);

    const InteractionMode& mode() const { return m_mode; }
    bool                   isIdle() const { return std::holds_alternative<IdleState>(m_mode); }
    std::optional<QRectF>  rubberBand() const;

    // --- Pointer (display px) ---
    Status pointerDown(const QPointF& pos);
    Status pointerMove(const QPointF& pos);
    Status pointerUp(const QPointF& pos);
    void   cancelInteraction();

    // --- Keyboard ---
    Status deleteHovered();
    Status deleteSelected();    // sidebar button; the pointer is off the canvas
    Status toggleClassOfHovered();
    Status toggleResizeHandles();
    Status toggleZoom();
    Status requestRefresh();
    Status clearAll();

signals:
    void annotationsChanged();
    void hoverChanged(int boxId);
    void zoomChanged(int zoom);
    void resizeHandlesChanged(bool enabled);
    void refreshRequested();
    void viewChanged();

private:
    struct HandleHit {
        BoxId  box = kNoBox;
        Corner corner = Corner::TopLeft;
    };
    std::optional<HandleHit> hitHandle(const QPointF& pos) const;
    void refreshHover(const QPointF& pos);

    AnnotationSet*  m_set = nullptr;
    ViewTransform   m_view;
    EngineOptions   m_opts;
    InteractionMode m_mode = IdleState{};
    ClassLabel      m_defaultClass   = ClassLabel::Good;
    bool            m_handlesEnabled = false;
};

} // namespace annot
