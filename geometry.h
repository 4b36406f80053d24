#pragma once

#include <QPointF>
#include <QRectF>
#include <QSizeF>

#include <array>
#include <optional>

namespace annot {

// Supported zoom levels, cycled by the Z shortcut.
constexpr std::array<int, 2> kZoomLevels = {1, 2};

bool isSupportedZoom(int zoom);
int  nextZoomLevel(int zoom);

// normalized [0,1] <-> display pixels:
//   display = normalized * imageSize * zoomFactor + viewportOrigin
struct ViewTransform {
    int     zoomFactor = 1;
    QSizeF  imageSize;          // raw image, pixels
    QPointF viewportOrigin;     // image top-left on the display surface

    QSizeF displaySize() const { return imageSize * zoomFactor; }
    QRectF imageDisplayRect() const { return QRectF(viewportOrigin, displaySize()); }
    bool   isValid() const;
};

enum class Corner { TopLeft = 0, TopRight = 1, BottomLeft = 2, BottomRight = 3 };

Corner  oppositeCorner(Corner c);
QPointF cornerPoint(const QRectF& r, Corner c);

// Rects are QRectF in both spaces (left/top/width/height). Empty result means
// InvalidGeometry: NaN/inf, negative size or an invalid transform.
std::optional<QRectF>  toDisplay(const QRectF& normalized, const ViewTransform& vt);
std::optional<QRectF>  toNormalized(const QRectF& display, const ViewTransform& vt);
std::optional<QPointF> toDisplayPoint(const QPointF& normalized, const ViewTransform& vt);
std::optional<QPointF> toNormalizedPoint(const QPointF& display, const ViewTransform& vt);

// Hit test in display space; the rect is grown by tolerancePx on every side.
bool pointInRect(const QPointF& p, const QRectF& rect, double tolerancePx = 0.0);

// Square handles of side handleSizePx centred on the corners, in Corner order.
std::array<QRectF, 4> cornerHandleRects(const QRectF& displayRect, double handleSizePx);

bool   isFiniteRect(const QRectF& r);
QRectF rectFromCorners(const QPointF& a, const QPointF& b);

// Creation/resize policy: intersect with [0,1]x[0,1] (may shrink to empty).
QRectF clampToUnit(const QRectF& normalized);
// Move policy: translate back inside [0,1]x[0,1], size preserved.
QRectF clampInsideUnit(const QRectF& normalized);

// Corner drag: pinned corner stays, dragged corner follows the pointer inside
// bounds, each side at least minPx long. Crossing the pinned corner flips the
// box instead of producing a negative size.
QRectF resizedRect(const QPointF& pinned, const QPointF& pointer,
                   const QRectF& bounds, double minPx);

} // namespace annot
