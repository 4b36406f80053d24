#include "geometry.h"

#include <algorithm>
#include <cmath>

namespace annot {

// ---------------------------
// Helpers
// ---------------------------
static inline bool finite(double v) { return std::isfinite(v); }

static inline bool finitePoint(const QPointF& p)
{
    return finite(p.x()) && finite(p.y());
}

static double resizeAxis(double pinned, double pointer, double lo, double hi, double minLen)
{
    double p = std::clamp(pointer, lo, hi);
    if (std::abs(p - pinned) < minLen)
        p = (p >= pinned) ? pinned + minLen : pinned - minLen;

    // floor pushed the edge out of the image: grow towards the other side
    if (p > hi)      p = pinned - minLen;
    else if (p < lo) p = pinned + minLen;
    return std::clamp(p, lo, hi);
}

// ---------------------------
// Zoom / transform
// ---------------------------
bool isSupportedZoom(int zoom)
{
    return std::find(kZoomLevels.begin(), kZoomLevels.end(), zoom) != kZoomLevels.end();
}

int nextZoomLevel(int zoom)
{
    auto it = std::find(kZoomLevels.begin(), kZoomLevels.end(), zoom);
    if (it == kZoomLevels.end() || ++it == kZoomLevels.end())
        return kZoomLevels.front();
    return *it;
}

bool ViewTransform::isValid() const
{
    return isSupportedZoom(zoomFactor)
        && finite(imageSize.width()) && finite(imageSize.height())
        && imageSize.width() > 0.0 && imageSize.height() > 0.0
        && finitePoint(viewportOrigin);
}

Corner oppositeCorner(Corner c)
{
    switch (c) {
    case Corner::TopLeft:     return Corner::BottomRight;
    case Corner::TopRight:    return Corner::BottomLeft;
    case Corner::BottomLeft:  return Corner::TopRight;
    case Corner::BottomRight: return Corner::TopLeft;
    }
    return Corner::TopLeft;
}

QPointF cornerPoint(const QRectF& r, Corner c)
{
    switch (c) {
    case Corner::TopLeft:     return r.topLeft();
    case Corner::TopRight:    return QPointF(r.right(), r.top());
    case Corner::BottomLeft:  return QPointF(r.left(), r.bottom());
    case Corner::BottomRight: return r.bottomRight();
    }
    return r.topLeft();
}

bool isFiniteRect(const QRectF& r)
{
    return finite(r.x()) && finite(r.y()) && finite(r.width()) && finite(r.height());
}

std::optional<QRectF> toDisplay(const QRectF& n, const ViewTransform& vt)
{
    if (!vt.isValid() || !isFiniteRect(n) || n.width() < 0.0 || n.height() < 0.0)
        return std::nullopt;

    const double sx = vt.imageSize.width()  * vt.zoomFactor;
    const double sy = vt.imageSize.height() * vt.zoomFactor;
    return QRectF(n.x() * sx + vt.viewportOrigin.x(),
                  n.y() * sy + vt.viewportOrigin.y(),
                  n.width()  * sx,
                  n.height() * sy);
}

std::optional<QRectF> toNormalized(const QRectF& d, const ViewTransform& vt)
{
    if (!vt.isValid() || !isFiniteRect(d) || d.width() < 0.0 || d.height() < 0.0)
        return std::nullopt;

    const double sx = vt.imageSize.width()  * vt.zoomFactor;
    const double sy = vt.imageSize.height() * vt.zoomFactor;
    return QRectF((d.x() - vt.viewportOrigin.x()) / sx,
                  (d.y() - vt.viewportOrigin.y()) / sy,
                  d.width()  / sx,
                  d.height() / sy);
}

std::optional<QPointF> toDisplayPoint(const QPointF& n, const ViewTransform& vt)
{
    if (!vt.isValid() || !finitePoint(n))
        return std::nullopt;
    return QPointF(n.x() * vt.imageSize.width()  * vt.zoomFactor + vt.viewportOrigin.x(),
                   n.y() * vt.imageSize.height() * vt.zoomFactor + vt.viewportOrigin.y());
}

std::optional<QPointF> toNormalizedPoint(const QPointF& d, const ViewTransform& vt)
{
    if (!vt.isValid() || !finitePoint(d))
        return std::nullopt;
    return QPointF((d.x() - vt.viewportOrigin.x()) / (vt.imageSize.width()  * vt.zoomFactor),
                   (d.y() - vt.viewportOrigin.y()) / (vt.imageSize.height() * vt.zoomFactor));
}

// ---------------------------
// Hit testing
// ---------------------------
bool pointInRect(const QPointF& p, const QRectF& rect, double tolerancePx)
{
    if (!finitePoint(p) || !isFiniteRect(rect) || !finite(tolerancePx))
        return false;

    const QRectF r = rect.normalized();
    const double t = std::max(0.0, tolerancePx);
    return p.x() >= r.left() - t && p.x() <= r.right()  + t
        && p.y() >= r.top()  - t && p.y() <= r.bottom() + t;
}

std::array<QRectF, 4> cornerHandleRects(const QRectF& displayRect, double handleSizePx)
{
    const QRectF r    = displayRect.normalized();
    const double half = handleSizePx / 2.0;

    std::array<QRectF, 4> out;
    for (int k = 0; k < 4; ++k) {
        const QPointF c = cornerPoint(r, static_cast<Corner>(k));
        out[k] = QRectF(c.x() - half, c.y() - half, handleSizePx, handleSizePx);
    }
    return out;
}

// ---------------------------
// Clamping
// ---------------------------
QRectF rectFromCorners(const QPointF& a, const QPointF& b)
{
    return QRectF(a, b).normalized();
}

QRectF clampToUnit(const QRectF& n)
{
    const QRectF unit(0.0, 0.0, 1.0, 1.0);
    const QRectF r = n.normalized().intersected(unit);
    if (r.isEmpty())
        return QRectF();
    return r;
}

QRectF clampInsideUnit(const QRectF& n)
{
    const QRectF r = n.normalized();
    const double w = std::min(r.width(),  1.0);
    const double h = std::min(r.height(), 1.0);
    const double x = std::clamp(r.x(), 0.0, 1.0 - w);
    const double y = std::clamp(r.y(), 0.0, 1.0 - h);
    return QRectF(x, y, w, h);
}

QRectF resizedRect(const QPointF& pinned, const QPointF& pointer,
                   const QRectF& bounds, double minPx)
{
    const QRectF b = bounds.normalized();
    const double minW = std::min(minPx, b.width());
    const double minH = std::min(minPx, b.height());

    const double x = resizeAxis(pinned.x(), pointer.x(), b.left(), b.right(),  minW);
    const double y = resizeAxis(pinned.y(), pointer.y(), b.top(),  b.bottom(), minH);
    return rectFromCorners(pinned, QPointF(x, y));
}

} // namespace annot
