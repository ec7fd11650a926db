#ifndef COORDINATEHELPER_H
#define COORDINATEHELPER_H

#include <QPoint>
#include <QRect>

class QScreen;

/**
 * CoordinateHelper - Rectangle and coordinate conversion utilities
 *
 * Builds canonical rectangles from drag corners and converts between
 * logical (Qt) and physical (bitmap) coordinates, handling device pixel
 * ratio consistently for the capture path.
 */
class CoordinateHelper {
public:
    CoordinateHelper() = delete;

    // Canonical rectangle spanned by two corners, in any drag direction.
    // Edges are exclusive: corners (0,0) and (10,5) give a 10x5 rect,
    // equal corners give an empty rect.
    static QRect rectFromCorners(const QPoint& a, const QPoint& b);

    // Get device pixel ratio from screen (returns 1.0 if screen is null)
    static qreal getDevicePixelRatio(QScreen* screen);

    // Logical to Physical conversions
    static QRect toPhysical(const QRect& logical, qreal dpr);
    // Convert logical rect to a physical rect that fully covers it.
    // Uses floor() for left/top and ceil() for right/bottom boundaries.
    static QRect toPhysicalCoveringRect(const QRect& logical, qreal dpr);

    // Global (virtual desktop) to screen-local conversions
    static QRect globalToScreen(const QRect& global, QScreen* screen);
    static QRect screenToGlobal(const QRect& local, QScreen* screen);
};

#endif // COORDINATEHELPER_H
