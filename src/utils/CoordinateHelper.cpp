#include "utils/CoordinateHelper.h"
#include <QScreen>
#include <QSize>
#include <QtMath>

QRect CoordinateHelper::rectFromCorners(const QPoint& a, const QPoint& b)
{
    const int left = qMin(a.x(), b.x());
    const int top = qMin(a.y(), b.y());
    return QRect(QPoint(left, top), QSize(qAbs(b.x() - a.x()), qAbs(b.y() - a.y())));
}

qreal CoordinateHelper::getDevicePixelRatio(QScreen* screen)
{
    return screen ? screen->devicePixelRatio() : 1.0;
}

QRect CoordinateHelper::toPhysical(const QRect& logical, qreal dpr)
{
    return QRect(
        qRound(logical.x() * dpr),
        qRound(logical.y() * dpr),
        qRound(logical.width() * dpr),
        qRound(logical.height() * dpr)
    );
}

QRect CoordinateHelper::toPhysicalCoveringRect(const QRect& logical, qreal dpr)
{
    if (logical.isEmpty()) {
        return QRect();
    }

    const int left = qFloor(logical.x() * dpr);
    const int top = qFloor(logical.y() * dpr);
    const int right = qCeil((logical.x() + logical.width()) * dpr);
    const int bottom = qCeil((logical.y() + logical.height()) * dpr);
    return QRect(left, top, right - left, bottom - top);
}

QRect CoordinateHelper::globalToScreen(const QRect& global, QScreen* screen)
{
    if (!screen) {
        return global;
    }
    return global.translated(-screen->geometry().topLeft());
}

QRect CoordinateHelper::screenToGlobal(const QRect& local, QScreen* screen)
{
    if (!screen) {
        return local;
    }
    return local.translated(screen->geometry().topLeft());
}
