#pragma once

#include <gtest/gtest.h>

#include <QRectF>
#include <QString>

#include <cmath>
#include <ostream>
#include <sstream>

inline void PrintTo(const QString& s, std::ostream* os)
{
    *os << '"' << s.toStdString() << '"';
}

inline void PrintTo(const QRectF& r, std::ostream* os)
{
    *os << "QRectF(" << r.x() << ", " << r.y() << ", " << r.width() << ", " << r.height() << ")";
}

inline ::testing::AssertionResult RectNear(const QRectF& actual, const QRectF& expected,
                                           double eps = 1e-9)
{
    const bool ok = std::abs(actual.x() - expected.x()) <= eps
                 && std::abs(actual.y() - expected.y()) <= eps
                 && std::abs(actual.width() - expected.width()) <= eps
                 && std::abs(actual.height() - expected.height()) <= eps;
    if (ok) return ::testing::AssertionSuccess();

    std::ostringstream ss;
    PrintTo(actual, &ss);
    ss << " != ";
    PrintTo(expected, &ss);
    return ::testing::AssertionFailure() << ss.str();
}
