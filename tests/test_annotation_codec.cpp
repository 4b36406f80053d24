#include "annotation_codec.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

using namespace annot;

TEST(AnnotationCodec, SerializesOneLinePerBox)
{
    AnnotationSet set;
    set.append(QRectF(0.1, 0.2, 0.2, 0.4), ClassLabel::Good);
    set.append(QRectF(0.5, 0.5, 0.25, 0.25), ClassLabel::Bad);

    EXPECT_EQ(serialize(set, ClassIdMapping{}),
              QStringLiteral("1 0.200000 0.400000 0.200000 0.400000\n"
                             "0 0.625000 0.625000 0.250000 0.250000\n"));
}

TEST(AnnotationCodec, EmptySetSerializesToEmptyText)
{
    EXPECT_TRUE(serialize(AnnotationSet(), ClassIdMapping{}).isEmpty());
}

TEST(AnnotationCodec, UsesConfiguredClassIds)
{
    AnnotationSet set;
    set.append(QRectF(0.1, 0.1, 0.2, 0.2), ClassLabel::Good);
    set.append(QRectF(0.1, 0.1, 0.2, 0.2), ClassLabel::Bad);

    ClassIdMapping m;
    m.goodId = 3;
    m.badId  = 7;
    const QStringList lines = serialize(set, m).split('\n', Qt::SkipEmptyParts);
    ASSERT_EQ(lines.size(), 2);
    EXPECT_TRUE(lines[0].startsWith("3 "));
    EXPECT_TRUE(lines[1].startsWith("7 "));
}

TEST(AnnotationCodec, PrecisionHasAFloor)
{
    AnnotationSet set;
    set.append(QRectF(0.1, 0.1, 0.2, 0.2), ClassLabel::Good);
    EXPECT_EQ(serialize(set, ClassIdMapping{}, 2), QStringLiteral("1 0.2000 0.2000 0.2000 0.2000\n"));
}

TEST(AnnotationCodec, RoundTripKeepsBoxesAndOrder)
{
    AnnotationSet set;
    set.append(QRectF(0.123456, 0.2, 0.3, 0.1), ClassLabel::Bad);
    set.append(QRectF(0.0, 0.0, 1.0, 1.0), ClassLabel::Good);
    set.append(QRectF(0.7, 0.6, 0.05, 0.3), ClassLabel::Good);

    const ClassIdMapping m;
    const AnnotationSet back = deserialize(serialize(set, m), m);

    ASSERT_EQ(back.size(), set.size());
    EXPECT_FALSE(back.isModified());
    for (int i = 0; i < set.size(); ++i) {
        const Box& a = set.boxes()[i];
        const Box& b = back.boxes()[i];
        EXPECT_EQ(a.label, b.label) << "box " << i;
        EXPECT_NEAR(a.cx, b.cx, 1e-6);
        EXPECT_NEAR(a.cy, b.cy, 1e-6);
        EXPECT_NEAR(a.w,  b.w,  1e-6);
        EXPECT_NEAR(a.h,  b.h,  1e-6);
    }
}

TEST(AnnotationCodec, MalformedLinesAreSkipped)
{
    const QString text =
        "1 0.5 0.5 0.2 0.2\n"       // 1 ok
        "garbage\n"                 // 2
        "1 0.5 0.5 0.2\n"           // 3 four fields
        "1 abc 0.5 0.2 0.2\n"       // 4 non-numeric
        "1 1.5 0.5 0.2 0.2\n"       // 5 center outside
        "1 0.5 0.5 0 0.2\n"         // 6 zero width
        "-1 0.5 0.5 0.2 0.2\n"      // 7 negative class
        "\n"                        // 8 blank, silently ignored
        "0 0.25 0.25 0.1 0.1 0.9\n" // 9 six fields
        "0 0.25 0.25 0.1 0.1\n";    // 10 ok

    QVector<ParseWarning> warnings;
    const AnnotationSet set = deserialize(text, ClassIdMapping{}, &warnings);

    ASSERT_EQ(set.size(), 2);
    EXPECT_EQ(set.boxes()[0].label, ClassLabel::Good);
    EXPECT_EQ(set.boxes()[1].label, ClassLabel::Bad);

    QVector<int> lines;
    for (const ParseWarning& w : warnings) lines << w.lineNumber;
    EXPECT_EQ(lines, QVector<int>({2, 3, 4, 5, 6, 7, 9}));
    EXPECT_TRUE(warnings.first().toString().contains("line 2"));
}

TEST(AnnotationCodec, NonFiniteValuesAreRejected)
{
    QVector<ParseWarning> warnings;
    const AnnotationSet set = deserialize("1 nan 0.5 0.2 0.2\n1 0.5 0.5 inf 0.2\n",
                                          ClassIdMapping{}, &warnings);
    EXPECT_TRUE(set.isEmpty());
    EXPECT_EQ(warnings.size(), 2);
}

TEST(AnnotationCodec, AcceptsIntegralFloatClassIdsAndCrLf)
{
    QVector<ParseWarning> warnings;
    const AnnotationSet set = deserialize("1.0 0.5 0.5 0.2 0.2\r\n1.5 0.5 0.5 0.2 0.2\r\n",
                                          ClassIdMapping{}, &warnings);
    ASSERT_EQ(set.size(), 1);
    EXPECT_EQ(set.boxes()[0].label, ClassLabel::Good);
    EXPECT_EQ(warnings.size(), 1);
}

TEST(AnnotationCodec, OverflowingClassIdIsMalformed)
{
    QVector<ParseWarning> warnings;
    const AnnotationSet set = deserialize("3000000000 0.5 0.5 0.2 0.2\n"
                                          "1e20 0.5 0.5 0.2 0.2\n"
                                          "-1e20 0.5 0.5 0.2 0.2\n"
                                          "1 0.5 0.5 0.2 0.2\n",
                                          ClassIdMapping{}, &warnings);
    ASSERT_EQ(set.size(), 1);
    EXPECT_EQ(set.boxes()[0].label, ClassLabel::Good);
    ASSERT_EQ(warnings.size(), 3);
    EXPECT_EQ(warnings[0].lineNumber, 1);
    EXPECT_EQ(warnings[1].lineNumber, 2);
    EXPECT_EQ(warnings[2].lineNumber, 3);
}

TEST(AnnotationCodec, UnknownClassIdReadsAsBad)
{
    const AnnotationSet set = deserialize("5 0.5 0.5 0.2 0.2\n", ClassIdMapping{});
    ASSERT_EQ(set.size(), 1);
    EXPECT_EQ(set.boxes()[0].label, ClassLabel::Bad);
}

TEST(AnnotationCodec, BoxCrossingBorderIsClampedOnLoad)
{
    const AnnotationSet set = deserialize("1 0.95 0.5 0.2 0.2\n", ClassIdMapping{});
    ASSERT_EQ(set.size(), 1);
    EXPECT_TRUE(RectNear(set.boxes()[0].rect(), QRectF(0.85, 0.4, 0.15, 0.2), 1e-9));
}

namespace {

QVector<Prediction> samplePredictions()
{
    return {
        {1, 0.2, 0.2, 0.1, 0.1, 0.30},
        {1, 0.4, 0.4, 0.1, 0.1, 0.50},
        {0, 0.6, 0.6, 0.1, 0.1, 0.96},
        {1, 0.8, 0.8, 0.1, 0.1, 0.40},
    };
}

} // namespace

TEST(AnnotationCodec, PredictionsBelowThresholdAreDropped)
{
    const ClassIdMapping model;

    const AnnotationSet low = fromPredictions(samplePredictions(), 0.4, model);
    EXPECT_EQ(low.size(), 3);         // 0.40 is kept
    EXPECT_FALSE(low.isModified());

    const AnnotationSet high = fromPredictions(samplePredictions(), 0.95, model);
    ASSERT_EQ(high.size(), 1);
    EXPECT_EQ(high.boxes()[0].label, ClassLabel::Bad);
    EXPECT_NEAR(high.boxes()[0].cx, 0.6, 1e-12);
}

TEST(AnnotationCodec, PredictionsUseModelMapping)
{
    const QVector<Prediction> preds = {
        {1, 0.5, 0.5, 0.1, 0.1, 0.9},
        {0, 0.5, 0.5, 0.1, 0.1, 0.9},
        {2, 0.5, 0.5, 0.1, 0.1, 0.9},
    };
    const AnnotationSet set = fromPredictions(preds, 0.0, ClassIdMapping{});
    ASSERT_EQ(set.size(), 3);
    EXPECT_EQ(set.boxes()[0].label, ClassLabel::Good);
    EXPECT_EQ(set.boxes()[1].label, ClassLabel::Bad);
    EXPECT_EQ(set.boxes()[2].label, ClassLabel::Bad);
}

TEST(AnnotationCodec, InvalidPredictionsAreDropped)
{
    const QVector<Prediction> preds = {
        {1, 0.5, 0.5, 0.0, 0.1, 0.9},
        {1, 1.5, 1.5, 0.1, 0.1, 0.9},
        {1, 0.5, 0.5, 0.1, 0.1, 0.9},
    };
    EXPECT_EQ(fromPredictions(preds, 0.4, ClassIdMapping{}).size(), 1);
}
