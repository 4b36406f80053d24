#pragma once

#include "interaction_engine.h"

#include <QImage>
#include <QString>
#include <QWidget>

class QMouseEvent;
class QKeyEvent;
class QPaintEvent;
class QResizeEvent;
class QEvent;

// Canvas: paints the image at the engine's zoom, centred in the widget, plus
// the boxes, and forwards pointer events to the engine in widget pixels.
class AnnotatorWidget : public QWidget
{
    Q_OBJECT
public:
    explicit AnnotatorWidget(annot::InteractionEngine* engine, QWidget* parent = nullptr);

    // Decodes the pixels only; the engine's image size is set by the session.
    bool    loadImage(const QString& path);
    void    clearImage();
    QString imagePath() const { return m_imagePath; }
    QSize   imageSize() const { return m_image.size(); }
    void    relayout();     // after the engine's image size or zoom changed

    void setClassNames(const QString& good, const QString& bad);
    void setBusy(bool busy);        // inference pending: dim + message

    QSize sizeHint() const override;
    QSize minimumSizeHint() const override;

signals:
    void log(const QString& line);

protected:
    void paintEvent(QPaintEvent*) override;
    void mousePressEvent(QMouseEvent*) override;
    void mouseMoveEvent(QMouseEvent*) override;
    void mouseReleaseEvent(QMouseEvent*) override;
    void keyPressEvent(QKeyEvent*) override;
    void leaveEvent(QEvent*) override;
    void resizeEvent(QResizeEvent*) override;

private:
    void updateViewportOrigin();
    void setCursorForPos(const QPointF& pos);

    annot::InteractionEngine* m_engine = nullptr;

    QImage  m_image;
    QString m_imagePath;
    QString m_goodName = QStringLiteral("good_fin");
    QString m_badName  = QStringLiteral("bad_fin");
    bool    m_busy = false;
};
