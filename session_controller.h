#pragma once

#include "app_config.h"
#include "box_model.h"
#include "detector.h"
#include "interaction_engine.h"

#include <QObject>
#include <QPointer>
#include <QSize>
#include <QString>
#include <QStringList>
#include <QTimer>

#include <functional>
#include <memory>

namespace annot {

// Owns the AnnotationSet of the image on screen and is the only place that
// replaces it. Every replacement except refresh() flushes unsaved edits first.
class SessionController : public QObject
{
    Q_OBJECT
public:
    using ImageSizeProbe = std::function<QSize(const QString&)>;

    explicit SessionController(InteractionEngine* engine, QObject* parent = nullptr);
    ~SessionController() override;

    void             setConfig(const AppConfig& cfg);
    const AppConfig& config() const { return m_cfg; }

    void      setDetector(Detector* detector);        // not owned
    Detector* detector() const { return m_detector; }
    void      setImageSizeProbe(ImageSizeProbe probe) { m_probe = std::move(probe); }

    // --- Images ---
    bool    openDataset(const QString& root, const QString& split);
    bool    setSplit(const QString& split);
    bool    openImages(const QStringList& images, const QString& labelsDir = QString());
    QString datasetRoot() const { return m_root; }
    QString split() const       { return m_cfg.split; }

    // --- Navigation (wraps around) ---
    bool    next();
    bool    previous();
    bool    jumpTo(int oneBasedIndex);
    int     currentIndex() const { return m_index; }
    int     imageCount() const   { return m_images.size(); }
    QString currentImage() const;
    QString currentLabelPath() const;

    // --- Box source ---
    void       setMode(SourceMode mode);
    void       toggleMode();
    SourceMode mode() const { return m_cfg.mode; }
    void       setConfidenceThreshold(double threshold);
    double     confidenceThreshold() const { return m_cfg.confidence; }

    // --- Edits ---
    bool save();                // write the current set
    bool flush();               // save() only if modified
    void refresh();             // reload, unsaved edits are dropped
    bool clearAnnotations();

    const AnnotationSet* annotations() const { return m_set.get(); }
    bool                 isInferencePending() const { return m_inFlight; }

signals:
    void imageChanged(const QString& path, int index, int total);
    void annotationsReplaced();
    void modeChanged(annot::SourceMode mode);
    void confidenceChanged(double threshold);
    void inferenceStarted();
    void inferenceFailed(const QString& message);
    void saved(const QString& labelPath);
    void warning(const QString& message);
    void blockingError(const QString& message);
    void log(const QString& line);

private:
    void loadCurrent();
    void installSet(AnnotationSet set);
    void dropCurrentSet();
    void cancelInference();
    void onInferenceFinished(quint64 requestId, const annot::InferenceResult& result);
    bool navigateTo(int index);

    QPointer<InteractionEngine>    m_engine;
    Detector*                      m_detector = nullptr;
    AppConfig                      m_cfg;
    ImageSizeProbe                 m_probe;

    QString                        m_root;
    QString                        m_labelsDir;
    QStringList                    m_images;
    int                            m_index = -1;

    std::unique_ptr<AnnotationSet> m_set;
    bool                           m_inFlight = false;
    Detector::RequestId            m_pending  = 0;

    QTimer                         m_autosave;
};

} // namespace annot
