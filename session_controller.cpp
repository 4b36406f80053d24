#include "session_controller.h"
#include "label_utils.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QImage>
#include <QImageReader>

#include <algorithm>

namespace annot {

static QSize probeImageSize(const QString& path)
{
    QImageReader r(path);
    QSize s = r.size();
    if (!s.isValid()) {
        // some formats only know their size after decoding
        const QImage img = r.read();
        s = img.size();
    }
    return s;
}

SessionController::SessionController(InteractionEngine* engine, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
    , m_probe(probeImageSize)
{
    Q_ASSERT(m_engine);
    connect(m_engine, &InteractionEngine::refreshRequested, this, &SessionController::refresh);
    connect(&m_autosave, &QTimer::timeout, this, [this]{
        if (m_set && m_set->isModified()) {
            qDebug() << "[Session] autosave";
            flush();
        }
    });
}

SessionController::~SessionController()
{
    // the engine must not keep pointing at our set
    if (m_engine) m_engine->detach();
}

void SessionController::setConfig(const AppConfig& cfg)
{
    m_cfg = cfg;
    m_engine->setOptions(cfg.engine);

    m_autosave.stop();
    if (m_cfg.autosaveSec > 0) {
        m_autosave.setInterval(m_cfg.autosaveSec * 1000);
        m_autosave.start();
    }
}

void SessionController::setDetector(Detector* detector)
{
    if (m_detector == detector) return;
    cancelInference();
    if (m_detector) disconnect(m_detector, nullptr, this, nullptr);

    m_detector = detector;
    if (m_detector) {
        connect(m_detector, &Detector::finished, this, &SessionController::onInferenceFinished);
        connect(m_detector, &Detector::log, this, &SessionController::log);
    }
}

QString SessionController::currentImage() const
{
    if (m_index < 0 || m_index >= m_images.size()) return {};
    return m_images[m_index];
}

QString SessionController::currentLabelPath() const
{
    const QString img = currentImage();
    return img.isEmpty() ? QString() : lu::labelPathForImage(img, m_labelsDir);
}

// =========================
// Opening images
// =========================
bool SessionController::openDataset(const QString& root, const QString& split)
{
    const lu::SplitDirs dirs = lu::splitDirs(root, split);
    if (!QFileInfo(dirs.imagesDir).isDir()) {
        emit blockingError(tr("Invalid dataset structure. Expected: %1/").arg(dirs.imagesDir));
        return false;
    }

    const QStringList imgs = lu::listImagesCaseInsensitive(dirs.imagesDir);
    if (imgs.isEmpty()) {
        emit blockingError(tr("No images found in %1").arg(dirs.imagesDir));
        return false;
    }

    if (!flush()) return false;

    m_root      = root;
    m_cfg.split = split;
    m_labelsDir = dirs.labelsDir;
    m_images    = imgs;
    m_index     = 0;

    qDebug() << "[Session] dataset =" << root << "split =" << split << "images =" << imgs.size();
    emit log(tr("Loaded %1 images from %2").arg(imgs.size()).arg(dirs.imagesDir));
    loadCurrent();
    return true;
}

bool SessionController::setSplit(const QString& split)
{
    if (!lu::datasetSplits().contains(split)) {
        emit warning(tr("Unknown split: %1").arg(split));
        return false;
    }
    if (m_root.isEmpty()) {
        m_cfg.split = split;
        return true;
    }
    if (split == m_cfg.split) return true;
    return openDataset(m_root, split);
}

bool SessionController::openImages(const QStringList& images, const QString& labelsDir)
{
    if (images.isEmpty()) {
        emit warning(tr("No images to open"));
        return false;
    }
    if (!flush()) return false;

    m_root.clear();
    m_labelsDir = labelsDir;
    m_images    = images;
    m_index     = 0;
    loadCurrent();
    return true;
}

// =========================
// Navigation
// =========================
bool SessionController::navigateTo(int index)
{
    if (m_images.isEmpty()) return false;
    if (!flush()) return false;     // keep the edits on screen if they can't be written

    m_index = index;
    loadCurrent();
    return true;
}

bool SessionController::next()
{
    if (m_images.isEmpty()) return false;
    return navigateTo((m_index + 1) % m_images.size());
}

bool SessionController::previous()
{
    if (m_images.isEmpty()) return false;
    const int n = m_images.size();
    return navigateTo((m_index - 1 + n) % n);
}

bool SessionController::jumpTo(int oneBasedIndex)
{
    if (m_images.isEmpty()) {
        emit warning(tr("No images loaded. Please load a dataset first."));
        return false;
    }
    if (oneBasedIndex < 1 || oneBasedIndex > m_images.size()) {
        emit warning(tr("Please enter a number between 1 and %1.").arg(m_images.size()));
        return false;
    }
    return navigateTo(oneBasedIndex - 1);
}

// =========================
// Box source
// =========================
void SessionController::setMode(SourceMode mode)
{
    if (mode == m_cfg.mode) return;
    if (!flush()) return;

    m_cfg.mode = mode;
    qDebug() << "[Session] mode =" << sourceModeName(mode);
    emit modeChanged(mode);
    if (m_index >= 0) loadCurrent();
}

void SessionController::toggleMode()
{
    setMode(m_cfg.mode == SourceMode::Prediction ? SourceMode::Dataset : SourceMode::Prediction);
}

void SessionController::setConfidenceThreshold(double threshold)
{
    const double t = std::clamp(threshold, 0.0, 1.0);
    if (qFuzzyCompare(1.0 + t, 1.0 + m_cfg.confidence)) return;

    const bool rerun = (m_cfg.mode == SourceMode::Prediction && m_index >= 0);
    if (rerun && !flush()) {
        // the boxes on screen still belong to the old threshold
        emit confidenceChanged(m_cfg.confidence);
        return;
    }

    m_cfg.confidence = t;
    emit confidenceChanged(t);
    if (rerun) loadCurrent();
}

// =========================
// Loading
// =========================
void SessionController::cancelInference()
{
    if (!m_inFlight) return;
    if (m_detector) m_detector->cancel();
    m_inFlight = false;
    m_pending  = 0;
}

void SessionController::dropCurrentSet()
{
    m_engine->detach();
    m_set.reset();
}

void SessionController::installSet(AnnotationSet set)
{
    m_set = std::make_unique<AnnotationSet>(std::move(set));
    m_engine->attach(m_set.get());
    emit annotationsReplaced();
}

void SessionController::loadCurrent()
{
    cancelInference();
    dropCurrentSet();

    const QString path = currentImage();
    if (path.isEmpty()) {
        emit annotationsReplaced();
        return;
    }

    const QSize size = m_probe ? m_probe(path) : QSize();
    if (!size.isValid() || size.isEmpty()) {
        m_engine->setImageSize(QSizeF());
        emit imageChanged(path, m_index, m_images.size());
        emit annotationsReplaced();
        emit warning(tr("Failed to load image:\n%1").arg(path));
        return;
    }

    m_engine->setImageSize(QSizeF(size));
    emit imageChanged(path, m_index, m_images.size());

    if (m_cfg.mode == SourceMode::Dataset) {
        lu::LabelFile lf;
        QString err;
        if (!lu::readLabelFile(currentLabelPath(), m_cfg.datasetClasses, &lf, &err)) {
            emit warning(tr("Failed to read annotations: %1").arg(err));
            installSet(AnnotationSet());
            return;
        }
        for (const ParseWarning& w : lf.warnings)
            emit log(tr("Skipped %1").arg(w.toString()));
        if (!lf.warnings.isEmpty())
            emit warning(tr("%1 malformed line(s) skipped in %2")
                             .arg(lf.warnings.size())
                             .arg(QFileInfo(currentLabelPath()).fileName()));
        installSet(lf.set);
        return;
    }

    // Prediction mode
    if (!m_detector || !m_detector->isReady()) {
        emit inferenceFailed(tr("Please load a YOLO model first to use prediction mode."));
        installSet(AnnotationSet());
        return;
    }

    // the engine stays detached until the answer for *this* image arrives
    m_inFlight = true;
    m_pending  = 0;
    emit inferenceStarted();
    const Detector::RequestId id = m_detector->predict(path, m_cfg.confidence);
    if (m_inFlight) m_pending = id;     // a synchronous detector may already have answered
}

void SessionController::onInferenceFinished(quint64 requestId, const InferenceResult& result)
{
    if (!m_inFlight || (m_pending != 0 && requestId != m_pending)) {
        qDebug() << "[Session] stale inference result discarded, id =" << requestId;
        return;
    }
    m_inFlight = false;
    m_pending  = 0;

    if (!result.ok) {
        emit inferenceFailed(result.error);
        installSet(AnnotationSet());
        return;
    }

    AnnotationSet set = fromPredictions(result.predictions, m_cfg.confidence, m_cfg.modelClasses);
    emit log(tr("%1: %2 of %3 predictions kept")
                 .arg(QFileInfo(currentImage()).fileName())
                 .arg(set.size())
                 .arg(result.predictions.size()));
    installSet(std::move(set));
}

// =========================
// Saving
// =========================
bool SessionController::save()
{
    if (!m_set) {
        qDebug() << "[Session] save: nothing loaded";
        return false;
    }

    const QString path = currentLabelPath();
    QString err;
    if (!lu::writeLabelFile(path, serialize(*m_set, m_cfg.datasetClasses, m_cfg.precision), &err)) {
        emit blockingError(tr("Failed to save annotations: %1\nPath: %2").arg(err, path));
        return false;
    }

    m_set->markSaved();
    emit saved(path);
    emit log(tr("Saved %1 boxes: %2").arg(m_set->size()).arg(path));
    return true;
}

bool SessionController::flush()
{
    if (!m_set || !m_set->isModified()) return true;
    return save();
}

void SessionController::refresh()
{
    if (m_index < 0) return;
    qDebug() << "[Session] refresh, unsaved edits dropped =" << (m_set && m_set->isModified());
    loadCurrent();
}

bool SessionController::clearAnnotations()
{
    return isOk(m_engine->clearAll());
}

} // namespace annot
