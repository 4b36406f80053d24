#include "mainwindow.h"
#include "annotatorwidget.h"
#include "detector.h"
#include "interaction_engine.h"
#include "label_utils.h"
#include "session_controller.h"

#include <QButtonGroup>
#include <QCheckBox>
#include <QCloseEvent>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QIntValidator>
#include <QKeySequence>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QProgressBar>
#include <QPushButton>
#include <QRadioButton>
#include <QScrollArea>
#include <QShortcut>
#include <QSignalBlocker>
#include <QSlider>
#include <QSplitter>
#include <QStandardPaths>
#include <QStatusBar>
#include <QVBoxLayout>

#include <algorithm>
#include <cmath>

using annot::SourceMode;
using annot::Status;

// ================================
//  Python environment
// ================================
QProcessEnvironment MainWindow::makePythonEnv() const
{
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.remove("PYTHONHOME");
    env.insert("PYTHONIOENCODING", "utf-8");

    // interpreter inside a venv: <venv>/bin/python or <venv>\Scripts\python.exe
    const QFileInfo py(m_cfg.python);
    if (py.isAbsolute() && py.exists()) {
        QDir binDir = py.absoluteDir();
        const QString bin = QDir::toNativeSeparators(binDir.absolutePath());
        if (binDir.cdUp() && QFileInfo::exists(binDir.filePath("pyvenv.cfg"))) {
            env.insert("VIRTUAL_ENV", QDir::toNativeSeparators(binDir.absolutePath()));
            env.insert("PATH", bin + QDir::listSeparator() + env.value("PATH"));
        }
    }
    return env;
}

// ---------- Safe QFileDialog helpers ----------
QString MainWindow::getExistingDirectorySafe(QWidget* parent, const QString& title,
                                             const QString& startDir,
                                             QFileDialog::Options extra) const
{
    QFileDialog dlg(parent, title, startDir);
    dlg.setFileMode(QFileDialog::Directory);
    dlg.setOption(QFileDialog::ShowDirsOnly, true);
    dlg.setOption(QFileDialog::DontResolveSymlinks, true);
    dlg.setOptions(dlg.options() | QFileDialog::DontUseNativeDialog | extra);
    if (dlg.exec() == QDialog::Accepted && !dlg.selectedFiles().isEmpty())
        return dlg.selectedFiles().first();
    return {};
}

QString MainWindow::getOpenFileNameSafe(QWidget* parent, const QString& title,
                                        const QString& startDir, const QString& filter,
                                        QFileDialog::Options extra) const
{
    QFileDialog dlg(parent, title, startDir, filter);
    dlg.setFileMode(QFileDialog::ExistingFile);
    dlg.setOptions(dlg.options() | QFileDialog::DontUseNativeDialog | extra);
    if (dlg.exec() == QDialog::Accepted && !dlg.selectedFiles().isEmpty())
        return dlg.selectedFiles().first();
    return {};
}

// ================================
//  CORE
// ================================
MainWindow::MainWindow(const annot::AppConfig& cfg, const QString& configPath, QWidget* parent)
    : QMainWindow(parent)
    , m_cfg(cfg)
    , m_configPath(configPath)
{
    setWindowTitle(tr("Assisted Annotator"));
    resize(1400, 900);

    m_engine   = new annot::InteractionEngine(this);
    m_detector = new annot::ProcessDetector(this);
    m_session  = new annot::SessionController(m_engine, this);

    m_session->setConfig(m_cfg);
    applyDetectorConfig();
    m_session->setDetector(m_detector);

    // ---- Canvas in a scroll area (2x zoom can exceed the window)
    m_canvas = new AnnotatorWidget(m_engine);
    m_canvas->setClassNames(m_cfg.goodName, m_cfg.badName);
    // one decode per image: the canvas keeps the pixels, the session gets the size
    m_session->setImageSizeProbe([this](const QString& path) {
        return m_canvas->loadImage(path) ? m_canvas->imageSize() : QSize();
    });

    m_scroll = new QScrollArea;
    m_scroll->setWidgetResizable(true);
    m_scroll->setAlignment(Qt::AlignCenter);
    m_scroll->setBackgroundRole(QPalette::Dark);
    m_scroll->setWidget(m_canvas);

    auto* splitter = new QSplitter(Qt::Horizontal, this);
    splitter->addWidget(buildSidebar());
    splitter->addWidget(m_scroll);
    splitter->setStretchFactor(0, 0);
    splitter->setStretchFactor(1, 1);
    splitter->setSizes({300, 1100});
    setCentralWidget(splitter);

    statusBar()->showMessage(tr("Load a dataset to start"), 3000);

    buildShortcuts();
    connectSession();

    onModeChanged(m_session->mode());
    onConfidenceChanged(m_session->confidenceThreshold());
    updateModelLabel();
    updateStatus();

    m_canvas->setFocus();
}

MainWindow::~MainWindow() = default;

QWidget* MainWindow::buildSidebar()
{
    auto* side = new QWidget;
    auto* lay  = new QVBoxLayout(side);
    side->setMinimumWidth(260);
    side->setMaximumWidth(380);

    // keyboard shortcuts belong to the canvas
    auto noFocus = [](QWidget* w) { w->setFocusPolicy(Qt::NoFocus); return w; };

    // ---- Dataset
    auto* gbData  = new QGroupBox(tr("Dataset"));
    auto* layData = new QVBoxLayout(gbData);
    m_btnDataset  = new QPushButton(tr("Load Dataset..."));
    noFocus(m_btnDataset);
    layData->addWidget(m_btnDataset);

    auto* laySplit = new QHBoxLayout;
    m_splitGroup   = new QButtonGroup(this);
    const QStringList& splits = annot::lu::datasetSplits();
    for (int i = 0; i < splits.size(); ++i) {
        auto* rb = new QRadioButton(splits[i]);
        noFocus(rb);
        rb->setChecked(splits[i] == m_cfg.split);
        m_splitGroup->addButton(rb, i);
        laySplit->addWidget(rb);
    }
    layData->addLayout(laySplit);
    lay->addWidget(gbData);

    // ---- Model
    auto* gbModel  = new QGroupBox(tr("Model"));
    auto* layModel = new QVBoxLayout(gbModel);
    m_btnModel     = new QPushButton(tr("Load YOLO Model..."));
    noFocus(m_btnModel);
    m_modelLabel   = new QLabel;
    m_modelLabel->setWordWrap(true);
    layModel->addWidget(m_btnModel);
    layModel->addWidget(m_modelLabel);
    lay->addWidget(gbModel);

    // ---- Box source
    auto* gbMode  = new QGroupBox(tr("Box source (Tab)"));
    auto* layMode = new QVBoxLayout(gbMode);
    m_rbPrediction = new QRadioButton(tr("Prediction"));
    m_rbDataset    = new QRadioButton(tr("Dataset labels"));
    noFocus(m_rbPrediction);
    noFocus(m_rbDataset);
    layMode->addWidget(m_rbPrediction);
    layMode->addWidget(m_rbDataset);

    m_confLabel  = new QLabel;
    m_confSlider = new QSlider(Qt::Horizontal);
    noFocus(m_confSlider);
    m_confSlider->setRange(0, 100);
    m_confSlider->setValue(int(std::lround(m_cfg.confidence * 100)));
    layMode->addWidget(m_confLabel);
    layMode->addWidget(m_confSlider);
    lay->addWidget(gbMode);

    // ---- Navigation
    auto* gbNav  = new QGroupBox(tr("Navigation"));
    auto* layNav = new QVBoxLayout(gbNav);

    auto* layPrevNext = new QHBoxLayout;
    auto* btnPrev = new QPushButton(tr("< Prev"));
    auto* btnNext = new QPushButton(tr("Next >"));
    noFocus(btnPrev);
    noFocus(btnNext);
    layPrevNext->addWidget(btnPrev);
    layPrevNext->addWidget(btnNext);
    layNav->addLayout(layPrevNext);

    auto* layGoto = new QHBoxLayout;
    m_gotoEdit    = new QLineEdit;
    m_gotoEdit->setPlaceholderText(tr("Image number"));
    m_gotoEdit->setValidator(new QIntValidator(1, 1000000, m_gotoEdit));
    auto* btnGo   = new QPushButton(tr("Go"));
    noFocus(btnGo);
    layGoto->addWidget(m_gotoEdit);
    layGoto->addWidget(btnGo);
    layNav->addLayout(layGoto);

    m_progressLabel = new QLabel(tr("No images"));
    m_progressBar   = new QProgressBar;
    m_progressBar->setTextVisible(false);
    m_progressBar->setRange(0, 1);
    m_progressBar->setValue(0);
    m_fileLabel     = new QLabel;
    m_fileLabel->setWordWrap(true);
    m_fileLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
    layNav->addWidget(m_progressLabel);
    layNav->addWidget(m_progressBar);
    layNav->addWidget(m_fileLabel);
    lay->addWidget(gbNav);

    // ---- Edit
    auto* gbEdit  = new QGroupBox(tr("Edit"));
    auto* layEdit = new QVBoxLayout(gbEdit);
    auto* btnRefresh = new QPushButton(tr("Refresh Image (Q)"));
    auto* btnDelete  = new QPushButton(tr("Delete Selected Box"));
    auto* btnSave    = new QPushButton(tr("Save (Ctrl+S)"));
    auto* btnClear   = new QPushButton(tr("Clear All Annotations"));
    noFocus(btnRefresh);
    noFocus(btnDelete);
    noFocus(btnSave);
    noFocus(btnClear);
    m_chkConfirmDelete = new QCheckBox(tr("Confirm before delete"));
    noFocus(m_chkConfirmDelete);
    m_chkConfirmDelete->setChecked(m_cfg.confirmDelete);
    m_chkHandles = new QCheckBox(tr("Enable box resizing (R)"));
    noFocus(m_chkHandles);
    m_chkHandles->setChecked(m_engine->resizeHandlesEnabled());

    // class given to newly drawn boxes
    auto* layClass = new QHBoxLayout;
    m_rbNewGood = new QRadioButton(m_cfg.goodName);
    m_rbNewBad  = new QRadioButton(m_cfg.badName);
    noFocus(m_rbNewGood);
    noFocus(m_rbNewBad);
    m_rbNewGood->setChecked(m_engine->defaultClass() == annot::ClassLabel::Good);
    m_rbNewBad->setChecked(m_engine->defaultClass() == annot::ClassLabel::Bad);
    auto* classGroup = new QButtonGroup(this);
    classGroup->addButton(m_rbNewGood);
    classGroup->addButton(m_rbNewBad);
    layClass->addWidget(new QLabel(tr("New box:")));
    layClass->addWidget(m_rbNewGood);
    layClass->addWidget(m_rbNewBad);

    auto* layZoom = new QHBoxLayout;
    m_rbZoom1 = new QRadioButton(tr("1x"));
    m_rbZoom2 = new QRadioButton(tr("2x"));
    noFocus(m_rbZoom1);
    noFocus(m_rbZoom2);
    m_rbZoom1->setChecked(true);
    auto* zoomGroup = new QButtonGroup(this);
    zoomGroup->addButton(m_rbZoom1, 1);
    zoomGroup->addButton(m_rbZoom2, 2);
    layZoom->addWidget(new QLabel(tr("Zoom (Z):")));
    layZoom->addWidget(m_rbZoom1);
    layZoom->addWidget(m_rbZoom2);

    m_stateLabel = new QLabel;
    layEdit->addWidget(btnRefresh);
    layEdit->addWidget(btnDelete);
    layEdit->addWidget(m_chkConfirmDelete);
    layEdit->addWidget(btnClear);
    layEdit->addWidget(btnSave);
    layEdit->addWidget(m_chkHandles);
    layEdit->addLayout(layClass);
    layEdit->addLayout(layZoom);
    layEdit->addWidget(m_stateLabel);
    lay->addWidget(gbEdit);

    auto* help = new QLabel(tr("D delete  W class  R handles  Z zoom\n"
                               "Q refresh  Tab source  Left/Right image\n"
                               "Esc cancel drag"));
    help->setStyleSheet("color: gray;");
    lay->addWidget(help);

    // ---- Log
    m_log = new QPlainTextEdit;
    m_log->setReadOnly(true);
    m_log->setMaximumBlockCount(2000);
    m_log->setFocusPolicy(Qt::ClickFocus);
    lay->addWidget(m_log, 1);

    // ---- Button wiring
    connect(m_btnDataset, &QPushButton::clicked, this, &MainWindow::chooseDataset);
    connect(m_btnModel,   &QPushButton::clicked, this, &MainWindow::loadModel);
    connect(btnPrev,      &QPushButton::clicked, m_session, &annot::SessionController::previous);
    connect(btnNext,      &QPushButton::clicked, m_session, &annot::SessionController::next);
    connect(btnGo,        &QPushButton::clicked, this, &MainWindow::goToImage);
    connect(m_gotoEdit,   &QLineEdit::returnPressed, this, &MainWindow::goToImage);
    connect(btnRefresh,   &QPushButton::clicked, this, &MainWindow::refreshImage);
    connect(btnDelete,    &QPushButton::clicked, this, &MainWindow::deleteSelected);
    connect(btnSave,      &QPushButton::clicked, this, &MainWindow::saveCurrent);
    connect(btnClear,     &QPushButton::clicked, this, &MainWindow::clearAll);

    connect(m_chkHandles, &QCheckBox::toggled, m_engine, &annot::InteractionEngine::setResizeHandlesEnabled);
    connect(m_rbNewGood,  &QRadioButton::toggled, this, [this](bool on){
        m_engine->setDefaultClass(on ? annot::ClassLabel::Good : annot::ClassLabel::Bad);
    });
    connect(zoomGroup, &QButtonGroup::idClicked, this, [this](int zoom){
        if (m_engine->setZoom(zoom) != Status::Ok) syncZoomRadios(m_engine->view().zoomFactor);
    });

    connect(m_splitGroup, &QButtonGroup::idClicked, this, [this](int id){
        const QString split = annot::lu::datasetSplits().value(id);
        if (m_session->setSplit(split)) {
            m_cfg.split = split;
            return;
        }
        // refused (bad layout or unsaved edits): show the split we are still on
        const int cur = annot::lu::datasetSplits().indexOf(m_session->split());
        if (QAbstractButton* b = m_splitGroup->button(cur)) b->setChecked(true);
    });

    connect(m_rbPrediction, &QRadioButton::clicked, this, [this]{ m_session->setMode(SourceMode::Prediction); });
    connect(m_rbDataset,    &QRadioButton::clicked, this, [this]{ m_session->setMode(SourceMode::Dataset); });

    connect(m_confSlider, &QSlider::valueChanged, this, [this](int v){
        m_confLabel->setText(tr("Confidence: %1").arg(v / 100.0, 0, 'f', 2));
        if (!m_confSlider->isSliderDown())
            m_session->setConfidenceThreshold(v / 100.0);
    });
    // while dragging only the label follows; inference runs on release
    connect(m_confSlider, &QSlider::sliderReleased, this, [this]{
        m_session->setConfidenceThreshold(m_confSlider->value() / 100.0);
    });

    connect(m_chkConfirmDelete, &QCheckBox::toggled, this, [this](bool on){ m_cfg.confirmDelete = on; });

    return side;
}

void MainWindow::buildShortcuts()
{
    auto bind = [this](const QKeySequence& key, auto slot) {
        auto* sc = new QShortcut(key, this);
        connect(sc, &QShortcut::activated, this, slot);
    };

    bind(QKeySequence(Qt::Key_D),     &MainWindow::deleteHovered);
    bind(QKeySequence(Qt::Key_W),     &MainWindow::toggleClassOfHovered);
    bind(QKeySequence(Qt::Key_R),     &MainWindow::toggleResizeHandles);
    bind(QKeySequence(Qt::Key_Z),     &MainWindow::toggleZoom);
    bind(QKeySequence(Qt::Key_Q),     &MainWindow::refreshImage);
    bind(QKeySequence(Qt::Key_Tab),   [this]{ m_session->toggleMode(); });
    bind(QKeySequence(Qt::Key_Left),  [this]{ m_session->previous(); });
    bind(QKeySequence(Qt::Key_Right), [this]{ m_session->next(); });
    bind(QKeySequence::Save,          &MainWindow::saveCurrent);
}

void MainWindow::connectSession()
{
    connect(m_session, &annot::SessionController::imageChanged,      this, &MainWindow::onImageChanged);
    connect(m_session, &annot::SessionController::modeChanged,       this, &MainWindow::onModeChanged);
    connect(m_session, &annot::SessionController::confidenceChanged, this, &MainWindow::onConfidenceChanged);
    connect(m_session, &annot::SessionController::warning,           this, &MainWindow::onWarning);
    connect(m_session, &annot::SessionController::blockingError,     this, &MainWindow::onBlockingError);
    connect(m_session, &annot::SessionController::log,               this, &MainWindow::appendLog);

    connect(m_session, &annot::SessionController::inferenceStarted, this, [this]{
        m_canvas->setBusy(true);
        statusBar()->showMessage(tr("Running inference..."));
    });
    connect(m_session, &annot::SessionController::inferenceFailed, this, [this](const QString& msg){
        m_canvas->setBusy(false);
        qWarning() << "[Annotator] inference failed:" << msg;
        statusBar()->showMessage(msg, 5000);
        appendLog(tr("Inference failed: %1").arg(msg));
    });
    connect(m_session, &annot::SessionController::annotationsReplaced, this, [this]{
        m_canvas->setBusy(m_session->isInferencePending());
        if (!m_session->isInferencePending()) statusBar()->clearMessage();
        updateStatus();
    });
    connect(m_session, &annot::SessionController::saved, this, [this](const QString& path){
        statusBar()->showMessage(tr("Saved: %1").arg(path), 3000);
        updateStatus();
    });

    connect(m_engine, &annot::InteractionEngine::annotationsChanged,   this, &MainWindow::updateStatus);
    connect(m_engine, &annot::InteractionEngine::zoomChanged, this, [this](int zoom){
        syncZoomRadios(zoom);
        updateStatus();
    });
    connect(m_engine, &annot::InteractionEngine::resizeHandlesChanged, this, [this](bool on){
        const QSignalBlocker b(m_chkHandles);
        m_chkHandles->setChecked(on);
        updateStatus();
    });

    connect(m_canvas, &AnnotatorWidget::log, this, &MainWindow::appendLog);
}

// ================================
//  Dataset / model
// ================================
void MainWindow::chooseDataset()
{
    const QString start = m_session->datasetRoot().isEmpty()
                              ? QStandardPaths::writableLocation(QStandardPaths::PicturesLocation)
                              : m_session->datasetRoot();

    QString dir = getExistingDirectorySafe(
        this, tr("Select dataset root (contains train/valid/test)"), start,
        QFileDialog::ShowDirsOnly | QFileDialog::DontResolveSymlinks);
    if (dir.isEmpty()) return;

    dir = annot::lu::sanitizeDirLike(dir);
    if (m_session->openDataset(dir, m_session->split()))
        m_cfg.datasetRoot = dir;
}

bool MainWindow::openConfiguredDataset()
{
    if (m_cfg.datasetRoot.isEmpty()) return true;
    return m_session->openDataset(m_cfg.datasetRoot, m_cfg.split);
}

void MainWindow::applyDetectorConfig()
{
    m_detector->setPython(m_cfg.python);
    m_detector->setScript(m_cfg.predictScript);
    m_detector->setEnvironment(makePythonEnv());
    if (!m_cfg.modelPath.isEmpty() && !m_detector->setModelPath(m_cfg.modelPath))
        appendLog(tr("Model not found: %1").arg(m_cfg.modelPath));
}

void MainWindow::loadModel()
{
    const QString start = m_cfg.modelPath.isEmpty()
                              ? QDir::homePath()
                              : QFileInfo(m_cfg.modelPath).absolutePath();
    const QString path = getOpenFileNameSafe(
        this, tr("Select YOLO model"), start,
        tr("YOLO model (*.pt *.onnx);;All Files (*)"));
    if (path.isEmpty()) return;

    if (!m_detector->setModelPath(path)) {
        QMessageBox::warning(this, tr("Model"), tr("Failed to load model:\n%1").arg(path));
        return;
    }
    m_cfg.modelPath = path;
    updateModelLabel();
    appendLog(tr("Model loaded: %1").arg(path));

    if (!QFileInfo::exists(m_cfg.predictScript))
        appendLog(tr("Predictor script missing: %1").arg(m_cfg.predictScript));

    // re-run the current image with the new model
    if (m_session->mode() == SourceMode::Prediction && m_session->flush())
        m_session->refresh();
}

void MainWindow::updateModelLabel()
{
    const QString name = m_detector->modelName();
    m_modelLabel->setText(name.isEmpty() ? tr("Model: none") : tr("Model: %1").arg(name));
}

// ================================
//  Keyboard commands
// ================================
void MainWindow::deleteHovered()
{
    const annot::AnnotationSet* set = m_engine->annotations();
    if (!set || set->hovered() == annot::kNoBox || !m_engine->isIdle()) return;

    if (m_chkConfirmDelete->isChecked()) {
        const auto answer = QMessageBox::question(
            this, tr("Confirm Delete"), tr("Are you sure you want to delete this box?"),
            QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
        if (answer != QMessageBox::Yes) return;
    }

    const Status st = m_engine->deleteHovered();
    if (!annot::isOk(st))
        qDebug() << "[Annotator] delete:" << st;
}

void MainWindow::deleteSelected()
{
    const annot::AnnotationSet* set = m_engine->annotations();
    if (!set || set->selected() == annot::kNoBox) {
        statusBar()->showMessage(tr("Click a box to select it first"), 2000);
        return;
    }

    if (m_chkConfirmDelete->isChecked()) {
        const auto answer = QMessageBox::question(
            this, tr("Confirm Delete"), tr("Are you sure you want to delete this box?"),
            QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
        if (answer != QMessageBox::Yes) return;
    }

    const Status st = m_engine->deleteSelected();
    if (!annot::isOk(st))
        qDebug() << "[Annotator] delete selected:" << st;
}

void MainWindow::toggleClassOfHovered()
{
    const Status st = m_engine->toggleClassOfHovered();
    if (st == Status::Busy) statusBar()->showMessage(tr("Finish the drag first"), 2000);
}

void MainWindow::toggleResizeHandles()
{
    m_engine->toggleResizeHandles();
    statusBar()->showMessage(m_engine->resizeHandlesEnabled() ? tr("Resize handles on")
                                                              : tr("Resize handles off"), 2000);
}

void MainWindow::toggleZoom()
{
    const Status st = m_engine->toggleZoom();
    if (st == Status::Busy) statusBar()->showMessage(tr("Finish the drag first"), 2000);
}

void MainWindow::refreshImage()
{
    const Status st = m_engine->requestRefresh();
    if (st == Status::Busy) statusBar()->showMessage(tr("Finish the drag first"), 2000);
}

void MainWindow::clearAll()
{
    const annot::AnnotationSet* set = m_engine->annotations();
    if (!set || set->isEmpty()) return;

    const auto answer = QMessageBox::question(
        this, tr("Clear All"), tr("Remove all %1 boxes from this image?").arg(set->size()),
        QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
    if (answer != QMessageBox::Yes) return;

    if (!m_session->clearAnnotations())
        statusBar()->showMessage(tr("Finish the drag first"), 2000);
}

void MainWindow::saveCurrent()
{
    if (!m_session->annotations()) {
        statusBar()->showMessage(tr("Nothing to save"), 2000);
        return;
    }
    m_session->save();
}

void MainWindow::goToImage()
{
    bool ok = false;
    const int n = m_gotoEdit->text().trimmed().toInt(&ok);
    if (!ok) {
        onWarning(tr("Please enter a valid number."));
        return;
    }
    if (m_session->jumpTo(n)) {
        m_gotoEdit->clear();
        m_canvas->setFocus();
    }
}

// ================================
//  Session feedback
// ================================
void MainWindow::onImageChanged(const QString& path, int index, int total)
{
    m_canvas->relayout();

    m_progressLabel->setText(tr("Image %1 / %2").arg(index + 1).arg(total));
    m_progressBar->setRange(0, std::max(1, total));
    m_progressBar->setValue(index + 1);
    m_fileLabel->setText(QFileInfo(path).fileName());
    setWindowTitle(tr("Assisted Annotator - %1").arg(QFileInfo(path).fileName()));
    updateStatus();
}

void MainWindow::onModeChanged(SourceMode mode)
{
    const QSignalBlocker b1(m_rbPrediction);
    const QSignalBlocker b2(m_rbDataset);
    m_rbPrediction->setChecked(mode == SourceMode::Prediction);
    m_rbDataset->setChecked(mode == SourceMode::Dataset);
    m_confSlider->setEnabled(mode == SourceMode::Prediction);
    m_cfg.mode = mode;
    appendLog(tr("Box source: %1").arg(annot::sourceModeName(mode)));
}

void MainWindow::onConfidenceChanged(double threshold)
{
    m_cfg.confidence = threshold;
    const QSignalBlocker b(m_confSlider);
    m_confSlider->setValue(int(std::lround(threshold * 100)));
    m_confLabel->setText(tr("Confidence: %1").arg(threshold, 0, 'f', 2));
}

void MainWindow::onWarning(const QString& msg)
{
    qWarning() << "[Annotator]" << msg;
    statusBar()->showMessage(msg, 5000);
    appendLog(msg);
}

void MainWindow::onBlockingError(const QString& msg)
{
    qWarning() << "[Annotator] error:" << msg;
    appendLog(msg);
    QMessageBox::critical(this, tr("Error"), msg);
}

void MainWindow::syncZoomRadios(int zoom)
{
    const QSignalBlocker b1(m_rbZoom1);
    const QSignalBlocker b2(m_rbZoom2);
    m_rbZoom1->setChecked(zoom == 1);
    m_rbZoom2->setChecked(zoom == 2);
}

void MainWindow::appendLog(const QString& line)
{
    if (m_log) m_log->appendPlainText(line);
}

void MainWindow::updateStatus()
{
    const annot::AnnotationSet* set = m_engine->annotations();
    QStringList parts;
    parts << tr("Zoom %1x").arg(m_engine->view().zoomFactor);
    parts << (m_engine->resizeHandlesEnabled() ? tr("Handles on") : tr("Handles off"));
    if (set) {
        parts << tr("%1 boxes").arg(set->size());
        if (set->isModified()) parts << tr("unsaved");
    } else if (m_session->isInferencePending()) {
        parts << tr("predicting...");
    }
    m_stateLabel->setText(parts.join(QStringLiteral(" | ")));
}

void MainWindow::closeEvent(QCloseEvent* e)
{
    if (!m_session->flush()) {
        const auto answer = QMessageBox::question(
            this, tr("Unsaved changes"),
            tr("The current annotations could not be saved. Quit anyway?"),
            QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
        if (answer != QMessageBox::Yes) {
            e->ignore();
            return;
        }
    }

    m_cfg.split = m_session->split();
    if (!m_session->datasetRoot().isEmpty()) m_cfg.datasetRoot = m_session->datasetRoot();
    if (!m_configPath.isEmpty() && !annot::saveConfig(m_cfg, m_configPath))
        qWarning() << "[Annotator] config not saved:" << m_configPath;

    e->accept();
}
