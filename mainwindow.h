#pragma once

#include "app_config.h"

#include <QFileDialog>          // QFileDialog::Options
#include <QMainWindow>
#include <QProcessEnvironment>
#include <QString>

namespace annot {
class InteractionEngine;
class SessionController;
class ProcessDetector;
}

class AnnotatorWidget;

class QButtonGroup;
class QCheckBox;
class QLabel;
class QLineEdit;
class QPlainTextEdit;
class QProgressBar;
class QPushButton;
class QRadioButton;
class QScrollArea;
class QSlider;
class QCloseEvent;

class MainWindow : public QMainWindow
{
    Q_OBJECT
public:
    explicit MainWindow(const annot::AppConfig& cfg, const QString& configPath,
                        QWidget* parent = nullptr);
    ~MainWindow() override;

    // Opens cfg.datasetRoot if one is set; returns false on a bad layout.
    bool openConfiguredDataset();

protected:
    void closeEvent(QCloseEvent* e) override;

private slots:
    // Dataset / model
    void chooseDataset();
    void loadModel();

    // Keyboard commands
    void deleteHovered();
    void deleteSelected();
    void toggleClassOfHovered();
    void toggleResizeHandles();
    void toggleZoom();
    void refreshImage();
    void clearAll();
    void saveCurrent();
    void goToImage();

    // Session feedback
    void onImageChanged(const QString& path, int index, int total);
    void onModeChanged(annot::SourceMode mode);
    void onConfidenceChanged(double threshold);
    void onWarning(const QString& msg);
    void onBlockingError(const QString& msg);
    void appendLog(const QString& line);

private:
    // -------- Construction --------
    QWidget* buildSidebar();
    void     buildShortcuts();
    void     connectSession();

    // -------- Helpers --------
    void    applyDetectorConfig();
    void    updateModelLabel();
    void    updateStatus();
    void    syncZoomRadios(int zoom);
    QProcessEnvironment makePythonEnv() const;

    QString getExistingDirectorySafe(QWidget* parent, const QString& title,
                                     const QString& dir,
                                     QFileDialog::Options options = QFileDialog::Options()) const;
    QString getOpenFileNameSafe(QWidget* parent, const QString& title,
                                const QString& dir, const QString& filter = QString(),
                                QFileDialog::Options options = QFileDialog::Options()) const;

private:
    annot::AppConfig          m_cfg;
    QString                   m_configPath;

    annot::InteractionEngine* m_engine   = nullptr;
    annot::SessionController* m_session  = nullptr;
    annot::ProcessDetector*   m_detector = nullptr;

    AnnotatorWidget*          m_canvas   = nullptr;
    QScrollArea*              m_scroll   = nullptr;

    // Sidebar
    QPushButton*    m_btnDataset   = nullptr;
    QPushButton*    m_btnModel     = nullptr;
    QLabel*         m_modelLabel   = nullptr;
    QRadioButton*   m_rbPrediction = nullptr;
    QRadioButton*   m_rbDataset    = nullptr;
    QButtonGroup*   m_splitGroup   = nullptr;
    QSlider*        m_confSlider   = nullptr;
    QLabel*         m_confLabel    = nullptr;
    QLineEdit*      m_gotoEdit     = nullptr;
    QLabel*         m_progressLabel = nullptr;
    QProgressBar*   m_progressBar  = nullptr;
    QLabel*         m_fileLabel    = nullptr;
    QLabel*         m_stateLabel   = nullptr;
    QCheckBox*      m_chkConfirmDelete = nullptr;
    QCheckBox*      m_chkHandles   = nullptr;
    QRadioButton*   m_rbNewGood    = nullptr;
    QRadioButton*   m_rbNewBad     = nullptr;
    QRadioButton*   m_rbZoom1      = nullptr;
    QRadioButton*   m_rbZoom2      = nullptr;
    QPlainTextEdit* m_log          = nullptr;
};
