#pragma once

#include "annotation_codec.h"

#include <QObject>
#include <QProcess>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>
#include <QVector>

namespace annot {

struct InferenceResult {
    bool                ok = false;
    QVector<Prediction> predictions;
    QString             error;          // InferenceFailure text when !ok
};

// Object-detection collaborator. predict() is asynchronous; the answer
// arrives through finished() carrying the id predict() returned.
class Detector : public QObject
{
    Q_OBJECT
public:
    using RequestId = quint64;

    explicit Detector(QObject* parent = nullptr) : QObject(parent) {}
    ~Detector() override = default;

    virtual bool      isReady() const = 0;
    virtual QString   modelName() const = 0;
    virtual RequestId predict(const QString& imagePath, double confidenceThreshold) = 0;
    // Drops the in-flight request, if any; no finished() follows for it.
    virtual void      cancel() = 0;

signals:
    void finished(quint64 requestId, const annot::InferenceResult& result);
    void log(const QString& line);
};

// Lines "class cx cy w h conf" (normalized) become predictions; anything else
// is collected as log output.
QVector<Prediction> parsePredictionOutput(const QString& text, QStringList* logLines = nullptr);

// Runs the predictor script out of process:
//   <python> <script> --model <model> --image <image> --conf <threshold>
class ProcessDetector : public Detector
{
    Q_OBJECT
public:
    explicit ProcessDetector(QObject* parent = nullptr);
    ~ProcessDetector() override;

    void setPython(const QString& python)    { m_python = python; }
    void setScript(const QString& script)    { m_script = script; }
    void setEnvironment(const QProcessEnvironment& env) { m_env = env; }
    bool setModelPath(const QString& model);
    QString modelPath() const                { return m_modelPath; }

    bool      isReady() const override;
    QString   modelName() const override;
    RequestId predict(const QString& imagePath, double confidenceThreshold) override;
    void      cancel() override;

private:
    void killProcess();
    void onFinished(int exitCode, QProcess::ExitStatus status);

    QString   m_python = QStringLiteral("python3");
    QString   m_script;
    QString   m_modelPath;
    QProcessEnvironment m_env = QProcessEnvironment::systemEnvironment();

    QProcess* m_proc    = nullptr;
    RequestId m_nextId  = 1;
    RequestId m_current = 0;
    QByteArray m_stdout;
};

} // namespace annot

Q_DECLARE_METATYPE(annot::InferenceResult)
