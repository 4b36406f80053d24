#include "detector.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QTimer>

#include <cmath>

namespace annot {

QVector<Prediction> parsePredictionOutput(const QString& text, QStringList* logLines)
{
    QVector<Prediction> out;
    static const QRegularExpression ws(QStringLiteral("\\s+"));

    const QStringList lines = text.split(QLatin1Char('\n'));
    for (const QString& raw : lines) {
        const QString line = raw.trimmed();
        if (line.isEmpty()) continue;

        const QStringList t = line.split(ws, Qt::SkipEmptyParts);
        bool ok = (t.size() == 6);

        Prediction p;
        double v[5] = {};
        if (ok) p.classId = t[0].toInt(&ok);
        for (int k = 0; ok && k < 5; ++k) {
            v[k] = t[k + 1].toDouble(&ok);
            if (ok && !std::isfinite(v[k])) ok = false;
        }

        if (!ok) {
            if (logLines) logLines->append(line);
            continue;
        }
        p.cx = v[0]; p.cy = v[1]; p.w = v[2]; p.h = v[3]; p.confidence = v[4];
        out.push_back(p);
    }
    return out;
}

// =========================
// ProcessDetector
// =========================
ProcessDetector::ProcessDetector(QObject* parent)
    : Detector(parent)
{
    qRegisterMetaType<annot::InferenceResult>("annot::InferenceResult");
}

ProcessDetector::~ProcessDetector()
{
    killProcess();
}

bool ProcessDetector::setModelPath(const QString& model)
{
    if (!model.isEmpty() && !QFileInfo::exists(model)) {
        qWarning() << "[Detector] model not found:" << model;
        return false;
    }
    m_modelPath = model;
    qDebug() << "[Detector] model =" << m_modelPath;
    return true;
}

bool ProcessDetector::isReady() const
{
    return !m_modelPath.isEmpty() && !m_script.isEmpty() && QFileInfo::exists(m_script);
}

QString ProcessDetector::modelName() const
{
    return m_modelPath.isEmpty() ? QString() : QFileInfo(m_modelPath).fileName();
}

void ProcessDetector::killProcess()
{
    if (!m_proc) return;
    m_proc->disconnect(this);
    m_proc->kill();
    m_proc->deleteLater();
    m_proc = nullptr;
    m_stdout.clear();
}

void ProcessDetector::cancel()
{
    if (m_current != 0)
        qDebug() << "[Detector] cancel request" << m_current;
    killProcess();
    m_current = 0;
}

Detector::RequestId ProcessDetector::predict(const QString& imagePath, double confidenceThreshold)
{
    // one in-flight request: a new one replaces the old
    cancel();
    const RequestId id = m_nextId++;

    if (!isReady()) {
        const QString msg = QStringLiteral("predictor script or model missing");
        qWarning() << "[Detector]" << msg;
        QTimer::singleShot(0, this, [this, id, msg]{
            emit finished(id, InferenceResult{false, {}, msg});
        });
        return id;
    }

    m_current = id;
    m_proc    = new QProcess(this);
    m_proc->setProgram(m_python);
    m_proc->setArguments({
        m_script,
        "--model", QDir::toNativeSeparators(m_modelPath),
        "--image", QDir::toNativeSeparators(imagePath),
        "--conf",  QString::number(confidenceThreshold, 'f', 3)
    });
    m_proc->setProcessEnvironment(m_env);
    m_proc->setProcessChannelMode(QProcess::SeparateChannels);

    connect(m_proc, &QProcess::readyReadStandardOutput, this, [this]{
        if (m_proc) m_stdout += m_proc->readAllStandardOutput();
    });
    connect(m_proc, &QProcess::readyReadStandardError, this, [this]{
        if (!m_proc) return;
        const QString s = QString::fromUtf8(m_proc->readAllStandardError()).trimmed();
        if (!s.isEmpty()) emit log(QStringLiteral("[predict] %1").arg(s));
    });
    connect(m_proc, &QProcess::finished, this, &ProcessDetector::onFinished);
    connect(m_proc, &QProcess::errorOccurred, this, [this](QProcess::ProcessError e){
        if (e != QProcess::FailedToStart) return;   // the rest also emit finished()
        const RequestId rid = m_current;
        const QString msg = QStringLiteral("cannot start %1").arg(m_python);
        qWarning() << "[Detector]" << msg;
        killProcess();
        m_current = 0;
        emit finished(rid, InferenceResult{false, {}, msg});
    });

    qDebug() << "[Detector] request" << id << "image =" << imagePath << "conf =" << confidenceThreshold;
    emit log(QStringLiteral("Predicting: %1").arg(QFileInfo(imagePath).fileName()));
    m_proc->start();
    return id;
}

void ProcessDetector::onFinished(int exitCode, QProcess::ExitStatus status)
{
    if (!m_proc) return;
    m_stdout += m_proc->readAllStandardOutput();

    const RequestId id   = m_current;
    const QString   text = QString::fromUtf8(m_stdout);
    m_proc->deleteLater();
    m_proc = nullptr;
    m_stdout.clear();
    m_current = 0;

    InferenceResult r;
    if (status != QProcess::NormalExit || exitCode != 0) {
        r.ok    = false;
        r.error = QStringLiteral("predictor exited with code %1").arg(exitCode);
        qWarning() << "[Detector] request" << id << r.error;
    } else {
        QStringList extra;
        r.ok          = true;
        r.predictions = parsePredictionOutput(text, &extra);
        for (const QString& l : extra) emit log(QStringLiteral("[predict] %1").arg(l));
        qDebug() << "[Detector] request" << id << "->" << r.predictions.size() << "predictions";
    }
    emit finished(id, r);
}

} // namespace annot
