#include "app_config.h"
#include "label_utils.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>

#include <algorithm>

namespace annot {

QString sourceModeName(SourceMode m)
{
    return m == SourceMode::Dataset ? QStringLiteral("dataset") : QStringLiteral("prediction");
}

bool parseSourceMode(const QString& s, SourceMode* out)
{
    const QString v = s.trimmed().toLower();
    if (v == "prediction" || v == "predict") { *out = SourceMode::Prediction; return true; }
    if (v == "dataset")                      { *out = SourceMode::Dataset;    return true; }
    return false;
}

QString defaultConfigPath()
{
    const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(dir).filePath("assisted_annotator.ini");
}

static QString defaultPredictScript()
{
    const QString appDir = QCoreApplication::instance()
                               ? QCoreApplication::applicationDirPath()
                               : QDir::currentPath();
    return QDir::toNativeSeparators(QDir(appDir).filePath("scripts/yolo_predict.py"));
}

// Both ids must be non-negative and distinct, or Bad boxes would not survive
// a save/load cycle.
static ClassIdMapping checkedClassIds(const ClassIdMapping& m, const char* table)
{
    if (m.goodId >= 0 && m.badId >= 0 && m.goodId != m.badId)
        return m;
    qWarning() << "[Config]" << table << "class ids invalid: good =" << m.goodId
               << "bad =" << m.badId << "- using defaults";
    return ClassIdMapping{};
}

// =========================
// INI
// =========================
AppConfig loadConfig(const QString& iniPath)
{
    AppConfig c;
    QSettings s(iniPath, QSettings::IniFormat);

    s.beginGroup("session");
    c.datasetRoot = s.value("datasetRoot", c.datasetRoot).toString();
    c.split       = s.value("split", c.split).toString();
    parseSourceMode(s.value("mode", sourceModeName(c.mode)).toString(), &c.mode);
    c.autosaveSec = std::max(0, s.value("autosaveSec", c.autosaveSec).toInt());
    c.precision   = std::max(kMinPrecision, s.value("precision", c.precision).toInt());
    s.endGroup();

    s.beginGroup("detector");
    c.modelPath     = s.value("model", c.modelPath).toString();
    c.python        = s.value("python", c.python).toString();
    c.predictScript = s.value("script", c.predictScript).toString();
    c.confidence    = std::clamp(s.value("confidence", c.confidence).toDouble(), 0.0, 1.0);
    s.endGroup();

    s.beginGroup("classes");
    c.datasetClasses.goodId = s.value("datasetGoodId", c.datasetClasses.goodId).toInt();
    c.datasetClasses.badId  = s.value("datasetBadId",  c.datasetClasses.badId).toInt();
    c.modelClasses.goodId   = s.value("modelGoodId",   c.modelClasses.goodId).toInt();
    c.modelClasses.badId    = s.value("modelBadId",    c.modelClasses.badId).toInt();
    c.goodName              = s.value("goodName", c.goodName).toString();
    c.badName               = s.value("badName",  c.badName).toString();
    s.endGroup();

    s.beginGroup("editor");
    c.engine.handleSizePx     = s.value("handleSizePx",     c.engine.handleSizePx).toDouble();
    c.engine.hoverTolerancePx = s.value("hoverTolerancePx", c.engine.hoverTolerancePx).toDouble();
    c.engine.minBoxSizePx     = s.value("minBoxSizePx",     c.engine.minBoxSizePx).toDouble();
    c.confirmDelete           = s.value("confirmDelete",    c.confirmDelete).toBool();
    s.endGroup();

    if (c.predictScript.isEmpty())
        c.predictScript = defaultPredictScript();

    c.datasetClasses = checkedClassIds(c.datasetClasses, "dataset");
    c.modelClasses   = checkedClassIds(c.modelClasses, "model");

    qDebug() << "[Config] loaded" << iniPath << "status =" << s.status();
    return c;
}

bool saveConfig(const AppConfig& c, const QString& iniPath)
{
    QSettings s(iniPath, QSettings::IniFormat);

    s.beginGroup("session");
    s.setValue("datasetRoot", c.datasetRoot);
    s.setValue("split",       c.split);
    s.setValue("mode",        sourceModeName(c.mode));
    s.setValue("autosaveSec", c.autosaveSec);
    s.setValue("precision",   c.precision);
    s.endGroup();

    s.beginGroup("detector");
    s.setValue("model",      c.modelPath);
    s.setValue("python",     c.python);
    s.setValue("script",     c.predictScript);
    s.setValue("confidence", c.confidence);
    s.endGroup();

    s.beginGroup("classes");
    s.setValue("datasetGoodId", c.datasetClasses.goodId);
    s.setValue("datasetBadId",  c.datasetClasses.badId);
    s.setValue("modelGoodId",   c.modelClasses.goodId);
    s.setValue("modelBadId",    c.modelClasses.badId);
    s.setValue("goodName",      c.goodName);
    s.setValue("badName",       c.badName);
    s.endGroup();

    s.beginGroup("editor");
    s.setValue("handleSizePx",     c.engine.handleSizePx);
    s.setValue("hoverTolerancePx", c.engine.hoverTolerancePx);
    s.setValue("minBoxSizePx",     c.engine.minBoxSizePx);
    s.setValue("confirmDelete",    c.confirmDelete);
    s.endGroup();

    s.sync();
    if (s.status() != QSettings::NoError) {
        qWarning() << "[Config] save failed:" << iniPath << s.status();
        return false;
    }
    return true;
}

// =========================
// Command line
// =========================
void addCommandLineOptions(QCommandLineParser& parser)
{
    parser.addOptions({
        {{"d", "dataset"},  "Dataset root (<root>/<split>/images).", "dir"},
        {{"s", "split"},    "Dataset split: train, valid or test.", "split"},
        {{"m", "mode"},     "Box source: prediction or dataset.", "mode"},
        {"model",           "YOLO model file for prediction mode.", "file"},
        {"python",          "Python interpreter for the predictor.", "exe"},
        {"script",          "Predictor script.", "file"},
        {{"c", "confidence"}, "Confidence threshold in [0,1].", "value"},
        {"config",          "INI configuration file.", "file"},
    });
}

bool applyCommandLine(const QCommandLineParser& parser, AppConfig* cfg, QString* error)
{
    auto fail = [error](const QString& msg) {
        if (error) *error = msg;
        qWarning() << "[Config]" << msg;
        return false;
    };

    if (parser.isSet("dataset"))
        cfg->datasetRoot = lu::sanitizeDirLike(parser.value("dataset"));

    if (parser.isSet("split")) {
        const QString split = parser.value("split").trimmed().toLower();
        if (!lu::datasetSplits().contains(split))
            return fail(QStringLiteral("unknown split \"%1\"").arg(split));
        cfg->split = split;
    }

    if (parser.isSet("mode") && !parseSourceMode(parser.value("mode"), &cfg->mode))
        return fail(QStringLiteral("unknown mode \"%1\"").arg(parser.value("mode")));

    if (parser.isSet("model"))  cfg->modelPath     = parser.value("model");
    if (parser.isSet("python")) cfg->python        = parser.value("python");
    if (parser.isSet("script")) cfg->predictScript = parser.value("script");

    if (parser.isSet("confidence")) {
        bool ok = false;
        const double v = parser.value("confidence").toDouble(&ok);
        if (!ok || v < 0.0 || v > 1.0)
            return fail(QStringLiteral("confidence must be in [0,1], got \"%1\"")
                            .arg(parser.value("confidence")));
        cfg->confidence = v;
    }
    return true;
}

} // namespace annot
