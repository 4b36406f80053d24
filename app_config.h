#pragma once

#include "annotation_codec.h"
#include "interaction_engine.h"

#include <QString>

class QCommandLineParser;

namespace annot {

// Where a freshly loaded image gets its boxes from.
enum class SourceMode { Prediction, Dataset };

QString sourceModeName(SourceMode m);
bool    parseSourceMode(const QString& s, SourceMode* out);

struct AppConfig {
    // --- Session ---
    QString    datasetRoot;
    QString    split = QStringLiteral("train");
    SourceMode mode  = SourceMode::Prediction;
    int        autosaveSec = 60;          // 0 = off
    int        precision   = kDefaultPrecision;

    // --- Detector ---
    QString modelPath;
    QString python = QStringLiteral("python3");
    QString predictScript;                // empty: <app dir>/scripts/yolo_predict.py
    double  confidence = 0.4;

    // --- Classes ---
    ClassIdMapping datasetClasses;        // persisted class_id
    ClassIdMapping modelClasses;          // model's native class ids
    QString goodName = QStringLiteral("good_fin");
    QString badName  = QStringLiteral("bad_fin");

    // --- Editor ---
    EngineOptions engine;
    bool          confirmDelete = true;

    QString labelName(ClassLabel c) const { return c == ClassLabel::Good ? goodName : badName; }
};

QString   defaultConfigPath();
AppConfig loadConfig(const QString& iniPath);
bool      saveConfig(const AppConfig& cfg, const QString& iniPath);

// --dataset --split --mode --model --python --script --confidence --config
void addCommandLineOptions(QCommandLineParser& parser);
bool applyCommandLine(const QCommandLineParser& parser, AppConfig* cfg, QString* error);

} // namespace annot
