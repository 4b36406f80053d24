// label_utils.h
#pragma once

#include "annotation_codec.h"

#include <QString>
#include <QStringList>
#include <QVector>

namespace annot {
namespace lu {

// Path helper
QString sanitizeDirLike(const QString& in);         // strips quotes, file -> its folder

// Dataset layout: <root>/<split>/images, <root>/<split>/labels
const QStringList& datasetSplits();                 // train, valid, test
const QStringList& imageExtensions();               // lower-case, no dot

struct SplitDirs {
    QString imagesDir;
    QString labelsDir;
};
SplitDirs splitDirs(const QString& root, const QString& split);

// Sorted by file name; macOS "._*" resource forks are skipped.
QStringList listImagesCaseInsensitive(const QString& dir);

// Same base name, ".txt". Without labelsDir the "labels" sibling of the
// image's folder is used (…/images/a.jpg -> …/labels/a.txt).
QString labelPathForImage(const QString& imagePath, const QString& labelsDir = QString());

struct LabelFile {
    AnnotationSet         set;
    QVector<ParseWarning> warnings;
    bool                  missing = false;   // no file yet: zero boxes
};

// A missing file is not an error. Returns false only if an existing file
// can't be read.
bool readLabelFile(const QString& path, const ClassIdMapping& mapping,
                   LabelFile* out, QString* error = nullptr);

// Creates the parent folder when needed.
bool writeLabelFile(const QString& path, const QString& text, QString* error = nullptr);

} // namespace lu
} // namespace annot
