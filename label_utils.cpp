// label_utils.cpp
#include "label_utils.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStringConverter>
#include <QTextStream>

namespace annot {
namespace lu {

QString sanitizeDirLike(const QString& in)
{
    QString s = in.trimmed();

    // file dialogs on Windows sometimes hand back a quoted path
    if (s.startsWith('"') && s.endsWith('"') && s.size() >= 2)
        s = s.mid(1, s.size() - 2);

    // pointing at a file: use its folder
    QFileInfo fi(s);
    if (fi.exists() && fi.isFile())
        s = fi.absolutePath();

    s = QDir::cleanPath(s);
    return QDir::toNativeSeparators(s);
}

const QStringList& datasetSplits()
{
    static const QStringList splits = {"train", "valid", "test"};
    return splits;
}

const QStringList& imageExtensions()
{
    static const QStringList exts = {"png", "jpg", "jpeg", "bmp", "tif", "tiff"};
    return exts;
}

SplitDirs splitDirs(const QString& root, const QString& split)
{
    const QDir base(QDir(root).filePath(split));
    return { QDir::cleanPath(base.filePath("images")),
             QDir::cleanPath(base.filePath("labels")) };
}

QStringList listImagesCaseInsensitive(const QString& dir)
{
    QStringList out;
    QDir d(dir);
    const QStringList files = d.entryList(QDir::Files | QDir::Readable, QDir::Name);
    for (const QString& f : files) {
        if (f.startsWith("._")) continue;
        const QString ext = QFileInfo(f).suffix().toLower();
        if (imageExtensions().contains(ext))
            out << d.absoluteFilePath(f);
    }
    return out;
}

QString labelPathForImage(const QString& imagePath, const QString& labelsDir)
{
    const QFileInfo fi(imagePath);
    const QString   name = fi.completeBaseName() + ".txt";

    if (!labelsDir.isEmpty())
        return QDir::cleanPath(QDir(labelsDir).filePath(name));

    // …/<split>/images/x.jpg -> …/<split>/labels/x.txt
    const QString splitDir = QFileInfo(fi.absolutePath()).absolutePath();
    return QDir::cleanPath(QDir(splitDir).filePath("labels/" + name));
}

// =========================
// Label file I/O
// =========================
bool readLabelFile(const QString& path, const ClassIdMapping& mapping,
                   LabelFile* out, QString* error)
{
    *out = LabelFile{};

    if (!QFileInfo::exists(path)) {
        // label files are created lazily on first save
        out->missing = true;
        qDebug() << "[Labels] no label file yet:" << path;
        return true;
    }

    QFile f(path);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
        const QString msg = QStringLiteral("cannot open %1: %2").arg(path, f.errorString());
        qWarning() << "[Labels]" << msg;
        if (error) *error = msg;
        return false;
    }

    QTextStream ts(&f);
    ts.setEncoding(QStringConverter::Utf8);
    const QString text = ts.readAll();
    f.close();

    out->set = deserialize(text, mapping, &out->warnings);
    qDebug() << "[Labels] read" << out->set.size() << "boxes from" << path
             << "warnings =" << out->warnings.size();
    return true;
}

bool writeLabelFile(const QString& path, const QString& text, QString* error)
{
    const QString outParent = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(outParent)) {
        const QString msg = QStringLiteral("mkpath failed for %1").arg(outParent);
        qWarning() << "[Labels] writeLabelFile:" << msg;
        if (error) *error = msg;
        return false;
    }

    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Truncate)) {
        const QString msg = QStringLiteral("cannot open %1 for write: %2").arg(path, f.errorString());
        qWarning() << "[Labels] writeLabelFile:" << msg;
        if (error) *error = msg;
        return false;
    }

    QTextStream ts(&f);
    ts.setEncoding(QStringConverter::Utf8);
    ts << text;
    ts.flush();
    f.close();

    if (f.error() != QFileDevice::NoError) {
        const QString msg = QStringLiteral("write failed for %1: %2").arg(path, f.errorString());
        qWarning() << "[Labels] writeLabelFile:" << msg;
        if (error) *error = msg;
        return false;
    }

    qDebug() << "[Labels] wrote" << path;
    return true;
}

} // namespace lu
} // namespace annot
