#include "DocumentLoader.h"
#include "logging_categories.h"

#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

QStringList DocumentLoader::scanDirectory(const QString& rootPath, const QStringList& nameFilters)
{
    QStringList result;

    QDirIterator it(rootPath, nameFilters, QDir::Files, QDirIterator::Subdirectories);

    while (it.hasNext()) {
        const QFileInfo fileInfo(it.next());
        if (!fileInfo.isFile()) {
            continue;
        }

        // With explicit filters QDirIterator has already done the matching.
        if (nameFilters.isEmpty() && !hasSupportedExtension(fileInfo.fileName())) {
            continue;
        }
        result.append(fileInfo.absoluteFilePath());
    }

    result.sort();
    return result;
}

QString DocumentLoader::readTextFile(const QString& filePath, bool* ok)
{
    QFile file(filePath);

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(kf_pipeline) << "DocumentLoader: Failed to open file:" << filePath
                               << "Error:" << file.errorString();
        if (ok) {
            *ok = false;
        }
        return QString();
    }

    QTextStream stream(&file);
    stream.setEncoding(QStringConverter::Utf8);
    const QString content = stream.readAll();

    if (ok) {
        *ok = true;
    }
    return content;
}

QString DocumentLoader::sourceLabelFor(const QString& filePath)
{
    return QFileInfo(filePath).fileName();
}

bool DocumentLoader::hasSupportedExtension(const QString& fileName)
{
    static const QStringList supportedExtensions = {
        QStringLiteral(".txt"),
        QStringLiteral(".text"),
        QStringLiteral(".md"),
        QStringLiteral(".markdown"),
        QStringLiteral(".rst"),
        QStringLiteral(".csv"),
        QStringLiteral(".json"),
        QStringLiteral(".xml"),
        QStringLiteral(".html"),
        QStringLiteral(".htm"),
        QStringLiteral(".log"),
    };

    for (const QString& ext : supportedExtensions) {
        if (fileName.endsWith(ext, Qt::CaseInsensitive)) {
            return true;
        }
    }
    return false;
}
