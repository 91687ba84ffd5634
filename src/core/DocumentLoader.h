#ifndef DOCUMENTLOADER_H
#define DOCUMENTLOADER_H

#include <QString>
#include <QStringList>

/**
 * @brief Utility class for locating and reading plain-text documents for ingest.
 *
 * Format extraction (PDF, Office, ...) happens outside KnowledgeFlow; the
 * loader only accepts files that already are UTF-8 text.
 */
class DocumentLoader
{
public:
    /**
     * @brief Recursively scans a directory for ingestible text files.
     *
     * @param rootPath The root directory to start scanning from
     * @param nameFilters Optional wildcard patterns (e.g. "*.md"). If empty,
     *                    every file with a supported extension is returned.
     * @return Absolute file paths, sorted so repeated runs ingest in the same order
     */
    static QStringList scanDirectory(const QString& rootPath, const QStringList& nameFilters = QStringList());

    /**
     * @brief Reads the content of a text file as UTF-8.
     *
     * @param filePath Path to the file to read
     * @param ok Optional; set to false when the file cannot be opened
     * @return The file content, or an empty string on error (a warning is logged)
     */
    static QString readTextFile(const QString& filePath, bool* ok = nullptr);

    /**
     * @brief The label stored as the "filename" metadata tag for a file.
     *
     * This is the bare file name; context matching compares against it.
     */
    static QString sourceLabelFor(const QString& filePath);

    static bool hasSupportedExtension(const QString& fileName);
};

#endif // DOCUMENTLOADER_H
