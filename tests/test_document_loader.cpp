//
// KnowledgeFlow
//
// Document loader tests
//

#include <gtest/gtest.h>
#include <QTemporaryDir>
#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QTextStream>
#include "core/DocumentLoader.h"

/**
 * Test suite for DocumentLoader class
 */
class DocumentLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(tempDir.isValid()) << "Failed to create temporary directory";
    }

    QTemporaryDir tempDir;

    // Helper method to create a file with given content
    bool createFile(const QString& relativePath, const QString& content) {
        const QString fullPath = tempDir.path() + "/" + relativePath;

        QFileInfo fileInfo(fullPath);
        if (!QDir().mkpath(fileInfo.absolutePath())) {
            return false;
        }

        QFile file(fullPath);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
            return false;
        }

        QTextStream stream(&file);
        stream.setEncoding(QStringConverter::Utf8);
        stream << content;
        file.close();

        return true;
    }
};

/**
 * Test 1: Directory Traversal
 * Only text documents are returned, nested ones included, sorted by path.
 */
TEST_F(DocumentLoaderTest, ScanDirectory_ReturnsOnlyTextDocuments) {
    ASSERT_TRUE(createFile("readme.md", "# README"));
    ASSERT_TRUE(createFile("notes.txt", "Some notes"));
    ASSERT_TRUE(createFile("data.csv", "a,b"));
    ASSERT_TRUE(createFile("subdir/nested.rst", "Title\n====="));
    ASSERT_TRUE(createFile("another/path/page.html", "<p>hi</p>"));

    ASSERT_TRUE(createFile("image.png", "fake png data"));
    ASSERT_TRUE(createFile("document.pdf", "pdf data"));
    ASSERT_TRUE(createFile("subdir/tool.exe", "MZ"));

    const QStringList result = DocumentLoader::scanDirectory(tempDir.path());

    ASSERT_EQ(result.size(), 5);
    QStringList sorted = result;
    sorted.sort();
    EXPECT_EQ(result, sorted);
    for (const QString& path : result) {
        EXPECT_TRUE(QFileInfo(path).isAbsolute()) << path.toStdString();
        EXPECT_FALSE(path.endsWith(".pdf"));
        EXPECT_FALSE(path.endsWith(".png"));
    }
}

/**
 * Test 2: Explicit name filters replace the extension check
 */
TEST_F(DocumentLoaderTest, ScanDirectory_NameFilters) {
    ASSERT_TRUE(createFile("a.md", "a"));
    ASSERT_TRUE(createFile("b.txt", "b"));
    ASSERT_TRUE(createFile("deep/c.md", "c"));

    const QStringList result = DocumentLoader::scanDirectory(tempDir.path(), {"*.md"});

    ASSERT_EQ(result.size(), 2);
    EXPECT_TRUE(result[0].endsWith("a.md"));
    EXPECT_TRUE(result[1].endsWith("deep/c.md"));
}

/**
 * Test 3: Reading preserves content, including non-ASCII text
 */
TEST_F(DocumentLoaderTest, ReadTextFile_ReturnsExactContent) {
    const QString content = QString::fromUtf8("Line one\nLigne deux: d\xC3\xA9j\xC3\xA0 vu\n");
    ASSERT_TRUE(createFile("utf8.txt", content));

    bool ok = false;
    const QString read = DocumentLoader::readTextFile(tempDir.path() + "/utf8.txt", &ok);

    EXPECT_TRUE(ok);
    EXPECT_EQ(read, content);
}

/**
 * Test 4: A missing file reports failure through the flag
 */
TEST_F(DocumentLoaderTest, ReadTextFile_NonExistentFile_ReturnsEmptyString) {
    bool ok = true;
    const QString read = DocumentLoader::readTextFile(tempDir.path() + "/missing.txt", &ok);

    EXPECT_FALSE(ok);
    EXPECT_TRUE(read.isEmpty());
    EXPECT_TRUE(DocumentLoader::readTextFile(tempDir.path() + "/missing.txt").isEmpty());
}

/**
 * Test 5: Extensions match regardless of case
 */
TEST_F(DocumentLoaderTest, ScanDirectory_CaseInsensitiveExtensions) {
    ASSERT_TRUE(createFile("UPPER.TXT", "x"));
    ASSERT_TRUE(createFile("Mixed.Md", "y"));

    EXPECT_EQ(DocumentLoader::scanDirectory(tempDir.path()).size(), 2);
    EXPECT_TRUE(DocumentLoader::hasSupportedExtension("REPORT.MARKDOWN"));
    EXPECT_FALSE(DocumentLoader::hasSupportedExtension("report.docx"));
}

/**
 * Test 6: Empty directory
 */
TEST_F(DocumentLoaderTest, ScanDirectory_EmptyDirectory_ReturnsEmptyList) {
    EXPECT_TRUE(DocumentLoader::scanDirectory(tempDir.path()).isEmpty());
}

/**
 * Test 7: The source label is the bare file name
 */
TEST_F(DocumentLoaderTest, SourceLabelIsFileName) {
    EXPECT_EQ(DocumentLoader::sourceLabelFor("/data/projects/q3/report.txt"), QStringLiteral("report.txt"));
    EXPECT_EQ(DocumentLoader::sourceLabelFor("notes.md"), QStringLiteral("notes.md"));
}
