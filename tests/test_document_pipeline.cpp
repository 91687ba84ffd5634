//
// KnowledgeFlow
//
// Document pipeline tests
//

#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

#include <memory>
#include <stdexcept>

#include "core/DocumentPipeline.h"
#include "core/Embedder.h"
#include "core/VectorStore.h"
#include "test_fakes.h"

class DocumentPipelineTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tempDir.isValid());
        store = std::make_unique<VectorStore>(tempDir.filePath(QStringLiteral("store")),
                                              std::make_shared<HashingEmbedder>(48));
    }

    QTemporaryDir tempDir;
    std::unique_ptr<VectorStore> store;
};

// Test 1 (Ingest): Chunks are stored with workspace and filename tags
TEST_F(DocumentPipelineTest, IngestTagsEveryChunk)
{
    DocumentPipeline pipeline(*store, {100, 20});
    const QString text = QStringLiteral("Quarterly revenue grew in every region. ").repeated(10);

    const IngestResult result = pipeline.ingest(text, QStringLiteral("w1"), QStringLiteral("report.pdf"));

    EXPECT_EQ(result.chunkCount, TextChunker::expectedChunkCount(text.length(), 100, 20));
    EXPECT_EQ(result.ids.size(), result.chunkCount);

    const std::vector<IndexEntry> entries = store->getAll(QStringLiteral("w1"));
    ASSERT_EQ(static_cast<int>(entries.size()), result.chunkCount);
    for (const IndexEntry& entry : entries) {
        EXPECT_EQ(entry.metadata.value(QStringLiteral("workflow_id")).toString(), QStringLiteral("w1"));
        EXPECT_EQ(entry.metadata.value(QStringLiteral("filename")).toString(), QStringLiteral("report.pdf"));
    }
    EXPECT_EQ(entries.front().text, text.left(100));
}

// Test 2 (Default chunking): 2500 characters give four chunks at 1000/200
TEST_F(DocumentPipelineTest, DefaultOptions)
{
    DocumentPipeline pipeline(*store);
    EXPECT_EQ(pipeline.options().chunkSize, 1000);
    EXPECT_EQ(pipeline.options().chunkOverlap, 200);

    const IngestResult result = pipeline.ingest(QString(2500, QChar('z')), QStringLiteral("w1"), QStringLiteral("z.txt"));
    EXPECT_EQ(result.chunkCount, 4);
}

// Test 3 (Empty): Empty text creates the collection and stores nothing
TEST_F(DocumentPipelineTest, EmptyTextYieldsZeroChunks)
{
    DocumentPipeline pipeline(*store);

    const IngestResult result = pipeline.ingest(QString(), QStringLiteral("w1"), QStringLiteral("empty.txt"));

    EXPECT_EQ(result.chunkCount, 0);
    EXPECT_TRUE(result.ids.isEmpty());
    EXPECT_EQ(store->listCollections().size(), 1u);
    EXPECT_EQ(store->count(QStringLiteral("w1")), 0);
}

// Test 4 (Query): Ingested text is retrievable by a related query
TEST_F(DocumentPipelineTest, IngestedTextIsSearchable)
{
    DocumentPipeline pipeline(*store, {60, 10});
    pipeline.ingest(QStringLiteral("The capital of France is Paris. Paris hosts the Louvre museum."),
                    QStringLiteral("w1"), QStringLiteral("geo.txt"));
    pipeline.ingest(QStringLiteral("Photosynthesis converts sunlight into chemical energy in plants."),
                    QStringLiteral("w1"), QStringLiteral("bio.txt"));

    const std::vector<SearchHit> hits = store->search(QStringLiteral("w1"), QStringLiteral("Louvre museum Paris"), 1);

    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].metadata.value(QStringLiteral("filename")).toString(), QStringLiteral("geo.txt"));
}

// Test 5 (Atomicity): A failing embedder leaves no partial writes
TEST_F(DocumentPipelineTest, EmbedderFailureWritesNothing)
{
    VectorStore failing(tempDir.filePath(QStringLiteral("failing")), std::make_shared<ThrowingEmbedder>());
    DocumentPipeline pipeline(failing, {50, 5});

    EXPECT_THROW(pipeline.ingest(QString(300, QChar('q')), QStringLiteral("w1"), QStringLiteral("q.txt")),
                 std::runtime_error);
    EXPECT_EQ(failing.count(QStringLiteral("w1")), 0);
}

// Test 6 (Dimension): Vectors of the wrong size are rejected by the store
TEST_F(DocumentPipelineTest, WrongDimensionIsRejected)
{
    VectorStore shortStore(tempDir.filePath(QStringLiteral("short")), std::make_shared<ShortVectorEmbedder>());
    DocumentPipeline pipeline(shortStore);

    EXPECT_THROW(pipeline.ingest(QStringLiteral("some text"), QStringLiteral("w1"), QStringLiteral("s.txt")),
                 std::invalid_argument);
    EXPECT_EQ(shortStore.count(QStringLiteral("w1")), 0);
}

// Test 7 (Invalid options): Chunker validation surfaces before anything is written
TEST_F(DocumentPipelineTest, InvalidChunkOptionsThrow)
{
    DocumentPipeline pipeline(*store, {10, 10});
    EXPECT_THROW(pipeline.ingest(QStringLiteral("text"), QStringLiteral("w1"), QStringLiteral("t.txt")),
                 std::invalid_argument);
}

// Test 8 (Files): ingestFile labels chunks with the file name unless told otherwise
TEST_F(DocumentPipelineTest, IngestFileUsesFileName)
{
    const QString path = tempDir.filePath(QStringLiteral("handbook.md"));
    {
        QFile file(path);
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        file.write("Employees get twenty days of leave.");
    }
    DocumentPipeline pipeline(*store);

    pipeline.ingestFile(path, QStringLiteral("w1"));
    pipeline.ingestFile(path, QStringLiteral("w2"), QStringLiteral("HR Handbook"));

    EXPECT_EQ(store->getAll(QStringLiteral("w1")).at(0).metadata.value(QStringLiteral("filename")).toString(),
              QStringLiteral("handbook.md"));
    EXPECT_EQ(store->getAll(QStringLiteral("w2")).at(0).metadata.value(QStringLiteral("filename")).toString(),
              QStringLiteral("HR Handbook"));
    EXPECT_THROW(pipeline.ingestFile(tempDir.filePath(QStringLiteral("nope.md")), QStringLiteral("w1")),
                 std::runtime_error);
}
