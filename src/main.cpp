//
// KnowledgeFlow
//
// Copyright (c) 2025 Adrian Sutherland
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QTextStream>

#include "ExecutionEngine.h"
#include "Logger.h"
#include "backends/SerpApiSearchProvider.h"
#include "core/AppConfig.h"
#include "core/DocumentCatalog.h"
#include "core/DocumentLoader.h"
#include "core/DocumentPipeline.h"
#include "core/Embedder.h"
#include "core/LLMProviderRegistry.h"
#include "core/VectorStore.h"
#include "logging_categories.h"

#include <memory>
#include <stdexcept>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

void printJson(const QJsonObject& obj)
{
    out() << QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Indented));
    out().flush();
}

int usageError(const QCommandLineParser& parser, const QString& message)
{
    err() << message << "\n\n" << parser.helpText();
    err().flush();
    return kExitUsage;
}

int runIngest(VectorStore& store, SqlDocumentCatalog& catalog, const AppConfig& cfg, const QStringList& args,
              const QString& label)
{
    DocumentPipeline::Options options;
    options.chunkSize = cfg.chunkSize;
    options.chunkOverlap = cfg.chunkOverlap;
    DocumentPipeline pipeline(store, options);

    const QString workspaceId = args.at(1);
    const QString target = args.at(2);

    QStringList files;
    if (QFileInfo(target).isDir()) {
        files = DocumentLoader::scanDirectory(target);
        if (!label.isEmpty()) {
            KF_WARN << "--label is ignored when ingesting a directory";
        }
    } else {
        files << target;
    }

    QJsonArray documents;
    int total = 0;
    for (const QString& file : files) {
        const IngestResult result = pipeline.ingestFile(file, workspaceId, files.size() == 1 ? label : QString());
        total += result.chunkCount;
        catalog.addDocument(workspaceId, result.sourceLabel);

        QJsonObject doc;
        doc.insert(QStringLiteral("file"), file);
        doc.insert(QStringLiteral("label"), result.sourceLabel);
        doc.insert(QStringLiteral("chunks"), result.chunkCount);
        documents.append(doc);
        KF_LOG << "Ingested " << file << " (" << result.chunkCount << " chunks)";
    }

    QJsonObject summary;
    summary.insert(QStringLiteral("workflow_id"), workspaceId);
    summary.insert(QStringLiteral("documents"), documents);
    summary.insert(QStringLiteral("total_chunks"), total);
    printJson(summary);
    return kExitOk;
}

int runQuery(VectorStore& store, const IDocumentCatalog& catalog, const AppConfig& cfg, const QStringList& args)
{
    const QString workspaceId = args.at(1);
    const QString graphPath = args.at(2);
    const QString question = args.mid(3).join(QLatin1Char(' '));

    QFile graphFile(graphPath);
    if (!graphFile.open(QIODevice::ReadOnly)) {
        throw std::runtime_error(QStringLiteral("Cannot read graph file '%1': %2")
                                     .arg(graphPath, graphFile.errorString())
                                     .toStdString());
    }
    const QByteArray graphJson = graphFile.readAll();

    ExecutionEngine::Options options;
    options.searchTopK = cfg.searchTopK;
    options.webSearchMaxResults = cfg.webSearchMaxResults;

    ExecutionEngine engine(store,
                           LLMProviderRegistry::createDefault(),
                           std::make_shared<SerpApiSearchProvider>(cfg.webSearchTimeoutMs),
                           &catalog,
                           options);
    QObject::connect(&engine, &ExecutionEngine::nodeLog, [](const QString& message) {
        KF_LOG << message;
    });

    const ExecutionResult result = engine.executeJson(graphJson, workspaceId, question);
    printJson(result.toJson());
    return result.success ? kExitOk : kExitFailure;
}

int runCollections(VectorStore& store)
{
    QJsonArray list;
    for (const CollectionInfo& info : store.listCollections()) {
        QJsonObject obj;
        obj.insert(QStringLiteral("name"), info.name);
        obj.insert(QStringLiteral("workflow_id"), info.workspaceId);
        obj.insert(QStringLiteral("count"), info.count);
        list.append(obj);
    }
    QJsonObject root;
    root.insert(QStringLiteral("store_path"), store.storePath());
    root.insert(QStringLiteral("collections"), list);
    printJson(root);
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication::setOrganizationName(QStringLiteral("KnowledgeFlow"));
    QCoreApplication::setApplicationName(QStringLiteral("knowledgeflow"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Retrieval-augmented workflow runner.\n\n"
        "Commands:\n"
        "  ingest <workspace> <file|dir>            Chunk, embed and store UTF-8 text\n"
        "  query <workspace> <graph.json> <question> Execute a workflow graph\n"
        "  delete-source <workspace> <label>        Remove one document's chunks\n"
        "  clear <workspace>                        Remove all entries, keep the collection\n"
        "  delete <workspace>                       Remove the workspace collection\n"
        "  collections                              List collections in the store"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(QStringLiteral("config"),
                                          QStringLiteral("Read settings from <file>."),
                                          QStringLiteral("file"));
    const QCommandLineOption storeOption(QStringLiteral("store"),
                                         QStringLiteral("Vector store directory (overrides config)."),
                                         QStringLiteral("dir"));
    const QCommandLineOption labelOption(QStringLiteral("label"),
                                         QStringLiteral("Source label for an ingested file (default: file name)."),
                                         QStringLiteral("label"));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                                           QStringLiteral("Show kf.* debug and info logging."));
    parser.addOption(configOption);
    parser.addOption(storeOption);
    parser.addOption(labelOption);
    parser.addOption(verboseOption);
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run."));

    parser.process(app);

    // Keep stdout clean for JSON: our categorized logs stay quiet unless the
    // user opts in via QT_LOGGING_RULES or --verbose.
    if (qEnvironmentVariableIsEmpty("QT_LOGGING_RULES") && !parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral(
            "kf.*.debug=false\n"
            "kf.*.info=false"));
    }

    AppLogHelper::setSink([](bool isWarn, const QString& message) {
        Q_UNUSED(isWarn);
        err() << message << "\n";
        err().flush();
    });

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        return usageError(parser, QStringLiteral("No command given."));
    }
    const QString command = args.first();

    try {
        AppConfig cfg = AppConfig::load(parser.value(configOption));
        if (parser.isSet(storeOption)) {
            cfg.storePath = parser.value(storeOption);
        }
        AppLogHelper::setGlobalDebugEnabled(cfg.debug || parser.isSet(verboseOption));
        qCDebug(kf_config) << "Store path:" << cfg.storePath << "dimension:" << cfg.embeddingDimension;

        VectorStore store(cfg.storePath, std::make_shared<HashingEmbedder>(cfg.embeddingDimension),
                          cfg.allowStoreReset);
        SqlDocumentCatalog catalog(QDir(cfg.storePath).filePath(QString::fromLatin1(kDocumentCatalogFileName)));

        if (command == QLatin1String("ingest")) {
            if (args.size() != 3) {
                return usageError(parser, QStringLiteral("Usage: ingest <workspace> <file|dir>"));
            }
            return runIngest(store, catalog, cfg, args, parser.value(labelOption));
        }
        if (command == QLatin1String("query")) {
            if (args.size() < 4) {
                return usageError(parser, QStringLiteral("Usage: query <workspace> <graph.json> <question>"));
            }
            return runQuery(store, catalog, cfg, args);
        }
        if (command == QLatin1String("delete-source")) {
            if (args.size() != 3) {
                return usageError(parser, QStringLiteral("Usage: delete-source <workspace> <label>"));
            }
            const int removed = store.deleteDocumentsBySource(args.at(1), args.at(2));
            catalog.removeDocument(args.at(1), args.at(2));
            QJsonObject obj;
            obj.insert(QStringLiteral("workflow_id"), args.at(1));
            obj.insert(QStringLiteral("removed"), removed);
            printJson(obj);
            return kExitOk;
        }
        if (command == QLatin1String("clear") || command == QLatin1String("delete")) {
            if (args.size() != 2) {
                return usageError(parser, QStringLiteral("Usage: %1 <workspace>").arg(command));
            }
            if (command == QLatin1String("clear")) {
                store.clearCollection(args.at(1));
            } else {
                store.deleteCollection(args.at(1));
            }
            catalog.clearWorkspace(args.at(1));
            QJsonObject obj;
            obj.insert(QStringLiteral("workflow_id"), args.at(1));
            obj.insert(command == QLatin1String("clear") ? QStringLiteral("cleared") : QStringLiteral("deleted"), true);
            printJson(obj);
            return kExitOk;
        }
        if (command == QLatin1String("collections")) {
            return runCollections(store);
        }
        return usageError(parser, QStringLiteral("Unknown command '%1'.").arg(command));
    } catch (const std::exception& e) {
        err() << "Error: " << e.what() << "\n";
        err().flush();
        return kExitFailure;
    }
}
