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
#pragma once

#include <QJsonObject>
#include <QString>

/**
 * @brief Runtime settings for the store, pipeline and engine.
 *
 * Sources, later wins: built-in defaults, the JSON config file, KF_* environment
 * variables. Out-of-range values are reset to their defaults with a warning on
 * the kf.config category.
 */
struct AppConfig {
    QString storePath;
    int embeddingDimension {384};
    int chunkSize {1000};
    int chunkOverlap {200};
    int searchTopK {5};
    int webSearchTimeoutMs {10000};
    int webSearchMaxResults {5};
    bool allowStoreReset {true};
    bool debug {false};

    static constexpr const char* kConfigFileName = "knowledgeflow.json";

    /**
     * @brief Loads defaults, then @p configPath (or the located config file), then the environment.
     * @throws std::runtime_error when an explicitly given file is missing or any
     *         config file is not a JSON object
     */
    static AppConfig load(const QString& configPath = QString());

    /// <AppDataLocation>/vector_store
    static QString defaultStorePath();

    /// First existing knowledgeflow.json in the app config location, then the
    /// working directory; empty if none.
    static QString locateConfigFile();

    void applyJson(const QJsonObject& obj);
    void applyEnvironment();
    void validate();
};
