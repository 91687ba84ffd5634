// Centralized Qt logging categories for KnowledgeFlow
#pragma once

#include <QLoggingCategory>

// Vector store collection lifecycle, persistence and recovery
Q_DECLARE_LOGGING_CATEGORY(kf_store)

// Document ingest: chunk, embed, store
Q_DECLARE_LOGGING_CATEGORY(kf_pipeline)

// Graph parsing and resolution
Q_DECLARE_LOGGING_CATEGORY(kf_graph)

// Execution dispatch, context gathering, prompt assembly
Q_DECLARE_LOGGING_CATEGORY(kf_engine)

// Generation backends and model normalization
Q_DECLARE_LOGGING_CATEGORY(kf_provider)

// Web search requests
Q_DECLARE_LOGGING_CATEGORY(kf_websearch)

// Configuration loading and validation
Q_DECLARE_LOGGING_CATEGORY(kf_config)
