#include "logging_categories.h"

Q_LOGGING_CATEGORY(kf_store, "kf.store")
Q_LOGGING_CATEGORY(kf_pipeline, "kf.pipeline")
Q_LOGGING_CATEGORY(kf_graph, "kf.graph")
Q_LOGGING_CATEGORY(kf_engine, "kf.engine")
Q_LOGGING_CATEGORY(kf_provider, "kf.provider")
Q_LOGGING_CATEGORY(kf_websearch, "kf.websearch")
Q_LOGGING_CATEGORY(kf_config, "kf.config")
