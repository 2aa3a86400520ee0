#pragma once
// Kosha: retrieval and tool orchestration for a support assistant
//
// - Types: Vectors, Passages, atomic file writes
// - Embedder: text to unit vectors (hashing, ONNX, caching)
// - FlatIndex: exact nearest-neighbor search
// - KnowledgeStore: ingest, search, snapshot swap, persistence
// - Dispatcher: validation, call budgets, timeouts, error folding
// - Tools: knowledge search, web lookups, financial compute
// - Backend: the context object tying them together

#include "version.hpp"
#include "types.hpp"
#include "errors.hpp"
#include "embedder.hpp"
#ifdef KOSHA_WITH_ONNX
#include "embedder_onnx.hpp"
#endif
#include "flat_index.hpp"
#include "knowledge_store.hpp"
#include "budget.hpp"
#include "dispatcher.hpp"
#include "config.hpp"
#include "backend.hpp"
