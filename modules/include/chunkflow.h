#ifndef CHUNKFLOW_H
#define CHUNKFLOW_H

// Core
#include "clock.h"
#include "config_manager.h"
#include "content_hash.h"
#include "logger.h"
#include "telemetry.h"
#include "upload_errors.h"

// Reactor
#include "worker_pool.h"

// Session
#include "asset_catalog.h"
#include "session_repository.h"
#include "upload_session_state_machine.h"
#include "upload_sources.h"
#include "upload_types.h"

// Storage
#include "chunk_integrity.h"
#include "chunk_store.h"
#include "dedup_index.h"

// Transfer
#include "bandwidth_governor.h"
#include "counter_store.h"
#include "parallel_transfer_engine.h"
#include "rate_limiter.h"

// Assembly
#include "assembler.h"
#include "scan_gate.h"
#include "scanner_backend.h"

// Queue
#include "chunk_source.h"
#include "progress_tracker.h"
#include "queue_orchestrator.h"
#include "resource_monitor.h"
#include "upload_cleanup.h"
#include "upload_queue_service.h"

#endif // CHUNKFLOW_H
