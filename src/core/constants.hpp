#pragma once

#include <cstddef>
#include <cstdint>

// ── Copy ────────────────────────────────────────────────────
// Streaming copies and digests both read in blocks of this size.
constexpr std::size_t DEFAULT_CHUNK_SIZE_BYTES = 4 * 1024 * 1024;   // 4 MiB

// ── Retry ───────────────────────────────────────────────────
constexpr int MAX_RETRY_ATTEMPTS          = 3;     // total attempts per file, not retries
constexpr int RETRY_BASE_DELAY_MS         = 10;    // first backoff, doubled per attempt

// ── Concurrency ─────────────────────────────────────────────
constexpr int MAX_CONCURRENT_COPIES       = 4;     // process-wide permit pool
constexpr int DEFAULT_JOB_WORKERS         = 4;     // worker threads driving jobs
constexpr int PROGRESS_QUEUE_CAPACITY     = 256;   // pending progress events before dropping

// ── History ─────────────────────────────────────────────────
constexpr int HISTORY_MAX_ENTRIES         = 100;   // most recent first, oldest pruned

// ── File names ──────────────────────────────────────────────
constexpr const char* BACKUP_HISTORY_FILE  = "backup_history.yaml";
constexpr const char* IMPORT_HISTORY_FILE  = "import_history.yaml";
constexpr const char* PROJECT_STATUS_FILE  = "projects.yaml";
constexpr const char* DELIVERY_MANIFEST    = "delivery_manifest.txt";

// ── Error messages ──────────────────────────────────────────
constexpr const char* SHUTDOWN_ERROR       = "interrupted by shutdown";
