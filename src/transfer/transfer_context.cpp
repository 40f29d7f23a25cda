#include "transfer_context.hpp"
#include <core/constants.hpp>

TransferContext::TransferContext(const Config& config,
                                 ProjectRegistry& projects,
                                 TransferEngine& engine,
                                 ProgressSink* sink,
                                 RetryPolicy::Sleeper sleeper)
    : config_(config),
      limiter_(config.transfer().max_concurrent_copies),
      verifier_(config.transfer().chunk_size_bytes),
      retry_(config.transfer().max_attempts, config.transfer().base_delay_ms, std::move(sleeper)),
      progress_(sink, static_cast<std::size_t>(config.progress().queue_capacity)),
      backup_history_(config.data_dir() / BACKUP_HISTORY_FILE, config.history().max_entries),
      import_history_(config.data_dir() / IMPORT_HISTORY_FILE, config.history().max_entries),
      projects_(projects),
      engine_(engine) {}

JobStore& TransferContext::store(JobKind kind) {
    switch (kind) {
        case JobKind::Backup:   return backups_;
        case JobKind::Delivery: return deliveries_;
        case JobKind::Archive:  return archives_;
        case JobKind::Import:   return imports_;
    }
    return backups_;
}

JobStore* TransferContext::find_store(const std::string& id) {
    for (JobStore* s : {&backups_, &deliveries_, &archives_, &imports_}) {
        if (s->get(id).is_ok()) {
            return s;
        }
    }
    return nullptr;
}
