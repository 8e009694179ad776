#pragma once

#include <cstdint>
#include <string>
#include "model_types.h"

namespace modelhub {

enum class DiskPresence {
    NOT_DOWNLOADED,
    DOWNLOADED
};

struct DiskUsage {
    size_t entries = 0;  // non-hidden top-level entries
    uint64_t bytes = 0;  // regular files below them
};

struct FileScanResult {
    ModelState state = ModelState::NOT_AVAILABLE;
    size_t downloaded_files = 0;
    size_t total_files = 0;
    uint64_t downloaded_bytes = 0;
};

// Decides from disk alone whether a model is installed. Never trusts the
// persisted status.
class FilesystemReconciler {
public:
    // DOWNLOADED when the storage directory holds at least one entry whose
    // name does not start with '.'
    static DiskPresence scan(const ModelEntry& entry);

    static DiskUsage measure(const ModelEntry& entry);

    // Check every listed file: present and at least 99% of the expected size
    // (any size when unknown). Updates the per-file downloaded flags.
    static FileScanResult scan_files(ModelEntry& entry);

    // Overwrite entry.status from disk and stamp last_checked
    static void reconcile(ModelEntry& entry);
};

} // namespace modelhub
