#include <modelhub/filesystem_reconciler.h>
#include <modelhub/utils/path_utils.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace modelhub {

static bool is_hidden(const fs::path& p) {
    std::string name = p.filename().string();
    return !name.empty() && name[0] == '.';
}

static uint64_t tree_size(const fs::path& p) {
    std::error_code ec;
    if (fs::is_regular_file(p, ec)) {
        uint64_t size = fs::file_size(p, ec);
        return ec ? 0 : size;
    }

    uint64_t total = 0;
    if (fs::is_directory(p, ec)) {
        for (fs::recursive_directory_iterator it(p, fs::directory_options::skip_permission_denied, ec), end;
             !ec && it != end; it.increment(ec)) {
            std::error_code size_ec;
            if (it->is_regular_file(size_ec)) {
                uint64_t size = it->file_size(size_ec);
                if (!size_ec) {
                    total += size;
                }
            }
        }
    }
    return total;
}

DiskPresence FilesystemReconciler::scan(const ModelEntry& entry) {
    fs::path dir = entry.storage.expanded_path();
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return DiskPresence::NOT_DOWNLOADED;
    }

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!is_hidden(it->path())) {
            return DiskPresence::DOWNLOADED;
        }
    }
    return DiskPresence::NOT_DOWNLOADED;
}

DiskUsage FilesystemReconciler::measure(const ModelEntry& entry) {
    DiskUsage usage;
    fs::path dir = entry.storage.expanded_path();
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return usage;
    }

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (is_hidden(it->path())) {
            continue;
        }
        usage.entries++;
        usage.bytes += tree_size(it->path());
    }
    return usage;
}

FileScanResult FilesystemReconciler::scan_files(ModelEntry& entry) {
    FileScanResult result;
    result.total_files = entry.files.size();

    fs::path base = entry.storage.expanded_path();
    for (auto& file : entry.files) {
        file.downloaded = false;

        std::error_code ec;
        fs::path file_path = base / file.path;
        if (!fs::is_regular_file(file_path, ec)) {
            continue;
        }
        uint64_t size = fs::file_size(file_path, ec);
        if (ec) {
            continue;
        }

        // Within 1% counts as complete
        if (file.size_bytes == 0 || size >= file.size_bytes * 99 / 100) {
            file.downloaded = true;
            result.downloaded_files++;
            result.downloaded_bytes += size;
        }
    }

    if (result.downloaded_files == 0) {
        result.state = ModelState::NOT_AVAILABLE;
    } else if (result.downloaded_files == result.total_files) {
        result.state = ModelState::READY;
    } else {
        result.state = ModelState::PARTIAL;
    }
    return result;
}

void FilesystemReconciler::reconcile(ModelEntry& entry) {
    if (entry.is_file_count_sensitive()) {
        FileScanResult result = scan_files(entry);
        entry.status.state = result.state;
        entry.status.downloaded_files = result.downloaded_files;
        entry.status.total_files = result.total_files;
        entry.status.downloaded_bytes = result.downloaded_bytes;
    } else if (scan(entry) == DiskPresence::DOWNLOADED) {
        DiskUsage usage = measure(entry);
        entry.status.state = ModelState::READY;
        entry.status.downloaded_files = usage.entries;
        entry.status.total_files = usage.entries;
        entry.status.downloaded_bytes = usage.bytes;
    } else {
        entry.status.state = ModelState::NOT_AVAILABLE;
        entry.status.downloaded_files = 0;
        entry.status.downloaded_bytes = 0;
    }

    if (entry.status.state == ModelState::READY || entry.status.state == ModelState::NOT_AVAILABLE) {
        entry.status.error_message.clear();
    }
    entry.status.last_checked = utils::utc_timestamp();
}

} // namespace modelhub
