#include <modelhub/status_poller.h>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace modelhub {

TickResult StatusPoller::tick(SessionMap& sessions, StatusSink* sink) {
    TickResult result;

    for (auto it = sessions.begin(); it != sessions.end();) {
        const std::string id = it->first;
        SessionSnapshot snap = it->second->snapshot();

        if (snap.completed) {
            result.completed.push_back(id);
            it = sessions.erase(it);
            if (sink) {
                sink->on_completed(id);
            }
            continue;
        }

        if (snap.failed) {
            std::cerr << "[StatusPoller] Download error for " << id << ": " << snap.error_message << std::endl;
            result.failed.emplace_back(id, snap.error_message);
            it = sessions.erase(it);
            if (sink) {
                sink->on_failed(id, snap.error_message);
            }
            continue;
        }

        if (snap.active) {
            result.needs_another_tick = true;
            ProgressView view;
            view.model_id = id;
            view.fraction = snap.fraction();
            view.text = snap.progress_text();
            view.file_index = snap.file_index;
            view.total_files = snap.total_files;
            result.progress.push_back(view);
        } else if (snap.cancelled()) {
            result.cancelled.push_back(id);
            it = sessions.erase(it);
            if (sink) {
                sink->on_cancelled(id);
            }
            continue;
        }
        ++it;
    }

    return result;
}

std::string format_progress_line(const std::vector<ProgressView>& progress) {
    std::ostringstream line;
    for (size_t i = 0; i < progress.size(); ++i) {
        const auto& view = progress[i];
        line << (i ? " | " : "") << view.model_id << " ";
        if (view.total_files > 0) {
            line << "[" << (view.file_index + 1) << "/" << view.total_files << "] ";
        }
        line << view.text;
    }
    return line.str();
}

std::string format_bytes(uint64_t bytes) {
    const double kb = 1024.0;
    const double mb = kb * 1024.0;
    const double gb = mb * 1024.0;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (bytes >= gb) {
        oss << (bytes / gb) << " GB";
    } else if (bytes >= mb) {
        oss << (bytes / mb) << " MB";
    } else if (bytes >= kb) {
        oss << (bytes / kb) << " KB";
    } else {
        oss << bytes << " B";
    }
    return oss.str();
}

} // namespace modelhub
