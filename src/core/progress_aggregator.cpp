/**
 * @file progress_aggregator.cpp
 * @brief Implementation of the progress read model
 */

#include <kcenon/package_upload/core/progress_aggregator.h>

namespace kcenon::package_upload {

void progress_aggregator::attach(std::shared_ptr<const progress_table> table) {
    std::lock_guard<std::mutex> lock(mutex_);
    table_ = std::move(table);
}

void progress_aggregator::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    table_.reset();
}

auto progress_aggregator::is_attached() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_ != nullptr;
}

auto progress_aggregator::current() const -> std::shared_ptr<const progress_table> {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_;
}

auto progress_aggregator::summarize(const progress_table& table) -> progress_snapshot {
    progress_snapshot snap;
    snap.total_bytes = table.total_bytes();
    snap.committed_bytes = table.committed_bytes();
    snap.total_chunks = table.total_chunks();
    snap.committed_chunks = table.committed_count();
    snap.in_flight_chunks = table.in_flight_count();
    snap.failed_chunks = table.failed_count();
    snap.elapsed = table.elapsed();

    if (snap.total_bytes > 0) {
        snap.percent = static_cast<double>(snap.committed_bytes) * 100.0 /
                       static_cast<double>(snap.total_bytes);
    }

    auto seconds = static_cast<double>(snap.elapsed.count()) / 1000.0;
    if (seconds > 0.0) {
        snap.rate_mbps = static_cast<double>(snap.committed_bytes) * 8.0 / 1e6 / seconds;
    }
    return snap;
}

auto progress_aggregator::summary() const -> progress_snapshot {
    auto table = current();
    if (!table) {
        return {};
    }
    return summarize(*table);
}

auto progress_aggregator::snapshot() const -> progress_snapshot {
    auto table = current();
    if (!table) {
        return {};
    }
    auto snap = summarize(*table);
    snap.chunks = table->entries();
    return snap;
}

}  // namespace kcenon::package_upload
