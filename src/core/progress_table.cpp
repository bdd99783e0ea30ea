/**
 * @file progress_table.cpp
 * @brief Implementation of the per-chunk status map
 */

#include <kcenon/package_upload/core/progress_table.h>

namespace kcenon::package_upload {

progress_table::progress_table(const chunk_plan& plan)
    : count_(plan.total_chunks()),
      total_bytes_(plan.total_size),
      entries_(std::make_unique<entry[]>(plan.chunks.size())),
      created_(std::chrono::steady_clock::now()) {
    for (std::size_t i = 0; i < plan.chunks.size(); ++i) {
        entries_[i].size = plan.chunks[i].size;
    }
}

auto progress_table::find(uint32_t number) const -> entry* {
    if (number == 0 || number > count_) {
        return nullptr;
    }
    return &entries_[number - 1];
}

auto progress_table::now_ns() const -> int64_t {
    auto since = std::chrono::steady_clock::now() - created_;
    // Never store 0, which means "not set"
    return std::chrono::duration_cast<std::chrono::nanoseconds>(since).count() + 1;
}

auto progress_table::transition(entry& e, chunk_status from, chunk_status to) -> bool {
    auto expected = static_cast<uint8_t>(from);
    return e.status.compare_exchange_strong(expected, static_cast<uint8_t>(to),
                                            std::memory_order_acq_rel);
}

auto progress_table::mark_in_flight(uint32_t number) -> bool {
    auto* e = find(number);
    if (!e) return false;

    if (!transition(*e, chunk_status::pending, chunk_status::in_flight)) {
        return false;
    }
    e->started_ns.store(now_ns(), std::memory_order_relaxed);

    auto current = in_flight_.fetch_add(1) + 1;
    auto peak = peak_in_flight_.load();
    while (current > peak && !peak_in_flight_.compare_exchange_weak(peak, current)) {
    }
    return true;
}

auto progress_table::mark_committed(uint32_t number) -> bool {
    auto* e = find(number);
    if (!e) return false;

    if (!transition(*e, chunk_status::in_flight, chunk_status::committed)) {
        return false;
    }
    e->finished_ns.store(now_ns(), std::memory_order_relaxed);

    in_flight_.fetch_sub(1);
    committed_bytes_.fetch_add(e->size);
    committed_count_.fetch_add(1);
    return true;
}

auto progress_table::mark_failed(uint32_t number) -> bool {
    auto* e = find(number);
    if (!e) return false;

    if (transition(*e, chunk_status::in_flight, chunk_status::failed)) {
        in_flight_.fetch_sub(1);
    } else if (!transition(*e, chunk_status::pending, chunk_status::failed)) {
        return false;
    }

    e->finished_ns.store(now_ns(), std::memory_order_relaxed);
    failed_count_.fetch_add(1);
    return true;
}

auto progress_table::status(uint32_t number) const -> chunk_status {
    auto* e = find(number);
    if (!e) return chunk_status::pending;
    return static_cast<chunk_status>(e->status.load(std::memory_order_acquire));
}

auto progress_table::elapsed() const -> duration {
    return std::chrono::duration_cast<duration>(std::chrono::steady_clock::now() - created_);
}

auto progress_table::entries() const -> std::vector<chunk_progress> {
    std::vector<chunk_progress> out;
    out.reserve(count_);

    auto now = now_ns();
    for (uint32_t i = 0; i < count_; ++i) {
        const auto& e = entries_[i];
        chunk_progress p;
        p.number = i + 1;
        p.status = static_cast<chunk_status>(e.status.load(std::memory_order_acquire));
        p.size = e.size;

        auto started = e.started_ns.load(std::memory_order_relaxed);
        auto finished = e.finished_ns.load(std::memory_order_relaxed);

        if (p.status != chunk_status::pending && started > 0) {
            auto end = (finished > started) ? finished : now;
            p.elapsed = std::chrono::duration_cast<duration>(
                std::chrono::nanoseconds(end - started));
        }

        if (p.status == chunk_status::committed) {
            p.bytes_transferred = e.size;
            auto seconds = static_cast<double>(finished - started) / 1e9;
            if (finished > started && seconds > 0.0) {
                p.rate_mbps = static_cast<double>(e.size) * 8.0 / 1e6 / seconds;
            }
        }

        out.push_back(p);
    }
    return out;
}

}  // namespace kcenon::package_upload
