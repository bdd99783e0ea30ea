/**
 * @file test_concurrency_coordinator.cpp
 * @brief Unit tests for concurrency_coordinator
 */

#include <gtest/gtest.h>

#include "mock_http_client.h"

#include <kcenon/package_upload/core/encoding.h>
#include <kcenon/package_upload/core/progress_aggregator.h>
#include <kcenon/package_upload/upload/concurrency_coordinator.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

namespace kcenon::package_upload::test {

class ConcurrencyCoordinatorTest : public ::testing::Test {
protected:
    static constexpr uint64_t chunk_bytes = 1000;

    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "package_upload_test_coordinator";
        std::filesystem::create_directories(test_dir_);
        client_ = std::make_shared<mock_http_client>();
        auth_ = std::make_shared<static_token_provider>("token");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    // Small chunks keep the tests fast; the planner's size floor is covered elsewhere
    void prepare(uint32_t chunk_count, protocol_variant protocol) {
        auto total = chunk_count * chunk_bytes - chunk_bytes / 2;

        path_ = test_dir_ / "artifact.bin";
        std::ofstream file(path_, std::ios::binary);
        std::mt19937 gen(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);
        for (uint64_t i = 0; i < total; ++i) {
            char byte = static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }
        file.close();

        plan_ = chunk_plan{};
        plan_.total_size = total;
        plan_.chunk_size = chunk_bytes;
        for (uint32_t n = 1; n <= chunk_count; ++n) {
            chunk c;
            c.number = n;
            c.start = (n - 1) * chunk_bytes;
            c.size = n == chunk_count ? total - c.start : chunk_bytes;
            c.end = c.start + c.size - 1;
            plan_.chunks.push_back(c);
        }

        session_ = upload_session{};
        session_.protocol = protocol;
        session_.total_size = total;
        session_.total_chunks = chunk_count;
        session_.chunk_size = chunk_bytes;
        session_.file_name = "artifact.bin";
        if (protocol == protocol_variant::byte_range_resumable) {
            session_.endpoint = "https://upload.example.test/s?upload_id=1";
        } else {
            session_.endpoint = "0123456789abcdef";
            session_.chunk_url = "https://api.example.test/upload/chunk";
            session_.finalize_url = "https://api.example.test/upload/finalize";
        }

        reader_ = std::make_unique<chunk_reader>(path_);
        table_ = std::make_unique<progress_table>(plan_);
    }

    auto run(execution_policy policy, std::size_t throttle = 4,
             std::shared_ptr<adapters::worker_pool_interface> pool = nullptr)
        -> result<coordinator_report, upload_error> {
        concurrency_coordinator coordinator(std::make_shared<chunk_transmitter>(client_, auth_),
                                            std::move(pool));
        coordinator_job job{plan_, session_, *reader_, *table_};
        return coordinator.run(job, policy, throttle);
    }

    static auto chunk_number_of(const recorded_request& req) -> uint32_t {
        if (req.method == "PUT") {
            // "bytes start-end/total"
            auto dash = req.header("Content-Range").find('-');
            auto start = std::stoull(req.header("Content-Range").substr(6, dash - 6));
            return static_cast<uint32_t>(start / chunk_bytes) + 1;
        }
        auto number = encoding::extract_json_value(req.text_body, "chunkNumber");
        return number ? static_cast<uint32_t>(std::stoul(*number)) : 0;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path path_;
    std::shared_ptr<mock_http_client> client_;
    std::shared_ptr<auth_provider> auth_;
    chunk_plan plan_;
    upload_session session_;
    std::unique_ptr<chunk_reader> reader_;
    std::unique_ptr<progress_table> table_;
};

// =============================================================================
// Sequential
// =============================================================================

TEST_F(ConcurrencyCoordinatorTest, SequentialSendsChunksInOrder) {
    prepare(4, protocol_variant::byte_range_resumable);
    client_->set_handler([](const recorded_request& req) {
        bool last = req.header("Content-Range").find("-3499/") != std::string::npos;
        return mock_http_client::respond(last ? 201 : 308);
    });

    auto report = run(execution_policy::sequential);
    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().policy, execution_policy::sequential);
    EXPECT_EQ(report.value().chunks_sent, 4u);
    EXPECT_EQ(report.value().completed_at, 4u);
    EXPECT_FALSE(report.value().completed_early);

    auto requests = client_->requests();
    ASSERT_EQ(requests.size(), 4u);
    for (uint32_t i = 0; i < 4; ++i) {
        EXPECT_EQ(chunk_number_of(requests[i]), i + 1);
    }
    EXPECT_TRUE(table_->all_committed());
    EXPECT_EQ(table_->peak_in_flight(), 1u);
}

TEST_F(ConcurrencyCoordinatorTest, AutomaticPolicyIsSequentialForByteRange) {
    prepare(2, protocol_variant::byte_range_resumable);
    client_->set_handler([](const recorded_request&) { return mock_http_client::respond(308); });

    auto report = run(execution_policy::automatic);
    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().policy, execution_policy::sequential);
}

TEST_F(ConcurrencyCoordinatorTest, EarlyCompletionStopsTransmission) {
    prepare(4, protocol_variant::byte_range_resumable);
    std::atomic<int> calls{0};
    client_->set_handler([&](const recorded_request&) {
        return mock_http_client::respond(++calls == 2 ? 200 : 308);
    });

    auto report = run(execution_policy::sequential);
    ASSERT_TRUE(report);
    EXPECT_TRUE(report.value().completed_early);
    EXPECT_EQ(report.value().completed_at, 2u);
    EXPECT_EQ(client_->request_count(), 2u);
    EXPECT_EQ(table_->status(3), chunk_status::pending);
}

TEST_F(ConcurrencyCoordinatorTest, ResumeIncompleteOnLastChunkIsAccepted) {
    prepare(3, protocol_variant::byte_range_resumable);
    client_->set_handler([](const recorded_request&) { return mock_http_client::respond(308); });

    auto report = run(execution_policy::sequential);
    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().completed_at, 3u);
    EXPECT_TRUE(table_->all_committed());
}

TEST_F(ConcurrencyCoordinatorTest, SequentialStopsAtFirstFailure) {
    prepare(4, protocol_variant::byte_range_resumable);
    std::atomic<int> calls{0};
    client_->set_handler([&](const recorded_request&) {
        return ++calls == 2 ? mock_http_client::respond(500, {}, "storage unavailable")
                            : mock_http_client::respond(308);
    });

    auto report = run(execution_policy::sequential);
    ASSERT_FALSE(report);

    const auto& err = report.error();
    EXPECT_EQ(err.kind, failure_kind::chunk_failure);
    EXPECT_EQ(err.phase, upload_phase::transmit);
    EXPECT_EQ(err.status_code, 500);
    ASSERT_EQ(err.chunk_failures.size(), 1u);
    EXPECT_EQ(err.chunk_failures[0].chunk_number, 2u);
    EXPECT_EQ(err.chunk_failures[0].body, "storage unavailable");

    EXPECT_EQ(client_->request_count(), 2u);
    EXPECT_EQ(table_->status(2), chunk_status::failed);
    EXPECT_EQ(table_->status(3), chunk_status::pending);
}

TEST_F(ConcurrencyCoordinatorTest, ByteRangeRefusesParallel) {
    prepare(2, protocol_variant::byte_range_resumable);

    auto report = run(execution_policy::bounded_parallel);
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().code, error_code::invalid_configuration);
    EXPECT_EQ(client_->request_count(), 0u);
}

// =============================================================================
// Bounded parallel
// =============================================================================

TEST_F(ConcurrencyCoordinatorTest, ParallelNeverExceedsThrottle) {
    prepare(12, protocol_variant::chunk_id_finalize);

    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    client_->set_handler([&](const recorded_request&) {
        auto now = ++active;
        auto seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        --active;
        return mock_http_client::respond(200);
    });

    auto report = run(execution_policy::bounded_parallel, 3);
    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().policy, execution_policy::bounded_parallel);
    EXPECT_EQ(report.value().chunks_sent, 12u);

    EXPECT_LE(peak.load(), 3);
    EXPECT_LE(table_->peak_in_flight(), 3u);
    EXPECT_TRUE(table_->all_committed());
    EXPECT_EQ(client_->count("POST", "/upload/chunk"), 12u);
}

TEST_F(ConcurrencyCoordinatorTest, ParallelSendsEveryChunkExactlyOnce) {
    prepare(9, protocol_variant::chunk_id_finalize);
    client_->set_handler([](const recorded_request&) { return mock_http_client::respond(201); });

    auto report = run(execution_policy::automatic, 4);
    ASSERT_TRUE(report);

    std::vector<int> seen(10, 0);
    for (const auto& req : client_->requests()) {
        auto n = chunk_number_of(req);
        ASSERT_GE(n, 1u);
        ASSERT_LE(n, 9u);
        ++seen[n];
    }
    for (uint32_t n = 1; n <= 9; ++n) {
        EXPECT_EQ(seen[n], 1) << "chunk " << n;
    }
}

TEST_F(ConcurrencyCoordinatorTest, ParallelUsesProvidedPool) {
    prepare(5, protocol_variant::chunk_id_finalize);
    client_->set_handler([](const recorded_request&) { return mock_http_client::respond(200); });

    auto pool = std::make_shared<adapters::async_worker_pool>(2);
    auto report = run(execution_policy::bounded_parallel, 2, pool);
    ASSERT_TRUE(report);
    EXPECT_TRUE(table_->all_committed());
    EXPECT_EQ(pool->pending_tasks(concurrency_coordinator::stage_name), 0u);
}

TEST_F(ConcurrencyCoordinatorTest, ParallelFailureStopsNewClaims) {
    prepare(20, protocol_variant::chunk_id_finalize);
    client_->set_handler([](const recorded_request& req) {
        auto n = encoding::extract_json_value(req.text_body, "chunkNumber").value_or("0");
        return n == "1" ? mock_http_client::respond(400, {}, "bad chunk")
                        : mock_http_client::respond(200);
    });

    auto report = run(execution_policy::bounded_parallel, 1);
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().kind, failure_kind::chunk_failure);
    ASSERT_EQ(report.error().chunk_failures.size(), 1u);
    EXPECT_EQ(report.error().chunk_failures[0].chunk_number, 1u);

    // A single worker stops claiming once its chunk failed
    EXPECT_EQ(client_->request_count(), 1u);
    EXPECT_EQ(table_->status(2), chunk_status::pending);
    EXPECT_FALSE(table_->all_committed());
}

TEST_F(ConcurrencyCoordinatorTest, ReadFailureIsReported) {
    prepare(3, protocol_variant::chunk_id_finalize);
    client_->set_handler([](const recorded_request&) { return mock_http_client::respond(200); });

    // Truncate the file after planning
    std::filesystem::resize_file(path_, 1500);

    auto report = run(execution_policy::sequential);
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().code, error_code::file_read_error);
    EXPECT_EQ(report.error().kind, failure_kind::io_error);
    EXPECT_EQ(report.error().phase, upload_phase::transmit);
    EXPECT_EQ(report.error().chunk_failures[0].chunk_number, 2u);
}

TEST(FailureKindTest, ReadFailureIsNotAConfigurationError) {
    EXPECT_EQ(classify(error_code::file_read_error), failure_kind::io_error);
    EXPECT_STREQ(to_string(failure_kind::io_error), "io_error");
    EXPECT_EQ(classify(error_code::file_not_found), failure_kind::config_error);
    EXPECT_EQ(classify(error_code::empty_file), failure_kind::config_error);
}

TEST_F(ConcurrencyCoordinatorTest, SequentialThrowingTransmitFailsThatChunk) {
    prepare(4, protocol_variant::byte_range_resumable);
    std::atomic<int> calls{0};
    client_->set_handler([&](const recorded_request&) -> result<http_response> {
        if (++calls == 2) {
            throw std::runtime_error("socket torn down");
        }
        return mock_http_client::respond(308);
    });

    auto report = run(execution_policy::sequential);
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().kind, failure_kind::internal_failure);
    EXPECT_EQ(report.error().phase, upload_phase::transmit);
    ASSERT_EQ(report.error().chunk_failures.size(), 1u);
    EXPECT_EQ(report.error().chunk_failures[0].chunk_number, 2u);
    EXPECT_NE(report.error().message.find("socket torn down"), std::string::npos);

    EXPECT_EQ(table_->status(2), chunk_status::failed);
    EXPECT_EQ(table_->status(3), chunk_status::pending);
    EXPECT_EQ(table_->in_flight_count(), 0u);
    EXPECT_EQ(client_->request_count(), 2u);
}

TEST_F(ConcurrencyCoordinatorTest, ParallelThrowingTransmitFailsThatChunk) {
    prepare(12, protocol_variant::chunk_id_finalize);
    client_->set_handler([](const recorded_request& req) -> result<http_response> {
        auto n = encoding::extract_json_value(req.text_body, "chunkNumber").value_or("0");
        if (n == "1") {
            throw std::runtime_error("boom");
        }
        return mock_http_client::respond(200);
    });

    auto report = run(execution_policy::bounded_parallel, 2);
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().kind, failure_kind::internal_failure);
    ASSERT_EQ(report.error().chunk_failures.size(), 1u);
    EXPECT_EQ(report.error().chunk_failures[0].chunk_number, 1u);
    EXPECT_EQ(report.error().chunk_failures[0].code, error_code::internal_error);

    EXPECT_EQ(table_->status(1), chunk_status::failed);
    EXPECT_EQ(table_->in_flight_count(), 0u);
    EXPECT_EQ(table_->failed_count(), 1u);

    // The failing worker stops at once; only its sibling may have claimed more
    EXPECT_LT(client_->request_count(), 12u);
}

TEST_F(ConcurrencyCoordinatorTest, ProgressPercentNeverDecreasesDuringParallelUpload) {
    constexpr uint32_t chunk_count = 24;
    prepare(chunk_count, protocol_variant::chunk_id_finalize);

    std::mt19937 gen(7);  // Fixed seed for reproducibility
    std::uniform_int_distribution<int> delay_ms(0, 6);
    std::vector<int> delays(chunk_count + 1);
    for (auto& d : delays) {
        d = delay_ms(gen);
    }

    client_->set_handler([&delays](const recorded_request& req) {
        auto n = std::stoul(
            encoding::extract_json_value(req.text_body, "chunkNumber").value_or("0"));
        std::this_thread::sleep_for(std::chrono::milliseconds(delays.at(n)));
        return mock_http_client::respond(200);
    });

    auto table = std::make_shared<progress_table>(plan_);
    auto progress = std::make_shared<progress_aggregator>();
    progress->attach(table);

    std::atomic<bool> done{false};
    std::atomic<int> malformed{0};
    std::vector<double> samples;
    std::thread sampler([&] {
        while (!done.load()) {
            auto snap = progress->snapshot();
            if (snap.chunks.size() != chunk_count || snap.total_chunks != chunk_count) {
                ++malformed;
            }
            samples.push_back(snap.percent);
            samples.push_back(progress->summary().percent);
        }
    });

    concurrency_coordinator coordinator(std::make_shared<chunk_transmitter>(client_, auth_),
                                        nullptr);
    coordinator_job job{plan_, session_, *reader_, *table};
    auto report = coordinator.run(job, execution_policy::bounded_parallel, 4);

    done.store(true);
    sampler.join();
    samples.push_back(progress->summary().percent);

    ASSERT_TRUE(report);
    EXPECT_EQ(malformed.load(), 0);
    ASSERT_GT(samples.size(), 1u);
    for (std::size_t i = 1; i < samples.size(); ++i) {
        ASSERT_GE(samples[i], samples[i - 1]) << "sample " << i;
    }
    EXPECT_DOUBLE_EQ(samples.back(), 100.0);
    EXPECT_LE(table->peak_in_flight(), 4u);
}

// =============================================================================
// Error aggregation
// =============================================================================

TEST(MakeTransmitErrorTest, AuthFailureIsPrimary) {
    std::vector<chunk_failure> failures = {
        {5, 0, error_code::connection_failed, "reset", {}},
        {3, 500, error_code::chunk_rejected, "server error", {}},
        {7, 401, error_code::auth_failed, "expired", {}},
    };

    auto err = make_transmit_error(failures);
    EXPECT_EQ(err.kind, failure_kind::auth_error);
    EXPECT_EQ(err.status_code, 401);
    ASSERT_EQ(err.chunk_failures.size(), 3u);
    EXPECT_EQ(err.chunk_failures[0].chunk_number, 3u);
    EXPECT_EQ(err.chunk_failures[2].chunk_number, 7u);
    EXPECT_NE(err.message.find("3 chunk(s) failed"), std::string::npos);
}

TEST(MakeTransmitErrorTest, RejectionOutranksTransportFailure) {
    auto err = make_transmit_error({
        {1, 0, error_code::connection_timeout, "timeout", {}},
        {2, 502, error_code::chunk_rejected, "bad gateway", {}},
    });
    EXPECT_EQ(err.kind, failure_kind::chunk_failure);
    EXPECT_EQ(err.status_code, 502);
}

TEST(MakeTransmitErrorTest, TransportOnlyIsNetworkError) {
    auto err = make_transmit_error({{4, 0, error_code::connection_failed, "reset", {}}});
    EXPECT_EQ(err.kind, failure_kind::network_error);
    EXPECT_NE(err.describe().find("#4"), std::string::npos);
}

}  // namespace kcenon::package_upload::test
