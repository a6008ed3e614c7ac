/**
 * @file postgres_job_store_test.cpp
 * @brief Integration tests for PostgresJobStore
 *
 * Needs a reachable PostgreSQL. Connection defaults match PostgresConfig and
 * can be overridden with EDGESYNC_TEST_PG_HOST / _PORT / _DB / _USER /
 * _PASSWORD. Tests are skipped when no database is reachable.
 *
 * Run: docker run -d -p 5432:5432 -e POSTGRES_USER=edgesync \
 *        -e POSTGRES_PASSWORD=edgesync_dev -e POSTGRES_DB=edgesync postgres:16
 * Then: ctest -R postgres_job_store_test
 */

#include <gtest/gtest.h>
#include <glog/logging.h>

#include <cstdlib>

#include "clock.hpp"
#include "postgres_client.hpp"
#include "postgres_job_store.hpp"
#include "sync_errors.hpp"
#include "test_helpers.hpp"

namespace edgesync::test {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

PostgresConfig test_config() {
    PostgresConfig config;
    config.host = env_or("EDGESYNC_TEST_PG_HOST", config.host);
    config.port = std::stoi(env_or("EDGESYNC_TEST_PG_PORT", std::to_string(config.port)));
    config.database = env_or("EDGESYNC_TEST_PG_DB", config.database);
    config.user = env_or("EDGESYNC_TEST_PG_USER", config.user);
    config.password = env_or("EDGESYNC_TEST_PG_PASSWORD", config.password);
    config.connect_timeout = 3;
    return config;
}

}  // namespace

class PostgresJobStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_logging("postgres_job_store_test");

        db_ = std::make_shared<PostgresClient>(test_config());
        if (!db_->is_connected()) {
            GTEST_SKIP() << "PostgreSQL not reachable: " << db_->last_error();
        }
        clock_ = std::make_shared<ManualClock>();
        store_ = std::make_shared<PostgresJobStore>(db_, clock_);
        ASSERT_TRUE(store_->ensure_schema());
        ASSERT_TRUE(db_->execute("TRUNCATE upload_jobs CASCADE").ok());
    }

    std::string enqueue(uint64_t size, int priority = 5, const std::string& name = "f.bin") {
        JobRequest request;
        request.source_path = dir_.write_file(name, size);
        request.priority = priority;
        request.metadata = {{"slide_id", "S-" + name}};
        return store_->enqueue(request);
    }

    TempDir dir_;
    std::shared_ptr<PostgresClient> db_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<PostgresJobStore> store_;
};

// =============================================================================
// Job rows
// =============================================================================

TEST_F(PostgresJobStoreTest, EnqueueRoundTrip) {
    auto id = enqueue(1000, 2, "a.bin");
    auto job = store_->get_job(id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->state, JobState::QUEUED);
    EXPECT_EQ(job->total_size, 1000u);
    EXPECT_EQ(job->priority, 2);
    EXPECT_EQ(job->metadata.at("slide_id"), "S-a.bin");
    EXPECT_EQ(job->created_at_ms, clock_->now_ms());
    EXPECT_EQ(job->highest_acked, -1);
    EXPECT_TRUE(job->upload_session_id.empty());
    EXPECT_FALSE(store_->get_job("missing").has_value());
}

TEST_F(PostgresJobStoreTest, DuplicateIdRefused) {
    JobRequest request;
    request.source_path = dir_.write_file("a.bin", 10);
    request.job_id = "fixed-id";
    store_->enqueue(request);
    EXPECT_THROW(store_->enqueue(request), InvalidJobError);
}

TEST_F(PostgresJobStoreTest, ChunkPlanPersistedOnce) {
    auto id = enqueue(11);
    store_->record_chunk_plan(id, 5);
    EXPECT_THROW(store_->record_chunk_plan(id, 4), AlreadyPlannedError);

    auto chunks = store_->get_chunks(id);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[2].offset, 10u);
    EXPECT_EQ(chunks[2].length, 1u);
    EXPECT_EQ(store_->get_job(id)->chunk_count, 3);
}

// =============================================================================
// Chunk protocol
// =============================================================================

TEST_F(PostgresJobStoreTest, OrderedAcknowledgment) {
    auto id = enqueue(15);
    store_->record_chunk_plan(id, 5);
    store_->advance_job_state(id, JobState::UPLOADING);

    EXPECT_THROW(store_->mark_chunk_sent(id, 1, "x"), IllegalTransitionError);
    EXPECT_THROW(store_->mark_chunk_acked(id, 0), IllegalTransitionError);

    store_->mark_chunk_sent(id, 0, "aa");
    store_->mark_chunk_rejected(id, 0);
    store_->mark_chunk_sent(id, 0, "aa");
    store_->mark_chunk_acked(id, 0);

    auto chunk = store_->get_chunks(id)[0];
    EXPECT_EQ(chunk.state, ChunkState::ACKED);
    EXPECT_EQ(chunk.attempts, 2);
    EXPECT_EQ(chunk.checksum, "aa");
    EXPECT_EQ(store_->get_job(id)->highest_acked, 0);

    EXPECT_THROW(store_->advance_job_state(id, JobState::COMPLETED), IllegalTransitionError);
    for (int64_t i = 1; i < 3; ++i) {
        store_->mark_chunk_sent(id, i, "bb");
        store_->mark_chunk_acked(id, i);
    }
    store_->advance_job_state(id, JobState::COMPLETED);
    EXPECT_EQ(store_->get_job(id)->state, JobState::COMPLETED);
}

TEST_F(PostgresJobStoreTest, RetryBookkeeping) {
    auto id = enqueue(15);
    store_->record_chunk_plan(id, 5);
    store_->advance_job_state(id, JobState::UPLOADING);
    store_->schedule_retry(id, 2, 12345, "timeout");

    auto job = store_->get_job(id);
    EXPECT_EQ(job->state, JobState::PAUSED);
    EXPECT_EQ(job->retry_count, 2);
    EXPECT_EQ(job->next_eligible_at_ms, 12345);
    EXPECT_EQ(job->last_error, "timeout");

    store_->advance_job_state(id, JobState::UPLOADING);
    store_->mark_chunk_sent(id, 0, "aa");
    store_->mark_chunk_acked(id, 0);
    EXPECT_EQ(store_->get_job(id)->retry_count, 0);
}

TEST_F(PostgresJobStoreTest, ResetProgress) {
    auto id = enqueue(15);
    store_->record_chunk_plan(id, 5);
    store_->advance_job_state(id, JobState::UPLOADING);
    store_->record_upload_session(id, "s-1");
    for (int64_t i = 0; i < 3; ++i) {
        store_->mark_chunk_sent(id, i, "cc");
        store_->mark_chunk_acked(id, i);
    }

    store_->reset_progress(id, 2);
    EXPECT_EQ(store_->get_job(id)->highest_acked, 1);
    EXPECT_EQ(store_->get_job(id)->upload_session_id, "s-1");

    store_->reset_progress(id, 0);
    auto job = store_->get_job(id);
    EXPECT_EQ(job->highest_acked, -1);
    EXPECT_TRUE(job->upload_session_id.empty());
    for (const auto& chunk : store_->get_chunks(id)) {
        EXPECT_EQ(chunk.state, ChunkState::PENDING);
    }
}

// =============================================================================
// Queries and durability
// =============================================================================

TEST_F(PostgresJobStoreTest, ResumableOrderAndStatus) {
    auto a = enqueue(10, 5, "a.bin");
    auto b = enqueue(20, 1, "b.bin");
    auto c = enqueue(30, 1, "c.bin");
    auto d = enqueue(40, 3, "d.bin");
    store_->advance_job_state(d, JobState::FAILED, "cancelled");

    auto jobs = store_->list_resumable_jobs();
    ASSERT_EQ(jobs.size(), 3u);
    EXPECT_EQ(jobs[0].job_id, b);
    EXPECT_EQ(jobs[1].job_id, c);
    EXPECT_EQ(jobs[2].job_id, a);

    auto status = store_->query_status();
    EXPECT_EQ(status.totals(JobState::QUEUED).count, 3);
    EXPECT_EQ(status.totals(JobState::QUEUED).total_bytes, 60u);
    EXPECT_EQ(status.totals(JobState::FAILED).count, 1);
    EXPECT_EQ(status.totals(JobState::FAILED).total_bytes, 40u);
}

TEST_F(PostgresJobStoreTest, StateSurvivesReconnect) {
    auto id = enqueue(15);
    store_->record_chunk_plan(id, 5);
    store_->advance_job_state(id, JobState::UPLOADING);
    store_->record_upload_session(id, "s-9");
    store_->mark_chunk_sent(id, 0, "aa");
    store_->mark_chunk_acked(id, 0);

    auto db = std::make_shared<PostgresClient>(test_config());
    ASSERT_TRUE(db->is_connected());
    PostgresJobStore reopened(db, clock_);

    auto job = reopened.get_job(id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->state, JobState::UPLOADING);
    EXPECT_EQ(job->highest_acked, 0);
    EXPECT_EQ(job->upload_session_id, "s-9");
    EXPECT_EQ(job->chunk_size, 5u);
}

TEST_F(PostgresJobStoreTest, RemoveTerminalOnly) {
    auto id = enqueue(15);
    store_->record_chunk_plan(id, 5);
    EXPECT_THROW(store_->remove_job(id), IllegalTransitionError);

    store_->advance_job_state(id, JobState::FAILED, "cancelled");
    EXPECT_TRUE(store_->remove_job(id));
    EXPECT_FALSE(store_->get_job(id).has_value());
    EXPECT_TRUE(store_->get_chunks(id).empty());
    EXPECT_FALSE(store_->remove_job(id));
}

TEST_F(PostgresJobStoreTest, UnreadableRowIsCorruption) {
    auto id = enqueue(15);
    ASSERT_TRUE(db_->execute("UPDATE upload_jobs SET state = 'exploded' WHERE job_id = $1",
                             {id}).ok());
    EXPECT_THROW(store_->get_job(id), StoreCorruptedError);
}

TEST_F(PostgresJobStoreTest, ResumePointBeyondPlanIsCorruption) {
    auto id = enqueue(15);
    store_->record_chunk_plan(id, 5);
    ASSERT_TRUE(db_->execute("UPDATE upload_jobs SET highest_acked = 7 WHERE job_id = $1",
                             {id}).ok());
    EXPECT_THROW(store_->list_resumable_jobs(), StoreCorruptedError);
}

}  // namespace edgesync::test
