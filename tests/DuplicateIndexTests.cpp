#include <gtest/gtest.h>
#include <sqlite3.h>

#include <atomic>
#include <thread>
#include <vector>

#include "../DuplicateIndex.hpp"
#include "../errors.hpp"
#include "../utils.hpp"
#include "ScratchDirTest.hpp"

namespace {
ClaimRequest MakeRequest(const std::string& hash, const fs::path& source,
                         const fs::path& destination,
                         FileStatus status = FileStatus::ORGANIZED) {
  ClaimRequest request;
  request.hash = hash;
  request.media_type = MediaType::PHOTO;
  request.status = status;
  request.source_path = source;
  request.destination = destination;
  if (status == FileStatus::ORGANIZED) request.capture_date = CaptureDate{2023, 4};
  return request;
}

const std::string kHashA(64, 'a');
const std::string kHashB(64, 'b');
}  // namespace

class DuplicateIndexTest : public ScratchDirTest {
 protected:
  DuplicateIndex index{DuplicateIndex::IN_MEMORY};
};

TEST_F(DuplicateIndexTest, FirstClaimWinsSecondLoses) {
  const auto first = index.claim(
      MakeRequest(kHashA, "/src/a.jpg", "PHOTO/2023/04/a.jpg"), 1);
  ASSERT_TRUE(std::holds_alternative<ClaimWon>(first));
  const auto& won = std::get<ClaimWon>(first);
  EXPECT_EQ(won.destination, fs::path("PHOTO/2023/04/a.jpg"));

  const auto second = index.claim(
      MakeRequest(kHashA, "/src/copy.jpg", "PHOTO/2023/04/copy.jpg"), 1);
  ASSERT_TRUE(std::holds_alternative<ClaimLost>(second));
  const auto& lost = std::get<ClaimLost>(second);
  EXPECT_EQ(lost.canonical_id, won.record_id);
  EXPECT_EQ(lost.destination, fs::path("PHOTO/2023/04/a.jpg"));
  EXPECT_EQ(lost.source_path, fs::path("/src/a.jpg"));

  const auto counts = index.count_by_status();
  EXPECT_EQ(counts.at(FileStatus::ORGANIZED), 1);
  EXPECT_EQ(counts.at(FileStatus::DUPLICATE), 1);
}

TEST_F(DuplicateIndexTest, DuplicateRecordReferencesTheCanonicalDestination) {
  index.claim(MakeRequest(kHashA, "/src/a.jpg", "PHOTO/2023/04/a.jpg"), 4);
  index.claim(MakeRequest(kHashA, "/src/b.jpg", "PHOTO/2023/04/b.jpg"), 4);

  const auto records = index.records_for_session(4);
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[1].status, FileStatus::DUPLICATE);
  EXPECT_EQ(records[1].canonical_id, records[0].id);
  EXPECT_EQ(records[1].dest_path, records[0].dest_path);
  EXPECT_EQ(records[1].source_path, fs::path("/src/b.jpg"));
  EXPECT_EQ(records[0].capture_date, (CaptureDate{2023, 4}));
}

TEST_F(DuplicateIndexTest, ReviewRecordIsCanonicalToo) {
  const auto first = index.claim(
      MakeRequest(kHashA, "/src/x.jpg", "ToReview/PHOTO/x.jpg", FileStatus::REVIEW),
      1);
  ASSERT_TRUE(std::holds_alternative<ClaimWon>(first));

  const auto second =
      index.claim(MakeRequest(kHashA, "/src/y.jpg", "PHOTO/2023/04/y.jpg"), 1);
  ASSERT_TRUE(std::holds_alternative<ClaimLost>(second));
  EXPECT_EQ(std::get<ClaimLost>(second).destination,
            fs::path("ToReview/PHOTO/x.jpg"));

  const auto canonical = index.canonical_for(kHashA);
  ASSERT_TRUE(canonical);
  EXPECT_EQ(canonical->status, FileStatus::REVIEW);
  EXPECT_FALSE(canonical->capture_date);
}

TEST_F(DuplicateIndexTest, SameNameDifferentBytesGetsHashSuffix) {
  const fs::path dest = "PHOTO/2023/04/IMG_0001.jpg";
  index.claim(MakeRequest(kHashA, "/card1/IMG_0001.jpg", dest), 1);
  const auto second = index.claim(MakeRequest(kHashB, "/card2/IMG_0001.jpg", dest), 1);

  ASSERT_TRUE(std::holds_alternative<ClaimWon>(second));
  EXPECT_EQ(std::get<ClaimWon>(second).destination,
            hash_suffixed_path(dest, kHashB));
}

TEST_F(DuplicateIndexTest, ReleaseWithdrawsAWonClaim) {
  const auto first =
      index.claim(MakeRequest(kHashA, "/src/a.jpg", "PHOTO/2023/04/a.jpg"), 1);
  index.release(std::get<ClaimWon>(first).record_id);
  EXPECT_FALSE(index.canonical_for(kHashA));

  const auto retry =
      index.claim(MakeRequest(kHashA, "/src/a.jpg", "PHOTO/2023/04/a.jpg"), 1);
  EXPECT_TRUE(std::holds_alternative<ClaimWon>(retry));
}

TEST_F(DuplicateIndexTest, ReleaseLeavesNoDanglingDuplicates) {
  const auto first =
      index.claim(MakeRequest(kHashA, "/src/a.jpg", "PHOTO/2023/04/a.jpg"), 1);
  const auto second =
      index.claim(MakeRequest(kHashA, "/src/b.jpg", "PHOTO/2023/04/b.jpg"), 1);
  ASSERT_TRUE(std::holds_alternative<ClaimLost>(second));

  index.release(std::get<ClaimWon>(first).record_id);

  const auto records = index.all_records();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].source_path, fs::path("/src/b.jpg"));
  EXPECT_EQ(records[0].status, FileStatus::ERROR);
  EXPECT_FALSE(records[0].canonical_id);
  EXPECT_TRUE(records[0].dest_path.empty());
  EXPECT_EQ(records[0].detail, "canonical placement failed");
  EXPECT_FALSE(index.canonical_for(kHashA));
}

TEST_F(DuplicateIndexTest, FailuresAreRecorded) {
  const auto id = index.record_failure("/src/bad.jpg", "", MediaType::PHOTO,
                                       "hashing: permission denied", 2);
  const auto records = index.all_records();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].id, id);
  EXPECT_EQ(records[0].status, FileStatus::ERROR);
  EXPECT_EQ(records[0].detail, "hashing: permission denied");
  EXPECT_EQ(index.count_by_status(2).at(FileStatus::ERROR), 1);
  EXPECT_TRUE(index.count_by_status(3).empty());
}

TEST_F(DuplicateIndexTest, SessionsAreFinalizedWithCounters) {
  const auto id = index.begin_session(R"({"dry_run":false})");
  auto running = index.session(id);
  ASSERT_TRUE(running);
  EXPECT_EQ(running->state, SessionState::RUNNING);
  EXPECT_EQ(running->config_snapshot, R"({"dry_run":false})");

  SessionCounters counters{5, 2, 1, 1, 1, 3};
  index.finalize_session(id, counters, false);
  const auto finished = index.session(id);
  ASSERT_TRUE(finished);
  EXPECT_EQ(finished->state, SessionState::PARTIAL);
  EXPECT_EQ(finished->counters, counters);
  EXPECT_FALSE(finished->ended_at.empty());
  EXPECT_FALSE(index.session(id + 100));
}

TEST_F(DuplicateIndexTest, StatisticsGroupCanonicalRecords) {
  index.claim(MakeRequest(kHashA, "/src/a.jpg", "PHOTO/2023/04/a.jpg"), 1);
  index.claim(MakeRequest(kHashA, "/src/b.jpg", "PHOTO/2023/04/b.jpg"), 1);
  index.claim(MakeRequest(kHashB, "/src/c.jpg", "ToReview/PHOTO/c.jpg",
                          FileStatus::REVIEW),
              1);

  const StoreStatistics stats = index.statistics();
  EXPECT_EQ(stats.by_status.at(FileStatus::ORGANIZED), 1);
  EXPECT_EQ(stats.by_status.at(FileStatus::REVIEW), 1);
  EXPECT_EQ(stats.by_status.at(FileStatus::DUPLICATE), 1);
  EXPECT_EQ(stats.by_media.at(MediaType::PHOTO), 2);
  EXPECT_EQ(stats.by_year.at(2023), 1);
}

TEST_F(DuplicateIndexTest, ConcurrentClaimsHaveExactlyOneWinner) {
  constexpr int kThreads = 16;
  std::atomic<int> winners = 0;
  std::atomic<int> losers = 0;
  {
    std::vector<std::jthread> threads;
    for (int i = 0; i < kThreads; ++i) {
      threads.emplace_back([&, i] {
        const auto result = index.claim(
            MakeRequest(kHashA, "/src/copy" + std::to_string(i) + ".jpg",
                        "PHOTO/2023/04/copy" + std::to_string(i) + ".jpg"),
            1);
        if (std::holds_alternative<ClaimWon>(result)) {
          ++winners;
        } else {
          ++losers;
        }
      });
    }
  }
  EXPECT_EQ(winners.load(), 1);
  EXPECT_EQ(losers.load(), kThreads - 1);
  EXPECT_EQ(index.count_by_status().at(FileStatus::DUPLICATE), kThreads - 1);
}

TEST_F(DuplicateIndexTest, DurableStoreKeepsClaimsAcrossRuns) {
  const fs::path db = test_dir / "state" / "index.db";
  {
    DuplicateIndex first(db);
    EXPECT_FALSE(first.in_memory());
    first.claim(MakeRequest(kHashA, "/src/a.jpg", "PHOTO/2023/04/a.jpg"), 1);
    first.optimize();
  }
  DuplicateIndex second(db);
  const auto result =
      second.claim(MakeRequest(kHashA, "/src/a.jpg", "PHOTO/2023/04/a.jpg"), 2);
  ASSERT_TRUE(std::holds_alternative<ClaimLost>(result));
  EXPECT_EQ(std::get<ClaimLost>(result).source_path, fs::path("/src/a.jpg"));
}

TEST_F(DuplicateIndexTest, LockedStoreExhaustsRetries) {
  const fs::path db = test_dir / "locked.db";
  DatabaseConfig config;
  config.connection_timeout = 0;
  config.claim_retries = 2;
  config.claim_backoff_ms = 1;
  DuplicateIndex locked(db, config);

  // A second writer holding the write lock for the whole claim.
  sqlite3* other = nullptr;
  ASSERT_EQ(sqlite3_open(safe_path_to_string(db).c_str(), &other), SQLITE_OK);
  ASSERT_EQ(sqlite3_exec(other, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr),
            SQLITE_OK);

  EXPECT_THROW(
      locked.claim(MakeRequest(kHashA, "/src/a.jpg", "PHOTO/2023/04/a.jpg"), 1),
      IndexBusyError);

  sqlite3_exec(other, "ROLLBACK", nullptr, nullptr, nullptr);
  sqlite3_close(other);

  const auto result =
      locked.claim(MakeRequest(kHashA, "/src/a.jpg", "PHOTO/2023/04/a.jpg"), 1);
  EXPECT_TRUE(std::holds_alternative<ClaimWon>(result));
}
