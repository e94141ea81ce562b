#include <gtest/gtest.h>

#include <algorithm>
#include <format>
#include <map>
#include <mutex>
#include <sstream>
#include <variant>
#include <vector>

#include "../ContentHasher.hpp"
#include "../DuplicateIndex.hpp"
#include "../IOManager.hpp"
#include "../IngestPipeline.hpp"
#include "ScratchDirTest.hpp"

namespace {
// Capture dates from file names only, so the tests do not depend on EXIF.
class FileNameDateResolver : public DateResolver {
 public:
  std::optional<CaptureDate> resolve(const fs::path& path) const override {
    return MediaDateResolver::date_from_filename(path);
  }
};

std::size_t CountWithStatus(const std::vector<FileRecord>& records,
                            FileStatus status) {
  return static_cast<std::size_t>(
      std::count_if(records.begin(), records.end(),
                    [status](const FileRecord& r) { return r.status == status; }));
}

std::uint64_t Outcomes(const SessionCounters& c) {
  return c.organized + c.duplicate + c.review + c.error;
}
}  // namespace

class IngestPipelineTest : public ScratchDirTest {
 protected:
  void SetUp() override {
    ScratchDirTest::SetUp();
    source = test_dir / "source";
    archive = test_dir / "archive";
    fs::create_directories(source);
  }

  Config MakeConfig(int workers = 1) const {
    Config config;
    config.source = source;
    config.destination = archive;
    config.database = test_dir / "index.db";
    config.log = test_dir / "run.log";
    config.scan.photo_extensions = {".jpg"};
    config.scan.video_extensions = {".mp4"};
    config.parallel.max_workers = workers;
    return config;
  }

  RunSummary Run(const Config& config, DuplicateIndex& index) {
    IngestPipeline pipeline(config, index, dates);
    return pipeline.run();
  }

  FileNameDateResolver dates;
  fs::path source;
  fs::path archive;
};

TEST_F(IngestPipelineTest, DatedPhotoAndItsCopy) {
  CreateDummyFile("source/IMG_20230401_photo.jpg", "identical jpeg bytes");
  CreateDummyFile("source/IMG_20230401_copy.jpg", "identical jpeg bytes");
  DuplicateIndex index(DuplicateIndex::IN_MEMORY);

  const RunSummary summary = Run(MakeConfig(), index);

  EXPECT_TRUE(summary.completed);
  EXPECT_EQ(summary.counters.seen, 2u);
  EXPECT_EQ(summary.counters.organized, 1u);
  EXPECT_EQ(summary.counters.duplicate, 1u);
  EXPECT_EQ(summary.counters.error, 0u);

  const auto records = index.records_for_session(summary.session_id);
  ASSERT_EQ(records.size(), 2u);
  const auto organized =
      std::find_if(records.begin(), records.end(), [](const FileRecord& r) {
        return r.status == FileStatus::ORGANIZED;
      });
  const auto duplicate =
      std::find_if(records.begin(), records.end(), [](const FileRecord& r) {
        return r.status == FileStatus::DUPLICATE;
      });
  ASSERT_NE(organized, records.end());
  ASSERT_NE(duplicate, records.end());

  // Which copy wins is up to scheduling; the layout is not.
  EXPECT_EQ(organized->dest_path, fs::path("PHOTO") / "2023" / "04" /
                                      organized->source_path.filename());
  EXPECT_EQ(duplicate->dest_path, organized->dest_path);
  EXPECT_EQ(duplicate->canonical_id, organized->id);
  EXPECT_EQ(ReadFile(archive / organized->dest_path), "identical jpeg bytes");
  EXPECT_EQ(ReadFile(archive / "PHOTO_DUPLICATES" /
                     duplicate->source_path.filename()),
            "identical jpeg bytes");

  // Copy mode leaves the source tree alone.
  EXPECT_EQ(Snapshot(source).size(), 2u);

  const auto session = index.session(summary.session_id);
  ASSERT_TRUE(session);
  EXPECT_EQ(session->state, SessionState::COMPLETED);
  EXPECT_EQ(session->counters, summary.counters);
}

TEST_F(IngestPipelineTest, UndatedFileGoesToReview) {
  CreateDummyFile("source/holiday.jpg", "no date anywhere");
  DuplicateIndex index(DuplicateIndex::IN_MEMORY);

  const RunSummary summary = Run(MakeConfig(), index);

  EXPECT_EQ(summary.counters.review, 1u);
  EXPECT_EQ(summary.counters.error, 0u);
  EXPECT_EQ(ReadFile(archive / "ToReview" / "PHOTO" / "holiday.jpg"),
            "no date anywhere");
  const auto records = index.all_records();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].status, FileStatus::REVIEW);
}

TEST_F(IngestPipelineTest, SecondRunOnlyFindsDuplicates) {
  CreateDummyFile("source/IMG_20230401_a.jpg", "a");
  CreateDummyFile("source/IMG_20230401_a_copy.jpg", "a");
  CreateDummyFile("source/trip/VID_20190714.mp4", "video");
  CreateDummyFile("source/scan.jpg", "undated");
  const Config config = MakeConfig(4);

  std::map<std::string, std::string> first_tree;
  {
    DuplicateIndex index(config.database);
    const RunSummary first = Run(config, index);
    EXPECT_EQ(first.counters.organized, 2u);
    EXPECT_EQ(first.counters.review, 1u);
    EXPECT_EQ(first.counters.duplicate, 1u);
    first_tree = Snapshot(archive);
  }

  DuplicateIndex index(config.database);
  const RunSummary second = Run(config, index);
  EXPECT_EQ(second.counters.seen, 4u);
  EXPECT_EQ(second.counters.organized, 0u);
  EXPECT_EQ(second.counters.review, 0u);
  EXPECT_EQ(second.counters.duplicate, 4u);
  EXPECT_EQ(second.counters.error, 0u);
  EXPECT_EQ(Snapshot(archive), first_tree);

  const auto records = index.records_for_session(second.session_id);
  EXPECT_EQ(CountWithStatus(records, FileStatus::DUPLICATE), 4u);
}

TEST_F(IngestPipelineTest, ClaimWithoutAFileIsPlacedOnTheNextRun) {
  const fs::path photo = CreateDummyFile("source/IMG_20230401_a.jpg", "a");
  const Config config = MakeConfig();
  const fs::path relative =
      fs::path("PHOTO") / "2023" / "04" / "IMG_20230401_a.jpg";

  // A run that died between committing the claim and writing the file.
  {
    DuplicateIndex index(config.database);
    ClaimRequest request;
    request.hash = ContentHasher().hash_file(photo);
    request.media_type = MediaType::PHOTO;
    request.source_path = photo;
    request.destination = relative;
    request.capture_date = CaptureDate{2023, 4};
    ASSERT_TRUE(std::holds_alternative<ClaimWon>(index.claim(request, 1)));
  }
  ASSERT_FALSE(fs::exists(archive / relative));

  DuplicateIndex index(config.database);
  const RunSummary summary = Run(config, index);

  EXPECT_EQ(summary.counters.error, 0u);
  EXPECT_EQ(ReadFile(archive / relative), "a");
  EXPECT_EQ(Snapshot(archive).size(), 1u);
}

TEST_F(IngestPipelineTest, ExactlyOneWinnerForAnyWorkerCount) {
  constexpr int kCopies = 8;
  for (int i = 0; i < kCopies; ++i) {
    CreateDummyFile(std::format("source/dir{}/IMG_20220105_{}.jpg", i % 3, i),
               "the same bytes everywhere");
  }

  for (int workers = 1; workers <= 16; ++workers) {
    SCOPED_TRACE(std::format("{} worker(s)", workers));
    Config config = MakeConfig(workers);
    config.destination = test_dir / std::format("archive{}", workers);
    DuplicateIndex index(DuplicateIndex::IN_MEMORY);

    const RunSummary summary = Run(config, index);
    EXPECT_EQ(summary.workers, static_cast<std::size_t>(workers));
    EXPECT_EQ(summary.counters.organized, 1u);
    EXPECT_EQ(summary.counters.duplicate, kCopies - 1u);
    EXPECT_EQ(Outcomes(summary.counters), summary.counters.seen);

    const auto records = index.all_records();
    EXPECT_EQ(CountWithStatus(records, FileStatus::ORGANIZED), 1u);
    EXPECT_EQ(CountWithStatus(records, FileStatus::DUPLICATE), kCopies - 1u);

    const auto tree = Snapshot(config.destination);
    std::size_t organized_files = 0;
    for (const auto& [path, content] : tree) {
      if (path.starts_with("PHOTO/2022/01/")) ++organized_files;
    }
    EXPECT_EQ(organized_files, 1u);
    EXPECT_EQ(tree.size(), static_cast<std::size_t>(kCopies));
  }
}

TEST_F(IngestPipelineTest, SameNameDifferentBytesAreBothKept) {
  CreateDummyFile("source/card1/IMG_20230401_0001.jpg", "first camera");
  CreateDummyFile("source/card2/IMG_20230401_0001.jpg", "second camera");
  DuplicateIndex index(DuplicateIndex::IN_MEMORY);

  const RunSummary summary = Run(MakeConfig(2), index);

  EXPECT_EQ(summary.counters.organized, 2u);
  const auto tree = Snapshot(archive);
  ASSERT_EQ(tree.size(), 2u);
  EXPECT_TRUE(tree.contains("PHOTO/2023/04/IMG_20230401_0001.jpg"));
  for (const auto& record : index.all_records()) {
    EXPECT_EQ(ReadFile(archive / record.dest_path),
              ReadFile(record.source_path));
  }
}

TEST_F(IngestPipelineTest, DryRunWritesNothingButCountsTheSame) {
  CreateDummyFile("source/IMG_20230401_photo.jpg", "bytes");
  CreateDummyFile("source/IMG_20230401_copy.jpg", "bytes");
  CreateDummyFile("source/holiday.jpg", "undated");
  CreateDummyFile("source/notes.txt", "ignored");

  Config dry = MakeConfig(3);
  dry.dry_run = true;
  const auto source_before = Snapshot(source);

  SessionCounters dry_counters;
  {
    DuplicateIndex index(DuplicateIndex::IN_MEMORY);
    dry_counters = Run(dry, index).counters;
  }
  EXPECT_FALSE(fs::exists(archive));
  EXPECT_FALSE(fs::exists(dry.database));
  EXPECT_EQ(Snapshot(source), source_before);

  DuplicateIndex index(DuplicateIndex::IN_MEMORY);
  const SessionCounters real_counters = Run(MakeConfig(3), index).counters;
  EXPECT_EQ(dry_counters, real_counters);
}

TEST_F(IngestPipelineTest, ResetThenRerunReproducesTheFirstRun) {
  CreateDummyFile("source/IMG_20230401_photo.jpg", "photo");
  CreateDummyFile("source/VID_20200101.mp4", "video");
  CreateDummyFile("source/holiday.jpg", "undated");
  const Config config = MakeConfig(1);

  SessionCounters first_counters;
  std::map<std::string, std::string> first_tree;
  {
    DuplicateIndex index(config.database);
    first_counters = Run(config, index).counters;
    first_tree = Snapshot(archive);
  }

  std::istringstream in;
  std::ostringstream out;
  ASSERT_TRUE(IOManager::reset_environment(config, true, in, out));
  IOManager::close_logger();
  EXPECT_TRUE(Snapshot(archive).empty());

  DuplicateIndex index(config.database);
  const RunSummary rerun = Run(config, index);
  EXPECT_EQ(rerun.counters, first_counters);
  EXPECT_EQ(Snapshot(archive), first_tree);
  EXPECT_EQ(rerun.counters.organized, 2u);
}

TEST_F(IngestPipelineTest, OneBadFileDoesNotStopTheRun) {
  CreateDummyFile("source/IMG_20230401_photo.jpg", "photo");
  CreateDummyFile("source/VID_20200101.mp4", "video");
  // A plain file where the PHOTO folder has to go.
  CreateDummyFile("archive/PHOTO", "blocker");
  DuplicateIndex index(DuplicateIndex::IN_MEMORY);

  const RunSummary summary = Run(MakeConfig(2), index);

  EXPECT_TRUE(summary.completed);
  EXPECT_EQ(summary.counters.seen, 2u);
  EXPECT_EQ(summary.counters.error, 1u);
  EXPECT_EQ(summary.counters.organized, 1u);
  EXPECT_TRUE(fs::exists(archive / "VIDEO" / "2020" / "01" / "VID_20200101.mp4"));

  const auto records = index.all_records();
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(CountWithStatus(records, FileStatus::ORGANIZED), 1u);
  EXPECT_EQ(CountWithStatus(records, FileStatus::ERROR), 1u);
  for (const auto& record : records) {
    if (record.status == FileStatus::ERROR) {
      EXPECT_EQ(record.source_path.filename(), "IMG_20230401_photo.jpg");
      EXPECT_EQ(record.detail.rfind("placing:", 0), 0u);
      EXPECT_FALSE(record.hash.empty());
    }
  }
  // The failed claim was withdrawn.
  const auto failed = std::find_if(records.begin(), records.end(),
                                   [](const FileRecord& r) {
                                     return r.status == FileStatus::ERROR;
                                   });
  ASSERT_NE(failed, records.end());
  EXPECT_FALSE(index.canonical_for(failed->hash));
}

TEST_F(IngestPipelineTest, MoveModeEmptiesTheSource) {
  CreateDummyFile("source/IMG_20230401_photo.jpg", "bytes");
  CreateDummyFile("source/IMG_20230401_copy.jpg", "bytes");
  Config config = MakeConfig(2);
  config.transfer_mode = TransferMode::MOVE;
  DuplicateIndex index(DuplicateIndex::IN_MEMORY);

  const RunSummary summary = Run(config, index);

  EXPECT_EQ(summary.counters.organized, 1u);
  EXPECT_EQ(summary.counters.duplicate, 1u);
  EXPECT_TRUE(Snapshot(source).empty());
  EXPECT_EQ(Snapshot(archive).size(), 2u);
}

TEST_F(IngestPipelineTest, StopBeforeRunFinalizesAPartialSession) {
  CreateDummyFile("source/IMG_20230401_photo.jpg", "bytes");
  DuplicateIndex index(DuplicateIndex::IN_MEMORY);
  IngestPipeline pipeline(MakeConfig(), index, dates);

  pipeline.request_stop();
  const RunSummary summary = pipeline.run();

  EXPECT_FALSE(summary.completed);
  EXPECT_EQ(summary.counters.seen, 0u);
  const auto session = index.session(summary.session_id);
  ASSERT_TRUE(session);
  EXPECT_EQ(session->state, SessionState::PARTIAL);
  EXPECT_FALSE(fs::exists(archive / "PHOTO"));
}

TEST_F(IngestPipelineTest, ProgressHandlerSeesEveryFile) {
  for (int i = 0; i < 5; ++i) {
    CreateDummyFile(std::format("source/IMG_2021030{}.jpg", i + 1), std::to_string(i));
  }
  DuplicateIndex index(DuplicateIndex::IN_MEMORY);
  IngestPipeline pipeline(MakeConfig(3), index, dates);

  std::mutex mutex;
  std::vector<std::uint64_t> seen;
  pipeline.set_progress_handler([&](const SessionCounters& counters) {
    std::scoped_lock lock(mutex);
    seen.push_back(Outcomes(counters));
  });
  const RunSummary summary = pipeline.run();

  EXPECT_EQ(summary.counters.organized, 5u);
  EXPECT_EQ(pipeline.progress(), summary.counters);
  std::scoped_lock lock(mutex);
  ASSERT_FALSE(seen.empty());
  EXPECT_EQ(seen.back(), 5u);
}
