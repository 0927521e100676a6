#include <gtest/gtest.h>

#include <sstream>

#include "FakeRepository.hpp"
#include "core/audit/RepairDecider.hpp"
#include "core/audit/RunStats.hpp"
#include "core/report/ReportWriter.hpp"

using namespace fixity;

namespace {

struct RepairTest : ::testing::Test {
  FakeRepository repo;
  std::ostringstream out, err;
  ReportWriter report{out, err, false};
  RunStats stats;
};

} // namespace

TEST_F(RepairTest, RepairsDisabledChecksum) {
  auto ds = FakeRepository::record("obj:2", "DS2", ChecksumType::Disabled, std::nullopt);
  RepairDecider d(repo, ChecksumType::SHA256, {});

  RepairOutcome o = d.maybeRepair(ds, stats, report);
  EXPECT_TRUE(o.attempted);
  EXPECT_TRUE(o.updated);
  EXPECT_TRUE(o.error.empty());
  EXPECT_EQ(stats.get(Metric::Updated), 1u);
  EXPECT_FALSE(stats.has(Metric::SaveErrors));

  ASSERT_EQ(repo.saves.size(), 1u);
  EXPECT_EQ(repo.saves[0].pid, "obj:2");
  EXPECT_EQ(repo.saves[0].dsid, "DS2");
  EXPECT_EQ(repo.saves[0].type, ChecksumType::SHA256);
}

TEST_F(RepairTest, RepairsMissingValueWithRepositoryDefault) {
  auto ds = FakeRepository::record("obj:2", "DS", ChecksumType::MD5, std::nullopt);
  RepairDecider d(repo, ChecksumType::Default, {});

  EXPECT_TRUE(d.maybeRepair(ds, stats, report).updated);
  ASSERT_EQ(repo.saves.size(), 1u);
  EXPECT_EQ(repo.saves[0].type, ChecksumType::Default);
}

TEST_F(RepairTest, LeavesGoodChecksumAlone) {
  auto ds = FakeRepository::record("obj:1", "DS1", ChecksumType::MD5, "abc123");
  RepairDecider d(repo, ChecksumType::SHA256, {"OTHER"});

  RepairOutcome o = d.maybeRepair(ds, stats, report);
  EXPECT_FALSE(o.attempted);
  EXPECT_FALSE(o.updated);
  EXPECT_TRUE(repo.saves.empty());
  EXPECT_TRUE(stats.snapshot().empty());
}

TEST_F(RepairTest, ForcedDatastreamIsRepairedEvenWithChecksum) {
  auto ds = FakeRepository::record("obj:3", "DS3", ChecksumType::MD5, "abc123");
  RepairDecider d(repo, ChecksumType::SHA512, {"DS3"});

  EXPECT_TRUE(d.shouldRepair(ds));
  RepairOutcome o = d.maybeRepair(ds, stats, report);
  EXPECT_TRUE(o.attempted);
  EXPECT_EQ(stats.get(Metric::Updated), 1u);
  ASSERT_EQ(repo.saves.size(), 1u);
  EXPECT_EQ(repo.saves[0].dsid, "DS3");
}

TEST_F(RepairTest, SaveFailureIsCountedNotThrown) {
  repo.failingSaves.insert("DS2");
  auto ds = FakeRepository::record("obj:2", "DS2", ChecksumType::Disabled, std::nullopt);
  RepairDecider d(repo, ChecksumType::SHA256, {});

  RepairOutcome o;
  EXPECT_NO_THROW(o = d.maybeRepair(ds, stats, report));
  EXPECT_TRUE(o.attempted);
  EXPECT_FALSE(o.updated);
  EXPECT_EQ(o.error, "HTTP 500: boom");
  EXPECT_EQ(stats.get(Metric::SaveErrors), 1u);
  EXPECT_EQ(stats.get(Metric::Updated), 0u);
  EXPECT_EQ(err.str(), "Error saving obj:2/DS2 : HTTP 500: boom\n");
}
