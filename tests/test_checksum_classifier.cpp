#include <gtest/gtest.h>

#include <sstream>

#include "FakeRepository.hpp"
#include "core/audit/ChecksumClassifier.hpp"
#include "core/audit/RunStats.hpp"
#include "core/report/CsvReport.hpp"
#include "core/report/ReportWriter.hpp"

using namespace fixity;

TEST(DecideStatus, NoChecksumIsMissingWhateverVerificationSays) {
  auto disabled = FakeRepository::record("obj:1", "DS", ChecksumType::Disabled, std::nullopt);
  auto noValue = FakeRepository::record("obj:1", "DS", ChecksumType::MD5, std::nullopt);
  auto disabledWithValue = FakeRepository::record("obj:1", "DS", ChecksumType::Disabled, "abc");

  for (const auto& r : {disabled, noValue, disabledWithValue}) {
    EXPECT_EQ(decide_status(r, true), ChecksumStatus::Missing);
    EXPECT_EQ(decide_status(r, false), ChecksumStatus::Missing);
    EXPECT_EQ(decide_status(r, std::nullopt), ChecksumStatus::Missing);
  }
}

TEST(DecideStatus, VerificationDecidesForRecordedChecksums) {
  auto r = FakeRepository::record("obj:1", "DS", ChecksumType::SHA256, "feed");
  EXPECT_EQ(decide_status(r, true), ChecksumStatus::Ok);
  EXPECT_EQ(decide_status(r, false), ChecksumStatus::Invalid);
  EXPECT_EQ(decide_status(r, std::nullopt), ChecksumStatus::Ok);
}

TEST(ChecksumClassifier, VerifiesEvenWhenChecksumIsMissing) {
  FakeRepository repo;
  auto r = FakeRepository::record("obj:2", "DS2", ChecksumType::Disabled, std::nullopt);
  repo.setVerified(r, true);

  ChecksumClassifier c(repo, false);
  EXPECT_EQ(c.classify(r), ChecksumStatus::Missing);
  EXPECT_EQ(repo.verifyCalls, 1);
}

TEST(ChecksumClassifier, FailedVerificationIsInvalid) {
  FakeRepository repo;
  auto r = FakeRepository::record("obj:3", "DS", ChecksumType::MD5, "abc123");
  repo.setVerified(r, false);

  ChecksumClassifier c(repo, false);
  EXPECT_EQ(c.classify(r), ChecksumStatus::Invalid);
}

TEST(ChecksumClassifier, MissingOnlySkipsVerificationAndNeverReportsInvalid) {
  FakeRepository repo;
  auto bad = FakeRepository::record("obj:3", "DS", ChecksumType::MD5, "abc123");
  auto none = FakeRepository::record("obj:3", "DS2", ChecksumType::MD5, std::nullopt);
  repo.setVerified(bad, false);

  ChecksumClassifier c(repo, true);
  EXPECT_EQ(c.classify(bad), ChecksumStatus::Ok);
  EXPECT_EQ(c.classify(none), ChecksumStatus::Missing);
  EXPECT_EQ(repo.verifyCalls, 0);
}

TEST(ChecksumClassifier, VerifiedChecksumIsSilent) {
  FakeRepository repo;
  auto r = FakeRepository::record("obj:1", "DS1", ChecksumType::MD5, "abc123");
  repo.setVerified(r, true);

  std::ostringstream out, err, csvOut;
  CsvReport csv(csvOut);
  ReportWriter report(out, err, false, &csv);
  RunStats stats;

  ChecksumClassifier c(repo, false);
  EXPECT_EQ(c.check(r, stats, report), ChecksumStatus::Ok);
  EXPECT_EQ(stats.get(Metric::Ok), 1u);
  EXPECT_EQ(out.str(), "");
  EXPECT_EQ(csvOut.str(), "");
  EXPECT_EQ(report.rowsWritten(), 0u);
}

TEST(ChecksumClassifier, MissingChecksumIsPrintedAndExported) {
  FakeRepository repo;
  auto r = FakeRepository::record("obj:2", "DS2", ChecksumType::Disabled, std::nullopt,
                                  "2013-05-01T10:00:00.000Z");
  r.mimetype = "image/tiff";
  r.versionable = false;

  std::ostringstream out, err, csvOut;
  CsvReport csv(csvOut);
  ReportWriter report(out, err, false, &csv);
  RunStats stats;

  ChecksumClassifier c(repo, false);
  EXPECT_EQ(c.check(r, stats, report), ChecksumStatus::Missing);
  EXPECT_EQ(stats.get(Metric::Missing), 1u);
  EXPECT_FALSE(stats.has(Metric::Ok));
  EXPECT_EQ(out.str(), "obj:2/DS2 - missing checksum (2013-05-01T10:00:00.000Z)\n");
  EXPECT_EQ(csvOut.str(),
            "\"obj:2\",\"DS2\",\"2013-05-01T10:00:00.000Z\",\"missing\",\"image/tiff\",\"False\"\r\n");
}

TEST(ChecksumClassifier, QuietStillExports) {
  FakeRepository repo;
  auto r = FakeRepository::record("obj:4", "DS", ChecksumType::SHA1, "abc");
  repo.setVerified(r, false);

  std::ostringstream out, err, csvOut;
  CsvReport csv(csvOut);
  ReportWriter report(out, err, true, &csv);
  RunStats stats;

  ChecksumClassifier(repo, false).check(r, stats, report);
  EXPECT_EQ(stats.get(Metric::Invalid), 1u);
  EXPECT_EQ(out.str(), "");
  EXPECT_EQ(report.rowsWritten(), 1u);
}
