#include <gtest/gtest.h>

#include "app/audit_logger.hpp"
#include "app/log_service.hpp"
#include "archive_test_fixation.hpp"
#include "storage/mapper/jsonl_mapper.hpp"
#include "utils/parse/parse.hpp"

namespace archiver {
class LogServiceTests : public ArchiveServiceTests {
 protected:
  auto Logs() const -> std::shared_ptr<LogService> { return context_->GetLogService(); }

  void WriteLog(log_id_t id, const std::string& opered_at) {
    LogEntry entry;
    entry.id_         = id;
    entry.opered_at_  = opered_at;
    entry.oper_.main_ = "put";
    LogEntryMapper(Store()->Tree().LogFile(opered_at.substr(0, 4) + opered_at.substr(5, 2)))
        .Insert(entry);
  }
};

TEST_F(LogServiceTests, AuditLoggerAllocatesIdsAndAppends) {
  auto logger = context_->GetAuditLogger();
  auto first  = logger->Log(LogLevel::INFO, {.main_ = "config", .args_ = {"style", "off"}}, "ok");
  auto second = logger->Log(LogLevel::WARN, {.main_ = "check"}, "careful", {.vault_id_ = 0});

  EXPECT_EQ(first.id_, 1u);
  EXPECT_EQ(second.id_, 2u);
  EXPECT_EQ(Store()->LoadAutoIncr(true).Current(CounterKind::LOG), 2u);
  EXPECT_TRUE(std::filesystem::exists(Store()->Tree().LogFile(TimeProvider::NowPeriod())));

  auto logs = Store()->LoadLogEntries();
  ASSERT_EQ(logs.size(), 2u);
  EXPECT_EQ(logs[0].oper_.args_.size(), 2u);
  EXPECT_EQ(logs[1].level_, LogLevel::WARN);
  EXPECT_EQ(logs[1].links_.vault_id_.value_or(99), 0u);
  EXPECT_FALSE(logs[1].links_.archive_id_.has_value());
}

TEST_F(LogServiceTests, TailKeepsLastRecords) {
  for (log_id_t id = 1; id <= 20; ++id) {
    WriteLog(id, "2026-03-01 10:00:00");
  }
  auto tail = Logs()->GetLogs({}, 15);
  ASSERT_EQ(tail.size(), 15u);
  EXPECT_EQ(tail.front().id_, 6u);
  EXPECT_EQ(tail.back().id_, 20u);

  EXPECT_EQ(Logs()->GetLogs(parse::ParseLogRange("all")).size(), 20u);
}

TEST_F(LogServiceTests, MonthRangeSpansFiles) {
  WriteLog(3, "2026-03-05 08:00:00");
  WriteLog(1, "2026-01-20 12:00:00");
  WriteLog(2, "2026-02-11 09:30:00");
  WriteLog(4, "2026-04-01 00:00:00");

  auto single = Logs()->GetLogs(parse::ParseLogRange("202602"));
  ASSERT_EQ(single.size(), 1u);
  EXPECT_EQ(single[0].id_, 2u);

  auto span = Logs()->GetLogs(parse::ParseLogRange("202602-202603"));
  ASSERT_EQ(span.size(), 2u);
  EXPECT_EQ(span[0].id_, 2u);
  EXPECT_EQ(span[1].id_, 3u);

  EXPECT_TRUE(Logs()->GetLogs(parse::ParseLogRange("202512")).empty());
}

TEST_F(LogServiceTests, GetLogByIdResolvesLinks) {
  auto id = PutOne(MakeFile("linked.txt"));
  Vaults()->Create({.name_ = "box"});

  auto logs = Store()->LoadLogEntries();
  ASSERT_EQ(logs.size(), 2u);

  auto put = Logs()->GetLogById(logs[0].id_);
  ASSERT_TRUE(put.has_value());
  ASSERT_TRUE(put->archive_.has_value());
  EXPECT_EQ(put->archive_->id_, id);
  ASSERT_TRUE(put->vault_.has_value());
  EXPECT_EQ(put->vault_->id_, 0u);

  auto create = Logs()->GetLogById(logs[1].id_);
  ASSERT_TRUE(create.has_value());
  ASSERT_TRUE(create->vault_.has_value());
  EXPECT_EQ(create->vault_->name_, "box");

  EXPECT_FALSE(Logs()->GetLogById(999).has_value());
}
}  // namespace archiver
