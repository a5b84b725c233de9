#include "StatementGenerator.h"

#include <chrono>
#include <iterator>
#include <stdexcept>

#include <fmt/format.h>
#include <folly/Conv.h>

static const folly::StringPiece kColumns[] = {"nmi", "timestamp", "consumption"};

static std::string insertPrefix() {
  std::string ret = folly::to<std::string>(
      "INSERT INTO ", StatementGenerator::kTableName, " (");
  for (size_t i = 0; i < std::size(kColumns); ++i) {
    if (i > 0)
      ret += ", ";
    folly::toAppend('"', kColumns[i], '"', &ret);
  }
  ret += ") VALUES\n";
  return ret;
}

StatementGenerator::StatementGenerator(ReadingSource &source, int64_t batchSize)
  : source_(source)
  , batchSize_(batchSize)
{
  if (batchSize_ < 1)
    throw std::invalid_argument(folly::to<std::string>(
        "batch size must be at least 1 (got ", batchSize_, ")"));
}

bool StatementGenerator::nextStatement(std::string &statement) {
  static const std::string prefix = insertPrefix();
  int64_t rows = 0;

  statement.clear();
  while (rows < batchSize_ && source_.nextReading(reading_)) {
    if (rows == 0)
      statement.append(prefix);
    else
      statement.append(",\n");
    statement.append(formatValue(reading_));
    ++rows;
  }

  if (rows == 0)
    return false;

  statement.push_back(';');
  numReadings_ += rows;
  ++numStatements_;
  return true;
}

std::string StatementGenerator::escapeLiteral(folly::StringPiece s) {
  std::string ret;
  ret.reserve(s.size() + 2);
  for (char c : s) {
    if (c == '\'')
      ret.push_back('\'');
    ret.push_back(c);
  }
  return ret;
}

std::string StatementGenerator::formatTimestamp(Timestamp ts) {
  auto days = std::chrono::floor<std::chrono::days>(ts);
  std::chrono::year_month_day date{days};
  std::chrono::hh_mm_ss<std::chrono::seconds> time{ts - days};

  return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}",
                     static_cast<int>(date.year()),
                     static_cast<unsigned>(date.month()),
                     static_cast<unsigned>(date.day()),
                     time.hours().count(), time.minutes().count(),
                     time.seconds().count());
}

std::string StatementGenerator::formatValue(const MeterReading &reading) {
  return folly::to<std::string>(
      "('", escapeLiteral(reading.nmi()), "', '",
      formatTimestamp(reading.timestamp()), "', ",
      reading.consumption().toString(), ")");
}
