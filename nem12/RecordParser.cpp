#include "RecordParser.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <utility>

#include <glog/logging.h>
#include <folly/Conv.h>
#include <folly/String.h>

using folly::StringPiece;

ParseError::ParseError(size_t line, const std::string &reason)
  : std::runtime_error(folly::to<std::string>("Line ", line, ": ", reason))
  , line_(line)
  , reason_(reason)
{}

RecordParser::RecordParser(std::istream &in)
  : in_(in)
{}

void RecordParser::fail(const std::string &reason) const {
  throw ParseError(numLines_, reason);
}

bool RecordParser::nextReading(MeterReading &reading) {
  for (;;) {
    while (position_ < endPosition_) {
      size_t index = position_++;
      int interval = static_cast<int>(index - kFirstValueField) + 1;

      StringPiece text = folly::trimWhitespace(fields_[index]);
      if (text.empty())
        continue;

      auto value = Consumption::fromString(text);
      if (!value) {
        ++numSkipped_;
        LOG(WARNING) << "Line " << numLines_
                     << ": skipping invalid consumption value '" << text
                     << "' at interval " << interval;
        continue;
      }

      // Interval 1 ends one interval length past midnight
      Timestamp ts = intervalDate_ + std::chrono::minutes(
          static_cast<int64_t>(interval) * context_->intervalMinutes);

      try {
        reading = MeterReading(context_->nmi, ts, std::move(*value));
      } catch (const std::invalid_argument &e) {
        fail(e.what());
      }
      ++numReadings_;
      return true;
    }

    if (!nextRecord())
      return false;
  }
}

bool RecordParser::nextRecord() {
  position_ = endPosition_ = 0;

  while (state_ != State::Done) {
    if (!std::getline(in_, linebuf_)) {
      LOG_IF(WARNING, !exhausted_)
        << "Input ended after " << numLines_ << " lines without 900 record";
      exhausted_ = true;
      return false;
    }
    ++numLines_;

    StringPiece line(linebuf_);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (folly::trimWhitespace(line).empty())
      continue;

    fields_.clear();
    folly::split(',', line, fields_);
    for (StringPiece& field : fields_) {
      // Quoted fields are unwrapped. Separators inside quotes are not supported.
      StringPiece text = folly::trimWhitespace(field);
      if (text.size() >= 2 && text.front() == '"' && text.back() == '"')
        field = text.subpiece(1, text.size() - 2);
    }
    StringPiece code = folly::trimWhitespace(fields_[0]);

    if (code == kRecordContext) {
      try {
        context_ = MeterContext::fromRecord(fields_);
      } catch (const std::invalid_argument &e) {
        fail(e.what());
      }
      state_ = State::HasContext;
      ++numContexts_;
    } else if (code == kRecordInterval) {
      if (state_ != State::HasContext)
        fail("300 record found without preceding 200 record");
      beginIntervals();
      return true;
    } else if (code == kRecordEnd) {
      state_ = State::Done;
    }
    // 100, 400, 500 and unknown records carry nothing for us
  }

  return false;
}

void RecordParser::beginIntervals() {
  if (fields_.size() <= kFirstValueField)
    fail("Invalid 300 record - insufficient fields");

  StringPiece dateText = folly::trimWhitespace(fields_[1]);
  auto date = parseIntervalDate(dateText);
  if (!date)
    fail(folly::to<std::string>("Invalid date format '", dateText, "'"));

  intervalDate_ = *date;
  position_ = kFirstValueField;
  endPosition_ = std::min<size_t>(
      fields_.size(), kFirstValueField + context_->intervalsPerDay());
}

folly::Optional<Timestamp> parseIntervalDate(StringPiece s) {
  if (s.size() != 8)
    return folly::none;
  if (!std::all_of(s.begin(), s.end(),
                   [](char c) { return std::isdigit(static_cast<unsigned char>(c)); }))
    return folly::none;

  int year = folly::to<int>(s.subpiece(0, 4));
  unsigned month = folly::to<unsigned>(s.subpiece(4, 2));
  unsigned day = folly::to<unsigned>(s.subpiece(6, 2));
  if (year < 1)
    return folly::none;

  std::chrono::year_month_day date{std::chrono::year(year),
                                   std::chrono::month(month),
                                   std::chrono::day(day)};
  if (!date.ok())
    return folly::none;

  return Timestamp(std::chrono::sys_days(date));
}
