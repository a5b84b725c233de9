#ifndef NEM12_RECORD_PARSER_H
#define NEM12_RECORD_PARSER_H

#include <cstddef>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

#include <folly/Optional.h>
#include <folly/Range.h>

#include "MeterContext.h"
#include "MeterReading.h"
#include "ReadingSource.h"

/* Structural problem in the input. Aborts the whole parse. */
class ParseError : public std::runtime_error {
 public:
  ParseError(size_t line, const std::string &reason);

  size_t line() const noexcept { return line_; }
  const std::string& reason() const noexcept { return reason_; }

 private:
  size_t line_;
  std::string reason_;
};

/* Streaming NEM12 reader.
 *
 * Threads the meter context declared by 200 records down to the 300
 * records that follow and expands each 300 record into one reading per
 * populated interval value. Stops at the 900 record; nothing after it
 * is read. Only the current line is held in memory.
 *
 * Every parser owns its state, so independent files may be processed
 * by independent instances. */
class RecordParser final : public ReadingSource {
 public:
  enum class State { NoContext, HasContext, Done };

  static constexpr folly::StringPiece kRecordContext = "200";
  static constexpr folly::StringPiece kRecordInterval = "300";
  static constexpr folly::StringPiece kRecordEnd = "900";

  /** Index of the first consumption value in a 300 record. */
  static constexpr size_t kFirstValueField = 2;

  /** Parse from a stream which must outlive the parser. */
  explicit RecordParser(std::istream &in);

  /** Fetch next reading. Returns false after the 900 record or at the
    * end of input. Throws `ParseError` on malformed structure. Bad
    * individual values are logged and skipped. */
  bool nextReading(MeterReading &reading) override;

  State state() const noexcept { return state_; }
  const folly::Optional<MeterContext>& context() const noexcept { return context_; }

  /** Physical lines consumed so far, blank ones included. */
  size_t numLines() const noexcept { return numLines_; }
  size_t numReadings() const noexcept { return numReadings_; }
  size_t numSkippedValues() const noexcept { return numSkipped_; }
  size_t numContexts() const noexcept { return numContexts_; }

 private:
  bool nextRecord();
  void beginIntervals();
  [[noreturn]] void fail(const std::string &reason) const;

  std::istream &in_;
  State state_ = State::NoContext;
  folly::Optional<MeterContext> context_;
  bool exhausted_ = false;

  // current line and its fields; pieces point into linebuf_
  std::string linebuf_;
  std::vector<folly::StringPiece> fields_;

  // expansion cursor over fields_ of the current 300 record
  Timestamp intervalDate_;
  size_t position_ = 0;
  size_t endPosition_ = 0;

  size_t numLines_ = 0;
  size_t numReadings_ = 0;
  size_t numSkipped_ = 0;
  size_t numContexts_ = 0;
};

/** Parse a YYYYMMDD calendar date as midnight UTC.
  * Returns none unless `s` is exactly 8 digits naming a real date. */
folly::Optional<Timestamp> parseIntervalDate(folly::StringPiece s);

#endif // NEM12_RECORD_PARSER_H
