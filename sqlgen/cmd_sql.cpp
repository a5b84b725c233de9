#include "cmd_sql_internal.hpp"
#include "cmd_sql.hpp"

#include <arrow/status.h>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <glog/logging.h>
#include <folly/portability/GFlags.h>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <memory>

namespace po = boost::program_options;
namespace fs = std::filesystem;
using Status = arrow::Status;

DEFINE_uint32(report_interval, 30, "Seconds between progress reports");

std::unique_ptr<CmdSql> CmdSql::Make()
{
  return std::make_unique<CmdSql>();
}

CmdSql::CmdSql()
  : priv_(std::make_unique<CmdSqlPriv>())
{}

CmdSql::~CmdSql() noexcept = default;

Status CmdSql::Init(const Options& options)
{
  CmdSqlPriv& p = *priv_;
  std::error_code ec;

  p.options = options;
  p.input_name = fs::path(options.input_path).filename().string();

  bool exists = fs::exists(options.input_path, ec);
  if (ec)
    return Status::IOError("Cannot access ", options.input_path, ": ",
                           ec.message());
  if (!exists)
    return Status::IOError("Input file not found: ", options.input_path);
  if (!fs::is_regular_file(options.input_path, ec))
    return Status::IOError("Not a file: ", options.input_path);
  if (options.batch_size < 1)
    return Status::Invalid("batch size must be at least 1 (got ",
                           options.batch_size, ")");

  p.rbuf.resize(1ull << 19);
  p.input.rdbuf()->pubsetbuf(p.rbuf.data(), p.rbuf.size());
  p.input.open(options.input_path);
  if (!p.input.is_open())
    return Status::IOError("Could not open ", options.input_path, ": ",
                           std::strerror(errno));
  p.input.exceptions(std::ios_base::badbit);

  if (options.output_path.empty() || options.output_path == "-") {
    p.output = &std::cout;
  } else {
    p.output_file.open(options.output_path, std::ios::out | std::ios::trunc);
    if (!p.output_file.is_open())
      return Status::IOError("Could not open ", options.output_path, ": ",
                             std::strerror(errno));
    p.output = &p.output_file;
  }

  p.parser = std::make_unique<RecordParser>(p.input);
  p.generator = std::make_unique<StatementGenerator>(*p.parser, options.batch_size);

  LOG(INFO) << "Reading NEM12 data from " << p.input_name
            << " (" << options.batch_size << " rows per statement)";
  return Status::OK();
}

Status CmdSqlPriv::CheckOutput(const char *what)
{
  if (!*output)
    return Status::IOError("Failed to write ", what, " to ",
                           options.output_path);
  return Status::OK();
}

Status CmdSqlPriv::WriteHeader()
{
  std::time_t now = std::time(nullptr);

  *output << "-- Generated from: " << input_name << "\n"
          << "-- Generated at: "
          << fmt::format("{:%Y-%m-%dT%H:%M:%S}", fmt::localtime(now)) << "\n"
          << "-- Batch size: " << options.batch_size << "\n\n";
  return CheckOutput("header");
}

Status CmdSql::Run(int64_t limit)
{
  CmdSqlPriv& p = *priv_;
  const auto interval = std::chrono::seconds(FLAGS_report_interval);

  CHECK(p.generator) << "Run() called before Init()";
  ARROW_RETURN_NOT_OK(p.WriteHeader());

  try {
    for (; limit > 0 && p.generator->nextStatement(p.statement); --limit) {
      p.output->write(p.statement.data(), p.statement.size());
      *p.output << "\n\n";
      ARROW_RETURN_NOT_OK(p.CheckOutput("statement"));

      if (p.watch.lap(interval)) {
        LOG(INFO) << p.input_name << ": " << p.parser->numLines()
                  << " lines read, " << p.generator->numReadings()
                  << " readings written";
      }
    }
  } catch (const ParseError& e) {
    return Status::Invalid(p.input_name, ":", e.line(), ": ", e.reason());
  } catch (const std::ios_base::failure& e) {
    return Status::IOError(p.input_name, ": ", e.what());
  }

  return Status::OK();
}

Status CmdSql::Finish(bool incomplete)
{
  CmdSqlPriv& p = *priv_;
  Status st;

  if (!p.output)
    return Status::OK();

  if (!incomplete)
    *p.output << "-- Total readings: " << NumReadings() << "\n";
  p.output->flush();
  st = p.CheckOutput("footer");

  if (p.output_file.is_open())
    p.output_file.close();
  p.input.close();

  LOG_IF(WARNING, NumSkippedValues() > 0)
    << NumSkippedValues() << " invalid consumption values skipped";
  if (!incomplete && st.ok()) {
    LOG(INFO) << "Successfully processed " << NumReadings() << " readings ("
              << NumStatements() << " statements)";
  }
  return st;
}

size_t CmdSql::NumReadings() const noexcept {
  return priv_->generator ? priv_->generator->numReadings() : 0;
}

size_t CmdSql::NumStatements() const noexcept {
  return priv_->generator ? priv_->generator->numStatements() : 0;
}

size_t CmdSql::NumSkippedValues() const noexcept {
  return priv_->parser ? priv_->parser->numSkippedValues() : 0;
}

////////////////////////////////////////////////////////////////////////////////

const CmdDescription CmdSql::description = {
  .name = "sql",
  .args = "nem12_csv_path",
  .abstract = "Convert NEM12 interval data into SQL INSERT statements",
  .help = "Read a NEM12 meter data file and write multi-row INSERT\n"
          " statements for the meter_readings table.\n\n"
          "Glossary:\nNMI - National Meter Identifier (1-10 characters)\n"
          "200 record: NMI details, declares the interval length\n"
          "300 record: one day of interval values for the current NMI\n"
          "900 record: end of data, nothing after it is read\n",
};

template <>
void CmdOps<CmdSql>::BindOptions(po::options_description& description,
                                 CmdSqlOptions& options)
{
  description.add_options()
      ("output,o",
       po::value(&options.output_path)->default_value("-"),
       "SQL output path. Writes to stdout by default.")
      ("batch-size,b",
       po::value(&options.batch_size)->default_value(
           StatementGenerator::kDefaultBatchSize),
       "Number of rows per INSERT statement.");
}

template <>
Status CmdOps<CmdSql>::StoreArgs(const po::variables_map& vm,
                                 const std::vector<std::string>& args,
                                 CmdSqlOptions& options)
{
  if (args.size() != 1u)
    return Status::Invalid("NEM12 input path expected");
  options.input_path = args[0];
  return Status::OK();
}
