#ifndef SQLGEN_CMD_SQL_INTERNAL_H_
#define SQLGEN_CMD_SQL_INTERNAL_H_

#include "cmd_sql.hpp"

#include <nem12/RecordParser.h>
#include <nem12/StatementGenerator.h>

#include <arrow/status.h>
#include <folly/stop_watch.h>

#include <fstream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

struct CmdSqlPriv {
  arrow::Status WriteHeader();
  arrow::Status CheckOutput(const char *what);

  CmdSqlOptions options;
  std::string input_name;

  std::vector<char> rbuf;
  std::ifstream input;
  std::ofstream output_file;
  std::ostream* output = nullptr;

  std::unique_ptr<RecordParser> parser;
  std::unique_ptr<StatementGenerator> generator;
  std::string statement;
  folly::stop_watch<> watch;
};

#endif // SQLGEN_CMD_SQL_INTERNAL_H_
