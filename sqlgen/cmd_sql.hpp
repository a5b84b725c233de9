#ifndef SQLGEN_CMD_SQL_H_
#define SQLGEN_CMD_SQL_H_

#include "cmd.hpp"

#include <arrow/type_fwd.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

struct CmdSqlOptions {
  std::string input_path;
  std::string output_path; /* "-" for stdout */
  int64_t batch_size;
};

struct CmdSqlPriv;

struct CmdSql {
  using Options = CmdSqlOptions;
  static const CmdDescription description;

  static std::unique_ptr<CmdSql> Make();
  CmdSql();
  ~CmdSql() noexcept;

  arrow::Status Init(const Options& options);
  /* Writes at most `limit` statements. */
  arrow::Status Run(int64_t limit = INT64_MAX);
  arrow::Status Finish(bool incomplete = false);

  size_t NumReadings() const noexcept;
  size_t NumStatements() const noexcept;
  size_t NumSkippedValues() const noexcept;

 private:
  std::unique_ptr<CmdSqlPriv> priv_;
};

#endif // SQLGEN_CMD_SQL_H_
