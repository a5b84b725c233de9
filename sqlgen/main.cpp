#include "cmd_sql.hpp"

#include <arrow/status.h>
#include <glog/logging.h>

#include <folly/experimental/NestedCommandLineApp.h>
#include <folly/portability/GFlags.h>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include <clocale>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace po = boost::program_options;

/* Exit status for input that was readable but not valid NEM12. */
static constexpr int kExitMalformedInput = 2;
static constexpr int kExitFailure = 1;

static int64_t RUN_LIMIT = INT64_MAX;

template <class CommandType>
struct CommandRegistar {
  void operator()(const po::variables_map& kwargs,
                  const std::vector<std::string>& args)
  {
    status = CmdOps<CommandType>::StoreArgs(kwargs, args, options);
    if (!status.ok())
      throw folly::ProgramExit(kExitFailure, status.message());

    auto command = CommandType::Make();

    status = command->Init(options);
    if (!status.ok())
      throw folly::ProgramExit(kExitFailure, std::string("Init: ") + status.message());

    status = command->Run(RUN_LIMIT);
    if (!status.ok()) {
      ARROW_WARN_NOT_OK(command->Finish(true), "Finish");
      throw folly::ProgramExit(ExitCode(status), std::string("Run: ") + status.message());
    }

    status = command->Finish(false);
    if (!status.ok())
      throw folly::ProgramExit(ExitCode(status), std::string("Finish: ") + status.message());
  }

  static int ExitCode(const arrow::Status& st) {
    return st.IsInvalid() ? kExitMalformedInput : kExitFailure;
  }

  void Register(folly::NestedCommandLineApp& app) {
    CmdOps<CommandType>::BindOptions(
        app.addCommand(
            CommandType::description.name,
            CommandType::description.args,
            CommandType::description.abstract,
            CommandType::description.help,
            std::ref(*this)),
        options);
  }

  static CommandRegistar<CommandType> instance;
  typename CommandType::Options options;
  arrow::Status status;
};

template<> CommandRegistar<CmdSql> CommandRegistar<CmdSql>::instance{};

int main(int argc, const char* argv[]) {
  setlocale(LC_ALL, "C");
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();
  FLAGS_logtostderr = 1;

  folly::NestedCommandLineApp app{argv[0], "1.0", "", "", nullptr};
  app.addGFlags(folly::ProgramOptionsStyle::GNU);
  app.globalOptions().add_options()
      ("limit,l", po::value(&RUN_LIMIT)->default_value(INT64_MAX),
       "Stop after writing this many statements");

  CommandRegistar<CmdSql>::instance.Register(app);

  return app.run(argc, argv);
}
