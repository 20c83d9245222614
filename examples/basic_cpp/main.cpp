#include <tau_config/config.hpp>
#include <tau_dev/dev.hpp>
#include <tau_slog/slog.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace
{

void HandleRequest(const tau::slog::Context& ctx, int id)
{
  auto entry = tau::slog::FromContext(ctx).WithDetail("request", id);
  entry.Infof("handling request %d", id);
  if (id % 3 == 0)
  {
    entry.WithError(std::runtime_error("request rejected")).Warn("request ", id, " rejected");
  }
}

}  // namespace

int main(int argc, char** argv)
{
  auto& flags = tau::config::CommandLine();
  std::string* project = flags.String("project", "", "project id used to qualify trace names");
  bool* include_sources = flags.Bool("include-sources", true, "record the call site of each entry");
  std::string* log_file = flags.String("log-file", "", "append entries to this file instead of stdout");
  int* workers = flags.Int("workers", 2, "number of worker threads");

  tau::dev::FailFast(tau::config::Parse(argc, argv));

  // --- Output setup ---

  if (!log_file->empty())
  {
    tau::slog::SetOutput(std::make_shared<tau::slog::FileSink>(*log_file));
  }
  tau::slog::SetProject(*project);
  tau::slog::SetIncludeSources(*include_sources);

  tau::slog::Info("basic example starting with ", *workers, " workers");
  tau::slog::WithDetail("key", "value").Info("hello");
  tau::slog::WithLabels({{"component", "example"}, {"pid_valid", true}}).Notice("labels are strings");

  // --- Tracing ---

  auto span = tau::slog::SpanContext::FromTraceParent(
      "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01");
  if (span)
  {
    tau::slog::WithSpan(*span).Info("inside a traced request");
  }

  // --- Operations ---

  auto op = tau::slog::StartOperation("batch-42", "basic_example");
  op.Info("working on the batch");

  std::vector<std::thread> threads;
  auto ctx = tau::slog::WithContext(tau::slog::Context(), op);
  for (int t = 0; t < *workers; ++t)
  {
    threads.emplace_back([ctx, t]() {
      TAU_SLOG_SCOPED_CONTEXT(ctx);
      for (int i = 0; i < 3; ++i)
      {
        HandleRequest(tau::slog::Context::Current(), t * 10 + i);
      }
    });
  }
  for (auto& th : threads)
  {
    th.join();
  }
  op.EndOperation();

  // --- Errors ---

  tau::slog::WithError(std::make_error_code(std::errc::connection_refused))
      .Error("upstream unavailable");
  tau::slog::WithStack().Debug("stack on demand");

  try
  {
    throw tau::dev::NotImplemented();
  }
  catch (const tau::dev::NotImplementedError& e)
  {
    tau::slog::WithError(e).Critical("feature missing in ", e.Function());
  }

  tau::slog::Logger::Default().Flush();
  return 0;
}
