#include <stdexcept>
#include <string>
#include <vector>

#include "server/plugins.hpp"
#include "server/processor.hpp"
#include "server/registry.hpp"
#include "test_support.hpp"

using voicecmd::server::Arguments;
using voicecmd::server::CancellationToken;
using voicecmd::server::CommandProcessor;
using voicecmd::server::CommandRegistry;
using voicecmd::server::OperationCancelled;
using voicecmd::server::Outcome;
using voicecmd::testing::RecordingSink;
using voicecmd::testing::TestRunner;

int main() {
  TestRunner tr("processor");

  int ok_calls = 0;
  std::vector<std::string> echoed;

  CommandRegistry registry;
  registry.define("?any_text", "/\\S.*/");
  registry.add("\"ok\"", [&](const Arguments&, const CancellationToken&) { ++ok_calls; });
  registry.add("\"boom\"", [](const Arguments&, const CancellationToken&) {
    throw std::runtime_error("boom exploded");
  });
  registry.add("\"echo\" any_text", [&](const Arguments& args, const CancellationToken&) {
    echoed.push_back(args.at(0).text);
  });
  registry.add("\"quit\"", [](const Arguments&, const CancellationToken& cancel) {
    cancel.throw_if_cancelled();
    throw OperationCancelled();
  });

  RecordingSink sink;
  CommandProcessor processor(registry.compile(), sink);
  CancellationToken live;

  // Recognized and handled.
  {
    auto result = processor.process("ok", live);
    tr.expect(result.outcome == Outcome::Handled, "ok is handled");
    tr.expect(result.command == "\"ok\"", "matched command reported");
    tr.expect(ok_calls == 1, "handler ran once");
  }

  // Not a command.
  {
    auto result = processor.process("make me a sandwich", live);
    tr.expect(result.outcome == Outcome::Unrecognized, "nonsense is unrecognized");
    tr.expect(result.command.empty(), "no command for unrecognized text");
  }

  // Handler failure is contained and carries its message.
  {
    auto result = processor.process("boom", live);
    tr.expect(result.outcome == Outcome::HandlerFailed, "throwing handler fails");
    tr.expect(result.error == "boom exploded", "failure message kept");
    auto after = processor.process("ok", live);
    tr.expect(after.outcome == Outcome::Handled, "later command unaffected by failure");
    tr.expect(ok_calls == 2, "handler ran again after failure");
  }

  // Arguments reach the handler.
  {
    auto result = processor.process("echo hello there", live);
    tr.expect(result.outcome == Outcome::Handled, "echo is handled");
    tr.expect(echoed.size() == 1 && echoed[0] == "hello there", "argument text passed");
  }

  // Already cancelled: the handler is skipped.
  {
    CancellationToken cancelled;
    cancelled.cancel();
    auto result = processor.process("ok", cancelled);
    tr.expect(result.outcome == Outcome::Cancelled, "cancelled before start");
    tr.expect(ok_calls == 2, "handler skipped when cancelled");
  }

  // A handler that gives up on cancellation is reported as cancelled, not failed.
  {
    auto result = processor.process("quit", live);
    tr.expect(result.outcome == Outcome::Cancelled, "OperationCancelled maps to cancelled");
  }

  // Dropped messages are reported as given.
  {
    processor.report({Outcome::Rejected, "ok", {}, "too many commands in flight"});
    auto found = sink.find("ok");
    tr.expect(found.has_value(), "reported message reaches the sink");
  }

  tr.expect(sink.results().size() == 8, "sink saw every outcome");
  tr.expect(sink.count(Outcome::Handled) == 3, "handled count");
  tr.expect(sink.count(Outcome::Unrecognized) == 1, "unrecognized count");
  tr.expect(sink.count(Outcome::HandlerFailed) == 1, "failed count");
  tr.expect(sink.count(Outcome::Cancelled) == 2, "cancelled count");
  tr.expect(sink.count(Outcome::Rejected) == 1, "rejected count");

  // The logging sink keeps totals.
  {
    voicecmd::server::LoggingOutcomeSink logging;
    CommandProcessor logged(registry.compile(), logging);
    logged.process("ok", live);
    logged.process("nope", live);
    logged.process("boom", live);
    auto stats = logging.stats();
    tr.expect(stats.handled == 1 && stats.unrecognized == 1 && stats.handler_failed == 1,
              "logging sink totals");
  }

  // Sleep durations that do not fit an unsigned fail instead of wrapping.
  {
    RecordingSink diag_sink;
    CommandProcessor diag(voicecmd::server::diagnostics_plugin().compile(), diag_sink);
    auto result = diag.process("sleep 4294967297", live);
    tr.expect(result.outcome == Outcome::HandlerFailed, "oversized sleep fails");
    tr.expect(result.error.find("too large") != std::string::npos, "failure names the number");
    result = diag.process("sleep 99999999999999999999999", live);
    tr.expect(result.outcome == Outcome::HandlerFailed, "sleep beyond unsigned long fails");
    result = diag.process("sleep zero", live);
    tr.expect(result.outcome == Outcome::Handled, "zero second sleep handled");
  }

  return tr.exit_code();
}
