#include "server/processor.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace voicecmd::server {

std::string to_string(Outcome outcome) {
  switch (outcome) {
    case Outcome::Handled:
      return "handled";
    case Outcome::Unrecognized:
      return "unrecognized";
    case Outcome::HandlerFailed:
      return "handler failed";
    case Outcome::Rejected:
      return "rejected";
    case Outcome::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

void LoggingOutcomeSink::record(const ProcessResult& result) {
  switch (result.outcome) {
    case Outcome::Handled:
      ++handled_;
      spdlog::info("[command] handled '{}' ({})", result.text, result.command);
      break;
    case Outcome::Unrecognized:
      ++unrecognized_;
      spdlog::info("[command] unrecognized '{}'{}", result.text,
                   result.error.empty() ? "" : ": " + result.error);
      break;
    case Outcome::HandlerFailed:
      ++handler_failed_;
      spdlog::error("[command] handler for '{}' failed: {}", result.command, result.error);
      break;
    case Outcome::Rejected:
      ++rejected_;
      spdlog::warn("[command] rejected '{}': {}", result.text, result.error);
      break;
    case Outcome::Cancelled:
      ++cancelled_;
      spdlog::debug("[command] cancelled '{}'", result.text);
      break;
  }
}

LoggingOutcomeSink::Stats LoggingOutcomeSink::stats() const {
  Stats s;
  s.handled = handled_.load();
  s.unrecognized = unrecognized_.load();
  s.handler_failed = handler_failed_.load();
  s.rejected = rejected_.load();
  s.cancelled = cancelled_.load();
  return s;
}

CommandProcessor::CommandProcessor(std::shared_ptr<const CommandSet> commands,
                                   OutcomeSink& sink)
    : commands_(std::move(commands)), sink_(sink) {}

ProcessResult CommandProcessor::process(const std::string& text,
                                        const CancellationToken& cancel) const {
  ProcessResult result = run(text, cancel);
  sink_.record(result);
  return result;
}

void CommandProcessor::report(ProcessResult result) const {
  sink_.record(result);
}

ProcessResult CommandProcessor::run(const std::string& text,
                                    const CancellationToken& cancel) const {
  ProcessResult result;
  result.text = text;

  auto parsed = commands_->parse(text);
  if (!parsed) {
    result.outcome = Outcome::Unrecognized;
    return result;
  }
  result.command = parsed->command;

  const HandlerFn* handler = commands_->find_handler(parsed->command);
  if (handler == nullptr) {
    // Only possible if the grammar and handler table disagree.
    result.outcome = Outcome::HandlerFailed;
    result.error = "no handler registered";
    return result;
  }

  if (cancel.cancelled()) {
    result.outcome = Outcome::Cancelled;
    return result;
  }

  try {
    (*handler)(parsed->args, cancel);
    result.outcome = Outcome::Handled;
  } catch (const OperationCancelled&) {
    result.outcome = Outcome::Cancelled;
  } catch (const std::exception& ex) {
    result.outcome = Outcome::HandlerFailed;
    result.error = ex.what();
  } catch (...) {
    result.outcome = Outcome::HandlerFailed;
    result.error = "non-standard exception";
  }
  return result;
}

}  // namespace voicecmd::server
