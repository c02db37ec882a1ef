#include <atomic>
#include <chrono>
#include <string>

#include "server/dispatcher.hpp"
#include "server/processor.hpp"
#include "server/registry.hpp"
#include "server/thread_pool.hpp"
#include "test_support.hpp"

using voicecmd::OverflowPolicy;
using voicecmd::ReceiveStatus;
using voicecmd::server::Arguments;
using voicecmd::server::CancellationToken;
using voicecmd::server::CommandProcessor;
using voicecmd::server::CommandRegistry;
using voicecmd::server::ConnectionDispatcher;
using voicecmd::server::DispatcherOptions;
using voicecmd::server::OperationCancelled;
using voicecmd::server::Outcome;
using voicecmd::server::ThreadPool;
using voicecmd::testing::Latch;
using voicecmd::testing::RecordingSink;
using voicecmd::testing::ScriptedStream;
using voicecmd::testing::TestRunner;
using namespace std::chrono_literals;

namespace {

struct Fixture {
  Latch fast_ran;
  std::atomic<bool> slow_saw_fast{false};
  Latch hold;

  CommandRegistry registry() {
    CommandRegistry r;
    r.add("\"ping\"", [](const Arguments&, const CancellationToken&) {});
    r.add("\"slow\"", [this](const Arguments&, const CancellationToken&) {
      slow_saw_fast = fast_ran.wait(3000ms);
    });
    r.add("\"fast\"", [this](const Arguments&, const CancellationToken&) { fast_ran.set(); });
    r.add("\"hold\"", [this](const Arguments&, const CancellationToken&) { hold.wait(200ms); });
    r.add("\"sleep\"", [](const Arguments&, const CancellationToken& cancel) {
      if (!cancel.wait_for(5000ms)) throw OperationCancelled();
    });
    return r;
  }
};

DispatcherOptions options(std::size_t max_inflight, OverflowPolicy policy,
                          std::size_t max_frame = 1024) {
  DispatcherOptions o;
  o.max_frame_length = max_frame;
  o.max_inflight = max_inflight;
  o.overflow_policy = policy;
  return o;
}

}  // namespace

int main() {
  TestRunner tr("dispatcher");

  // A slow command does not hold up the line after it.
  {
    Fixture fx;
    RecordingSink sink;
    ThreadPool pool(4);
    CommandProcessor processor(fx.registry().compile(), sink);
    ConnectionDispatcher dispatcher(processor, pool, options(8, OverflowPolicy::Block));
    ScriptedStream stream({"slow\nfast\n"});
    auto scope = dispatcher.make_scope();
    auto status = dispatcher.handle(stream, *scope, "test");
    tr.expect(status == ReceiveStatus::EndOfStream, "clean close");
    tr.expect(fx.slow_saw_fast.load(), "fast command ran while slow one waited");
    tr.expect(sink.count(Outcome::Handled) == 2, "both commands handled");
    tr.expect(scope->in_flight() == 0, "handle joins before returning");
  }

  // Unrecognized input does not end the connection.
  {
    Fixture fx;
    RecordingSink sink;
    ThreadPool pool(2);
    CommandProcessor processor(fx.registry().compile(), sink);
    ConnectionDispatcher dispatcher(processor, pool, options(8, OverflowPolicy::Block));
    ScriptedStream stream({"garbage\n", "ping\n"});
    auto scope = dispatcher.make_scope();
    dispatcher.handle(stream, *scope, "test");
    auto garbage = sink.find("garbage");
    auto ping = sink.find("ping");
    tr.expect(garbage && garbage->outcome == Outcome::Unrecognized, "garbage unrecognized");
    tr.expect(ping && ping->outcome == Outcome::Handled, "ping after garbage handled");
  }

  // Invalid UTF-8 is unrecognized; the next line still runs.
  {
    Fixture fx;
    RecordingSink sink;
    ThreadPool pool(2);
    CommandProcessor processor(fx.registry().compile(), sink);
    ConnectionDispatcher dispatcher(processor, pool, options(8, OverflowPolicy::Block));
    ScriptedStream stream({std::string("\xff\xfe\n") + "ping\n"});
    auto scope = dispatcher.make_scope();
    dispatcher.handle(stream, *scope, "test");
    auto bad = sink.find("\xff\xfe");
    tr.expect(bad && bad->outcome == Outcome::Unrecognized && bad->error == "invalid UTF-8",
              "invalid UTF-8 reported");
    auto ping = sink.find("ping");
    tr.expect(ping && ping->outcome == Outcome::Handled, "ping after invalid UTF-8 handled");
  }

  // An oversized frame ends the connection.
  {
    Fixture fx;
    RecordingSink sink;
    ThreadPool pool(2);
    CommandProcessor processor(fx.registry().compile(), sink);
    ConnectionDispatcher dispatcher(processor, pool, options(8, OverflowPolicy::Block, 8));
    ScriptedStream stream({"ping\n", std::string(20, 'x'), "\nping\n"});
    auto scope = dispatcher.make_scope();
    auto status = dispatcher.handle(stream, *scope, "test");
    tr.expect(status == ReceiveStatus::FrameTooLong, "too long frame ends the connection");
    tr.expect(sink.results().size() <= 1, "nothing after the oversized frame");
  }

  // Close mid-frame cancels running commands.
  {
    Fixture fx;
    RecordingSink sink;
    ThreadPool pool(2);
    CommandProcessor processor(fx.registry().compile(), sink);
    ConnectionDispatcher dispatcher(processor, pool, options(8, OverflowPolicy::Block));
    ScriptedStream stream({"sleep\n", "partial"});
    auto scope = dispatcher.make_scope();
    auto start = std::chrono::steady_clock::now();
    auto status = dispatcher.handle(stream, *scope, "test");
    auto elapsed = std::chrono::steady_clock::now() - start;
    tr.expect(status == ReceiveStatus::IncompleteFrame, "partial frame reported");
    tr.expect(elapsed < 2000ms, "sleeping command cancelled promptly");
    auto sleep = sink.find("sleep");
    tr.expect(sleep && sleep->outcome == Outcome::Cancelled, "sleep reported cancelled");
    tr.expect(!sink.find("partial").has_value(), "partial frame never processed");
  }

  // Reject policy: over the limit is dropped and reported.
  {
    Fixture fx;
    RecordingSink sink;
    ThreadPool pool(2);
    CommandProcessor processor(fx.registry().compile(), sink);
    ConnectionDispatcher dispatcher(processor, pool, options(1, OverflowPolicy::Reject));
    ScriptedStream stream({"hold\nping\n"});
    auto scope = dispatcher.make_scope();
    dispatcher.handle(stream, *scope, "test");
    auto hold = sink.find("hold");
    auto ping = sink.find("ping");
    tr.expect(hold && hold->outcome == Outcome::Handled, "first command runs");
    tr.expect(ping && ping->outcome == Outcome::Rejected, "second command rejected");
    tr.expect(ping && ping->error == "too many commands in flight", "rejection reason");
  }

  // Block policy: over the limit waits, nothing is lost.
  {
    Fixture fx;
    RecordingSink sink;
    ThreadPool pool(2);
    CommandProcessor processor(fx.registry().compile(), sink);
    ConnectionDispatcher dispatcher(processor, pool, options(1, OverflowPolicy::Block));
    ScriptedStream stream({"hold\nping\nping\n"});
    auto scope = dispatcher.make_scope();
    auto status = dispatcher.handle(stream, *scope, "test");
    tr.expect(status == ReceiveStatus::EndOfStream, "blocked connection closes cleanly");
    tr.expect(sink.count(Outcome::Handled) == 3, "all blocked commands handled");
  }

  // Read errors cancel and report.
  {
    Fixture fx;
    RecordingSink sink;
    ThreadPool pool(2);
    CommandProcessor processor(fx.registry().compile(), sink);
    ConnectionDispatcher dispatcher(processor, pool, options(8, OverflowPolicy::Block));
    ScriptedStream stream({"sleep\n"}, true);
    auto scope = dispatcher.make_scope();
    auto status = dispatcher.handle(stream, *scope, "test");
    tr.expect(status == ReceiveStatus::IoError, "io error reported");
    auto sleep = sink.find("sleep");
    tr.expect(sleep && sleep->outcome == Outcome::Cancelled, "io error cancels commands");
  }

  return tr.exit_code();
}
