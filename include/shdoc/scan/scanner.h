/***
 * Name: shdoc::scan::Scanner
 * Purpose: Streaming state machine pairing function headers with the comment
 *   block right above them.
 * Inputs: Source lines in file order via feed(); finish() at end of input
 * Outputs: One FunctionRecord per confirmed header, passed to the sink
 * Theory of Operation:
 *   Idle: comments accumulate; an inline header is confirmed at once; a bare
 *   header becomes pending; anything else clears the block.
 *   AwaitingBrace: a lone '{' confirms the pending header. Any other line
 *   drops the pending header and the block, and is itself consumed without
 *   being classified again. Records are never buffered.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "shdoc/scan/line_kind.h"
#include "shdoc/scan/record.h"

namespace shdoc::scan {

struct ScanStats {
  uint64_t lines{0};
  uint64_t commentLines{0};
  uint64_t headers{0};           // confirmed headers, resolvable or not
  uint64_t functions{0};         // records handed to the sink
  uint64_t discardedHeaders{0};  // bare headers whose brace never came
};

class Scanner {
 public:
  enum class State { Idle, AwaitingBrace };
  using RecordSink = std::function<void(const FunctionRecord&)>;

  explicit Scanner(RecordSink sink);

  /*** feed: Advance by one line; returns the line's classification. */
  LineKind feed(std::string_view line);

  /*** finish: End of input; drops any pending header and block. */
  void finish();

  State state() const { return pending_ ? State::AwaitingBrace : State::Idle; }
  const std::string& commentBlock() const { return block_; }
  const ScanStats& stats() const { return stats_; }

 private:
  void confirm(std::string_view headerLine);
  void reset();

  RecordSink sink_;
  std::string block_{};
  std::optional<std::string> pending_{};
  ScanStats stats_{};
};

} // namespace shdoc::scan
