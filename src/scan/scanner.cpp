/***
 * Name: shdoc::scan::Scanner (impl)
 * Purpose: Drive classification, accumulation, and header resolution.
 */
#include "shdoc/scan/scanner.h"
#include "shdoc/scan/comment_block.h"
#include "shdoc/scan/header_resolver.h"

#include <string>
#include <string_view>
#include <utility>

namespace shdoc::scan {

Scanner::Scanner(RecordSink sink) : sink_(std::move(sink)) {}

LineKind Scanner::feed(std::string_view line) {
  ++stats_.lines;
  const LineKind kind = ClassifyLine(line);
  if (kind == LineKind::Comment) { ++stats_.commentLines; }

  if (pending_) {
    if (kind == LineKind::OpenBrace) {
      const std::string header = std::move(*pending_);
      pending_.reset();
      confirm(header);
    } else {
      ++stats_.discardedHeaders;
      reset();
    }
    return kind;
  }

  switch (kind) {
    case LineKind::Comment:
      block_ = CollectComment(block_, line);
      break;
    case LineKind::InlineFunctionStart:
      confirm(line);
      break;
    case LineKind::BareFunctionStart:
      pending_ = std::string(line);
      break;
    case LineKind::OpenBrace:
    case LineKind::Other:
      block_.clear();
      break;
  }
  return kind;
}

void Scanner::finish() {
  if (pending_) { ++stats_.discardedHeaders; }
  reset();
}

void Scanner::confirm(std::string_view headerLine) {
  ++stats_.headers;
  FunctionRecord record{ExtractFuncName(headerLine), std::move(block_)};
  block_.clear();
  if (record.name.empty()) { return; }
  ++stats_.functions;
  if (sink_) { sink_(record); }
}

void Scanner::reset() {
  pending_.reset();
  block_.clear();
}

} // namespace shdoc::scan
