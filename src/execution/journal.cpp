#include <stakeline/common/critical.hpp>
#include <stakeline/execution/journal.hpp>

#include <utility>

namespace stakeline::execution {

void journal::checkpoint() {
  checkpoints_.push_back(entries_.size());
}

void journal::accept() {
  if (checkpoints_.empty()) {
    stakeline::common::critical("journal accept without checkpoint");
  }
  checkpoints_.pop_back();
  if (checkpoints_.empty()) {
    entries_.clear();
  }
}

void journal::reject() {
  if (checkpoints_.empty()) {
    stakeline::common::critical("journal reject without checkpoint");
  }
  auto mark = checkpoints_.back();
  checkpoints_.pop_back();
  while (entries_.size() > mark) {
    auto undo = std::move(entries_.back());
    entries_.pop_back();
    undo();
  }
}

void journal::record(undo_t undo) {
  if (checkpoints_.empty()) {
    return;
  }
  entries_.push_back(std::move(undo));
}

}  // namespace stakeline::execution
