#include "engine/operation_journal.hpp"
#include "common/logger.hpp"
#include <exception>

OperationJournal::OperationJournal(std::string operation) : operation_(std::move(operation)) {}

OperationJournal::~OperationJournal() {
  if (!finished_) Rollback();
}

void OperationJournal::Record(std::string label, std::function<void()> undo) {
  steps_.push_back(Step{std::move(label), std::move(undo)});
}

void OperationJournal::Commit() {
  steps_.clear();
  finished_ = true;
}

size_t OperationJournal::Rollback() {
  size_t failures = 0;
  finished_ = true;
  for (auto it = steps_.rbegin(); it != steps_.rend(); ++it) {
    try {
      it->undo();
    } catch (const std::exception& e) {
      ++failures;
      Logger::Critical(operation_ + ": failed to undo '" + it->label + "': " + e.what());
    }
  }
  if (!steps_.empty()) Logger::Debug(operation_ + ": rolled back " + std::to_string(steps_.size()) + " step(s)");
  steps_.clear();
  return failures;
}
