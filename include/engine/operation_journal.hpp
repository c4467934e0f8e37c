#pragma once
#include <functional>
#include <string>
#include <vector>

// Undo log for one engine operation. Every ledger mutation and every completed
// token interaction records how to reverse itself; Rollback() replays those
// steps newest-first. A journal destroyed without Commit() rolls back.
class OperationJournal {
public:
  explicit OperationJournal(std::string operation);
  ~OperationJournal();
  OperationJournal(const OperationJournal&) = delete;
  OperationJournal& operator=(const OperationJournal&) = delete;

  void Record(std::string label, std::function<void()> undo);
  void Commit();
  // Returns the number of undo steps that failed (each is logged as critical)
  size_t Rollback();

  const std::string& Operation() const { return operation_; }
  size_t Size() const { return steps_.size(); }
  bool Finished() const { return finished_; }

private:
  struct Step {
    std::string label;
    std::function<void()> undo;
  };
  std::string operation_;
  std::vector<Step> steps_;
  bool finished_ = false;
};
