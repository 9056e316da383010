#pragma once
/*
 * IIdSource
 *
 * Purpose: capability producing fresh node identities for a Tree.
 * Contract: next_id() never repeats for the lifetime of the source; 0 is reserved for the root.
 */

class IIdSource {
public:
  virtual ~IIdSource() = default;
  virtual int next_id() = 0;
};

class CounterIdSource : public IIdSource {
public:
  explicit CounterIdSource(int first = 1) : next_(first) {}
  int next_id() override { return next_++; }
private:
  int next_;
};
