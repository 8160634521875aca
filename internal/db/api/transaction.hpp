#pragma once

namespace doccache::db {

/*
  Abstract transaction: the ambient scope every cache operation runs in.

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other transactions until Commit()
  - Reads inside the transaction see its own writes
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE
  Memory: snapshot copy-on-write
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}
