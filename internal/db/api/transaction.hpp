#pragma once

namespace artifact::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws when the change cannot be made durable

  SQLite:   BEGIN IMMEDIATE on the shared connection
  Postgres: pqxx::work
  Memory:   snapshot copy-on-write, per-artifact revision check
  JsonDir:  write overlay, temp file + rename on commit
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

} // namespace artifact::db
