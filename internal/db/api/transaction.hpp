#pragma once

namespace treasury::db {

/*
  Unit of work spanning one ledger call.

  A ledger row, its holdings and the journal entry appended for the call
  become visible together at Commit(), or not at all. Reads made through
  the transaction see its own uncommitted writes.

  Destroying an unfinished transaction rolls it back, so a call that
  throws halfway leaves storage untouched.

  SQLite: BEGIN IMMEDIATE, one writer per connection at a time
  Memory: private snapshot; Commit() throws util::Conflict when a touched
          ledger was committed by someone else in the meantime
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;
};

}
