#include "store/ledger_store.hpp"

namespace ctf::store {

ledger_transaction::~ledger_transaction() {}

ledger_store::~ledger_store() {}

}  // namespace ctf::store
