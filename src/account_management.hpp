#pragma once

#include <cstddef>

#include "cfg.hpp"

namespace keel {

struct Namespace;
struct Session;

// Builds the AccountMeta array of every `Constructor` whose accounts are not
// yet known, and turns every `AccountAccess` into a `Set` that reads
// `tx.accounts[i]`. The dispatch CFG is processed with the contract's
// constructor as the executing function. Returns false if an account name
// could not be resolved.
bool manage_contract_accounts(Session& session, Namespace& ns,
                              ContractNo contract_no);

// Runs `manage_contract_accounts` over every contract when the namespace
// targets an account-based ledger.
bool run_account_management(Session& session, Namespace& ns);

// `tx.accounts[index]`
ExprRef index_accounts_vector(const Namespace& ns, std::size_t index);

// `tx.accounts[index].key`
ExprRef accounts_vector_key_at_index(const Namespace& ns, std::size_t index);

// Loads the key out of an AccountInfo reference.
ExprRef retrieve_key_from_account_info(const Namespace& ns,
                                       ExprRef account_info);

// AccountMeta{address, is_writable, is_signer}
ExprRef account_meta_literal(const Namespace& ns, ExprRef address,
                             bool is_signer, bool is_writer);

}  // namespace keel
