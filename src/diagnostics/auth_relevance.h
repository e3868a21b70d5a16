#pragma once
#include <schema/transaction.h>

namespace diagnostics {

/**
 * @brief Decide whether a transaction belongs in an authentication transcript
 * @param tx Captured transaction
 * @return false for OPTIONS requests and static resources (by path extension or response content type)
 */
bool is_relevant_to_auth_diagnostics(const Transaction& tx);

} // namespace diagnostics
