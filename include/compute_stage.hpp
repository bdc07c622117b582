#pragma once

#include "batch_ledger.hpp"
#include "encrypted_arithmetic.hpp"

namespace cl {

// profit = loanAmount * interestRate - collateralAmount, evaluated under encryption.
// Throws NotInitialized if any input handle is uninitialized; no other state is touched.
EncryptedHandle computeProfit(const LoanParams& params, EncryptedArithmetic& arithmetic);

} // namespace cl
