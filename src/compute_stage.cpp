#include "compute_stage.hpp"

#include "errors.hpp"

#include <string>

namespace cl {

namespace {

void requireInitialized(const EncryptedHandle& handle,
                        const EncryptedArithmetic& arithmetic,
                        const char* name) {
    if (!arithmetic.isInitialized(handle)) {
        raise(ErrorKind::NotInitialized, std::string(name) + " handle is not initialized");
    }
}

} // namespace

EncryptedHandle computeProfit(const LoanParams& params, EncryptedArithmetic& arithmetic) {
    requireInitialized(params.loanAmount, arithmetic, "loanAmount");
    requireInitialized(params.collateralAmount, arithmetic, "collateralAmount");
    requireInitialized(params.interestRate, arithmetic, "interestRate");

    EncryptedHandle gross = arithmetic.mul(params.loanAmount, params.interestRate);
    return arithmetic.sub(gross, params.collateralAmount);
}

} // namespace cl
