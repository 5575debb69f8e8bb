#pragma once

#include <stdexcept>
#include <string>

enum class Errc {
    ZeroAddress,
    TooSmall,
    ExceedsDepositCeiling,
    UnknownAsset,
    ComeBackLater,
    FailedToSendETH,
    InvalidSwapper,
    NotSupportedSwapper,
    SetDefaultSwapperBefore,
    Unauthorized,
    ReentrantCall,
    InsufficientBalance,
    InsufficientOutput,
    WithdrawNotEligible
};

const char* errc_name(Errc code);

// Every failed call surfaces as a VaultError; the enclosing TxScope undoes
// whatever the call had already changed.
class VaultError : public std::runtime_error {
public:
    VaultError(Errc code, const std::string& detail);

    Errc code() const { return code_; }
    const std::string& detail() const { return detail_; }

private:
    Errc code_;
    std::string detail_;
};
