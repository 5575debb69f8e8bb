#include "errors.hpp"

const char* errc_name(Errc code) {
    switch (code) {
        case Errc::ZeroAddress: return "ZeroAddress";
        case Errc::TooSmall: return "TooSmall";
        case Errc::ExceedsDepositCeiling: return "ExceedsDepositCeiling";
        case Errc::UnknownAsset: return "UnknownAsset";
        case Errc::ComeBackLater: return "ComeBackLater";
        case Errc::FailedToSendETH: return "FailedToSendETH";
        case Errc::InvalidSwapper: return "InvalidSwapper";
        case Errc::NotSupportedSwapper: return "NotSupportedSwapper";
        case Errc::SetDefaultSwapperBefore: return "SetDefaultSwapperBefore";
        case Errc::Unauthorized: return "Unauthorized";
        case Errc::ReentrantCall: return "ReentrantCall";
        case Errc::InsufficientBalance: return "InsufficientBalance";
        case Errc::InsufficientOutput: return "InsufficientOutput";
        case Errc::WithdrawNotEligible: return "WithdrawNotEligible";
        default: return "UNKNOWN";
    }
}

VaultError::VaultError(Errc code, const std::string& detail)
    : std::runtime_error(std::string(errc_name(code)) + ": " + detail)
    , code_(code)
    , detail_(detail)
{}
