#include "utils.hpp"

namespace tapvault {

const char* const Hrp<IBech32Coder::MAINNET>::value = "bc";
const char* const Hrp<IBech32Coder::TESTNET>::value = "tb";
const char* const Hrp<IBech32Coder::REGTEST>::value = "bcrt";

IBech32Coder::ChainMode ParseChainMode(const std::string& mode)
{
    if (mode == "mainnet") {
        return IBech32Coder::MAINNET;
    }
    else if (mode == "testnet") {
        return IBech32Coder::TESTNET;
    }
    else if (mode == "regtest") {
        return IBech32Coder::REGTEST;
    }
    else {
        throw IllegalArgumentError("Wrong chain mode: " + mode);
    }
}

std::unique_ptr<IBech32Coder> MakeBech32Coder(IBech32Coder::ChainMode mode)
{
    switch (mode) {
    case IBech32Coder::MAINNET:
        return std::make_unique<Bech32Coder<IBech32Coder::MAINNET>>();
    case IBech32Coder::TESTNET:
        return std::make_unique<Bech32Coder<IBech32Coder::TESTNET>>();
    case IBech32Coder::REGTEST:
        return std::make_unique<Bech32Coder<IBech32Coder::REGTEST>>();
    }
    throw IllegalArgumentError("Wrong chain mode");
}

}
