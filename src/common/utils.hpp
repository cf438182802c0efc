#pragma once

#include <string>
#include <memory>

#include "bech32.h"
#include "util/strencodings.h"

#include "common.hpp"

namespace tapvault {

class IBech32Coder {

public:
    enum ChainMode {MAINNET, TESTNET, REGTEST};

    virtual ~IBech32Coder() = default;
    virtual std::string Encode(const xonly_pubkey& pk) const = 0;
    virtual xonly_pubkey Decode(const std::string& address) const = 0;
};

template <IBech32Coder::ChainMode M> struct Hrp;
template <> struct Hrp<IBech32Coder::MAINNET> { const static char* const value; };
template <> struct Hrp<IBech32Coder::TESTNET> { const static char* const value; };
template <> struct Hrp<IBech32Coder::REGTEST> { const static char* const value; };


// Witness v1 (taproot) addresses only
template <IBech32Coder::ChainMode M> class Bech32Coder: public IBech32Coder
{
public:
    typedef Hrp<M> hrp;

    ~Bech32Coder() override = default;
    std::string Encode(const xonly_pubkey& pk) const override {
        std::vector<unsigned char> bech32buf = {1};
        bech32buf.reserve(1 + ((pk.end() - pk.begin()) * 8 + 4) / 5);
        ConvertBits<8, 5, true>([&](unsigned char c) { bech32buf.push_back(c); }, pk.begin(), pk.end());
        return bech32::Encode(bech32::Encoding::BECH32M, hrp::value, bech32buf);
    }
    xonly_pubkey Decode(const std::string& address) const override {
        bech32::DecodeResult bech_result = bech32::Decode(address);
        if(bech_result.hrp != hrp::value)
        {
            throw IllegalArgumentError(std::string("Address prefix should be ") + hrp::value + ". Address: " + address);
        }
        if(bech_result.data.size() < 1)
        {
            throw IllegalArgumentError(std::string("Wrong bech32 data (no data decoded): ") + address);
        }
        if(bech_result.data[0] != 1 || bech_result.encoding != bech32::Encoding::BECH32M)
        {
            throw IllegalArgumentError("Not a taproot address: " + address);
        }

        bytevector program;
        program.reserve(32);
        if(!ConvertBits<5, 8, false>([&](unsigned char c) { program.push_back(c); }, bech_result.data.begin() + 1, bech_result.data.end())
           || program.size() != 32)
        {
            throw IllegalArgumentError("Wrong bech32 data: " + address);
        }

        return xonly_pubkey(std::move(program));
    }
};

IBech32Coder::ChainMode ParseChainMode(const std::string& mode);
std::unique_ptr<IBech32Coder> MakeBech32Coder(IBech32Coder::ChainMode mode);

}
