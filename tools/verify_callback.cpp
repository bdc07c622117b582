#include "abi_codec.hpp"
#include "local_oracle.hpp"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 5) {
        std::cerr << "Usage: verify_callback <oraclePublicKeyHex> <requestId> <cleartextHex> <proofHex>\n";
        return 1;
    }

    cl::DecryptionResponse response;
    try {
        response.requestId = std::stoull(argv[2]);
        response.cleartext = cl::hexToBytes(argv[3]);
        response.proof = cl::hexToBytes(argv[4]);
    } catch (const std::exception& ex) {
        std::cerr << "Malformed argument: " << ex.what() << '\n';
        return 1;
    }

    bool ok = cl::LocalDecryptionOracle::verifyResponse(argv[1], response);
    std::cout << "Oracle signature: " << (ok ? "valid" : "INVALID") << '\n';
    auto plaintext = cl::decodeUint64Word(response.cleartext);
    if (plaintext) {
        std::cout << "Plaintext: " << *plaintext << '\n';
    } else {
        std::cout << "Cleartext is not a single uint64 word\n";
    }
    return ok ? 0 : 2;
}
