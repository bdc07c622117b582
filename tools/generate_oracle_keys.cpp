#include "local_oracle.hpp"
#include "test_arithmetic.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr unsigned long kMaxKeys = 64;

void printUsage() {
    std::cerr << "Usage: generate_oracle_keys [count]   (1.." << kMaxKeys << ", default 1)\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc > 2) {
        printUsage();
        return 1;
    }

    unsigned long count = 1;
    if (argc == 2) {
        std::size_t consumed = 0;
        try {
            count = std::stoul(argv[1], &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed == 0 || argv[1][consumed] != '\0' || count == 0 || count > kMaxKeys) {
            printUsage();
            return 1;
        }
    }

    try {
        // Each secret is loaded back into an oracle before printing, so a key that does not
        // round-trip to its public half is never emitted.
        auto arithmetic = std::make_shared<cl::InsecureTestArithmetic>();
        for (unsigned long i = 0; i < count; ++i) {
            cl::OracleKeyPair keys = cl::generateOracleKeypair();
            cl::LocalDecryptionOracle oracle(arithmetic, keys.secretKeyHex);
            if (oracle.publicKeyHex() != keys.publicKeyHex) {
                std::cerr << "oracle key " << i << " failed to round-trip\n";
                return 1;
            }
            std::cout << "oracle-key " << i << '\n'
                      << "  public: " << keys.publicKeyHex << '\n'
                      << "  secret: " << keys.secretKeyHex << '\n';
        }
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    return 0;
}
