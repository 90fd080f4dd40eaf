// ZKVOTE - Eligibility Proof Verifier
// Copyright (c) 2024 ZKVOTE Developers
// MIT License
//
// Cryptographic acceptance of an eligibility proof is delegated to an
// external Groth16 verifier. This header defines the seam and its adapters.

#ifndef ZKVOTE_BALLOT_VERIFIER_H
#define ZKVOTE_BALLOT_VERIFIER_H

#include "zkvote/ballot/proof_format.h"

#include <memory>
#include <string>
#include <vector>

namespace zkvote {

namespace util {
class ConfigManager;
}

namespace ballot {

// ============================================================================
// Verifier Interface
// ============================================================================

class Verifier {
public:
    virtual ~Verifier() = default;

    /**
     * Check a Groth16 proof against its public witness.
     *
     * @return true if the proof is valid
     * @throws std::runtime_error if the verifier itself could not run
     */
    virtual bool Verify(const Proof& proof, const PublicWitness& witness) = 0;

    virtual std::string Name() const = 0;
};

// ============================================================================
// Command Verifier
// ============================================================================

/**
 * Runs an external verifier program:
 *
 *   <program> verify <verification-key> <proof-file> <witness-file>
 *
 * Proof and witness are written to temporary files. Exit status 0 accepts
 * the proof, any other status rejects it. The program's output is discarded.
 */
class CommandVerifier : public Verifier {
public:
    struct Config {
        std::string program;
        std::string verificationKey;
        /// Directory for the temporary proof and witness files
        std::string tempDir{"/tmp"};
    };

    explicit CommandVerifier(Config config);

    bool Verify(const Proof& proof, const PublicWitness& witness) override;

    std::string Name() const override { return "command"; }

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    /// @return the program's exit status
    int Run(const std::vector<std::string>& args) const;
};

// ============================================================================
// Structural Verifier
// ============================================================================

/**
 * Development-only verifier: accepts any proof that has the right shape.
 * Performs no cryptography. Every call logs a warning.
 */
class StructuralVerifier : public Verifier {
public:
    bool Verify(const Proof& proof, const PublicWitness& witness) override;

    std::string Name() const override { return "structural"; }
};

// ============================================================================
// Factory
// ============================================================================

/**
 * Build the verifier selected by the verifier, verifiercmd, verifierkey and
 * skipzkverify keys.
 *
 * @param error Set to a description when nullptr is returned
 * @return nullptr if the configuration is invalid
 */
std::unique_ptr<Verifier> MakeVerifierFromConfig(const util::ConfigManager& config,
                                                 std::string& error);

} // namespace ballot
} // namespace zkvote

#endif // ZKVOTE_BALLOT_VERIFIER_H
