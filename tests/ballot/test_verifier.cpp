// ZKVOTE - Verifier and Balance Source Tests
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "ballot_test_util.h"

#include <zkvote/util/config.h>

#include <filesystem>
#include <fstream>

using namespace zkvote;
using namespace zkvote::ballot;
using namespace zkvote::test;

// ============================================================================
// Command Verifier
// ============================================================================

class CommandVerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("zkvote_verifier_test_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);

        auto request = MakeCast(MakeAccount(1), 3, 10, 1, MakeSecret(1));
        proof_ = request.proof;
        witness_ = request.witness;
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    /// Shell script that accepts only a well-shaped invocation
    std::string WriteCheckingScript() {
        std::filesystem::path script = dir_ / "verify.sh";
        std::ofstream out(script);
        out << "#!/bin/sh\n"
            << "[ \"$1\" = verify ] || exit 3\n"
            << "[ \"$2\" = \"" << (dir_ / "vk.bin").string() << "\" ] || exit 4\n"
            << "[ \"$(wc -c < \"$3\")\" -eq " << PROOF_SIZE << " ] || exit 5\n"
            << "[ \"$(wc -c < \"$4\")\" -eq " << PUBLIC_WITNESS_SIZE << " ] || exit 6\n"
            << "exit 0\n";
        out.close();
        std::filesystem::permissions(script, std::filesystem::perms::owner_all);
        return script.string();
    }

    CommandVerifier::Config MakeConfig(const std::string& program) {
        CommandVerifier::Config config;
        config.program = program;
        config.verificationKey = (dir_ / "vk.bin").string();
        config.tempDir = dir_.string();
        return config;
    }

    size_t FilesInDir() const {
        size_t n = 0;
        for (const auto& entry : std::filesystem::directory_iterator(dir_)) {
            (void)entry;
            ++n;
        }
        return n;
    }

    std::filesystem::path dir_;
    Proof proof_;
    PublicWitness witness_;
};

TEST_F(CommandVerifierTest, ExitStatusDecides) {
    CommandVerifier accept(MakeConfig("/bin/true"));
    EXPECT_TRUE(accept.Verify(proof_, witness_));

    CommandVerifier reject(MakeConfig("/bin/false"));
    EXPECT_FALSE(reject.Verify(proof_, witness_));
}

TEST_F(CommandVerifierTest, PassesKeyProofAndWitnessFiles) {
    CommandVerifier verifier(MakeConfig(WriteCheckingScript()));
    EXPECT_TRUE(verifier.Verify(proof_, witness_));

    Proof shortProof(proof_.begin(), proof_.end() - 1);
    EXPECT_FALSE(verifier.Verify(shortProof, witness_));
}

TEST_F(CommandVerifierTest, TemporaryFilesRemoved) {
    CommandVerifier verifier(MakeConfig("/bin/true"));
    size_t before = FilesInDir();
    ASSERT_TRUE(verifier.Verify(proof_, witness_));
    EXPECT_EQ(FilesInDir(), before);
}

TEST_F(CommandVerifierTest, MissingProgramThrows) {
    CommandVerifier verifier(MakeConfig((dir_ / "no-such-verifier").string()));
    EXPECT_THROW(verifier.Verify(proof_, witness_), std::runtime_error);
}

TEST_F(CommandVerifierTest, GatewayMapsCrashToVerificationFailed) {
    auto clock = std::make_shared<ManualClock>(0);
    auto balances = std::make_shared<MemoryBalanceSource>();
    auto verifier = std::make_shared<CommandVerifier>(
        MakeConfig((dir_ / "no-such-verifier").string()));
    BallotEngine engine(std::make_unique<db::MemoryDatabase>(), clock, verifier, balances);

    ProposalRequest request;
    request.creator = MakeAccount(1);
    request.id = 3;
    request.title = "t";
    request.options = {"a", "b"};
    request.credentialRef = MakeCredential(1);
    request.minThreshold = 10;
    request.votingPeriod = 100;
    ASSERT_TRUE(engine.CreateProposal(request).ok());
    balances->SetBalance(MakeAccount(1), MakeCredential(1), 10);

    auto result = engine.CastVote(MakeCast(MakeAccount(1), 3, 10, 1, MakeSecret(1)));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BallotError::VerificationFailed);
    EXPECT_EQ(engine.GetProposal(3)->voteCount, 0u);
}

// ============================================================================
// Structural Verifier
// ============================================================================

TEST(StructuralVerifierTest, ChecksShapeOnly) {
    StructuralVerifier verifier;
    auto request = MakeCast(MakeAccount(1), 3, 10, 1, MakeSecret(1));
    EXPECT_TRUE(verifier.Verify(request.proof, request.witness));

    Proof empty;
    EXPECT_FALSE(verifier.Verify(empty, request.witness));

    PublicWitness truncated(request.witness.begin(), request.witness.end() - 32);
    EXPECT_FALSE(verifier.Verify(request.proof, truncated));
}

// ============================================================================
// Factory
// ============================================================================

TEST(MakeVerifierFromConfigTest, CommandNeedsProgramAndKey) {
    util::ConfigManager config;
    std::string error;
    EXPECT_TRUE(MakeVerifierFromConfig(config, error) == nullptr);
    EXPECT_NE(error.find("verifiercmd"), std::string::npos);

    config.Set(util::ConfigKeys::VERIFIERCMD, "/usr/local/bin/sunspot");
    EXPECT_TRUE(MakeVerifierFromConfig(config, error) == nullptr);
    EXPECT_NE(error.find("verifierkey"), std::string::npos);

    config.Set(util::ConfigKeys::VERIFIERKEY, "/etc/zkvote/eligibility.vk");
    auto verifier = MakeVerifierFromConfig(config, error);
    ASSERT_TRUE(verifier != nullptr);
    EXPECT_EQ(verifier->Name(), "command");
    auto* command = dynamic_cast<CommandVerifier*>(verifier.get());
    ASSERT_NE(command, nullptr);
    EXPECT_EQ(command->GetConfig().program, "/usr/local/bin/sunspot");
    EXPECT_EQ(command->GetConfig().verificationKey, "/etc/zkvote/eligibility.vk");
}

TEST(MakeVerifierFromConfigTest, StructuralRequiresExplicitOptIn) {
    util::ConfigManager config;
    config.Set(util::ConfigKeys::VERIFIER, "structural");
    std::string error;
    EXPECT_TRUE(MakeVerifierFromConfig(config, error) == nullptr);
    EXPECT_NE(error.find("skipzkverify"), std::string::npos);

    config.Set(util::ConfigKeys::SKIPZKVERIFY, "1");
    auto verifier = MakeVerifierFromConfig(config, error);
    ASSERT_TRUE(verifier != nullptr);
    EXPECT_EQ(verifier->Name(), "structural");
}

TEST(MakeVerifierFromConfigTest, UnknownKind) {
    util::ConfigManager config;
    config.Set(util::ConfigKeys::VERIFIER, "groth16-native");
    std::string error;
    EXPECT_TRUE(MakeVerifierFromConfig(config, error) == nullptr);
    EXPECT_NE(error.find("groth16-native"), std::string::npos);
}

// ============================================================================
// Balance Source
// ============================================================================

TEST(MemoryBalanceSourceTest, UnknownHolderHasZero) {
    MemoryBalanceSource balances;
    EXPECT_EQ(balances.BalanceOf(MakeAccount(1), MakeCredential(1)), std::optional<uint64_t>(0));

    balances.SetBalance(MakeAccount(1), MakeCredential(1), 25);
    EXPECT_EQ(balances.BalanceOf(MakeAccount(1), MakeCredential(1)), std::optional<uint64_t>(25));
    EXPECT_EQ(balances.BalanceOf(MakeAccount(1), MakeCredential(2)), std::optional<uint64_t>(0));
    EXPECT_EQ(balances.Size(), 1u);

    balances.SetUnavailable(true);
    EXPECT_FALSE(balances.BalanceOf(MakeAccount(1), MakeCredential(1)).has_value());
}

TEST(ParseBalanceEntryTest, ParsesAccountCredentialAmount) {
    std::string account = MakeAccount(1).ToHex();
    std::string credential = MakeCredential(2).ToHex();

    auto entry = ParseBalanceEntry(account + ":" + credential + ":1500");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->account, MakeAccount(1));
    EXPECT_EQ(entry->credential, MakeCredential(2));
    EXPECT_EQ(entry->amount, 1500u);

    EXPECT_FALSE(ParseBalanceEntry(account + ":" + credential).has_value());
    EXPECT_FALSE(ParseBalanceEntry(account + ":" + credential + ":-1").has_value());
    EXPECT_FALSE(ParseBalanceEntry(account + ":" + credential + ":99999999999999999999").has_value());
    EXPECT_FALSE(ParseBalanceEntry("abcd:" + credential + ":1").has_value());
    EXPECT_FALSE(ParseBalanceEntry(account + ":zz:1").has_value());
}
