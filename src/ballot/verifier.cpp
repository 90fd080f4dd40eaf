// ZKVOTE - Eligibility Proof Verifier Implementation
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include "zkvote/ballot/verifier.h"
#include "zkvote/util/config.h"
#include "zkvote/util/logging.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace zkvote {
namespace ballot {

namespace {

/// Temporary file removed on destruction
class TempFile {
public:
    TempFile(const std::string& dir, const std::string& stem, const std::vector<Byte>& contents) {
        std::string pattern = dir + "/zkvote-" + stem + "-XXXXXX";
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');

        int fd = mkstemp(buf.data());
        if (fd < 0) {
            throw std::runtime_error("mkstemp failed: " + std::string(std::strerror(errno)));
        }
        path_ = buf.data();

        size_t written = 0;
        while (written < contents.size()) {
            ssize_t n = write(fd, contents.data() + written, contents.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                std::string reason = std::strerror(errno);
                close(fd);
                unlink(path_.c_str());
                throw std::runtime_error("write to " + path_ + " failed: " + reason);
            }
            written += static_cast<size_t>(n);
        }
        close(fd);
    }

    ~TempFile() {
        unlink(path_.c_str());
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

// ============================================================================
// CommandVerifier
// ============================================================================

CommandVerifier::CommandVerifier(Config config) : config_(std::move(config)) {}

bool CommandVerifier::Verify(const Proof& proof, const PublicWitness& witness) {
    ZKVOTE_LOG_TIMER(util::LogCategory::VERIFY, "external proof verification");

    TempFile proofFile(config_.tempDir, "proof", proof);
    TempFile witnessFile(config_.tempDir, "witness", witness);

    int status = Run({config_.program, "verify", config_.verificationKey,
                      proofFile.path(), witnessFile.path()});

    LogDebugF(util::LogCategory::VERIFY, "%s exited with status %d",
              config_.program.c_str(), status);
    return status == 0;
}

int CommandVerifier::Run(const std::vector<std::string>& args) const {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        throw std::runtime_error("fork failed: " + std::string(std::strerror(errno)));
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) {
                close(devnull);
            }
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    int wstatus = 0;
    while (waitpid(pid, &wstatus, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error("waitpid failed: " + std::string(std::strerror(errno)));
        }
    }

    if (WIFEXITED(wstatus)) {
        int code = WEXITSTATUS(wstatus);
        if (code == 127) {
            throw std::runtime_error("cannot execute verifier program " + config_.program);
        }
        return code;
    }
    if (WIFSIGNALED(wstatus)) {
        throw std::runtime_error("verifier program killed by signal " +
                                 std::to_string(WTERMSIG(wstatus)));
    }
    throw std::runtime_error("verifier program ended abnormally");
}

// ============================================================================
// StructuralVerifier
// ============================================================================

bool StructuralVerifier::Verify(const Proof& proof, const PublicWitness& witness) {
    LOG_WARN(util::LogCategory::VERIFY)
        << "ZK proof verification SKIPPED: structural verifier accepts unverified proofs";
    return IsValidProofSize(proof) && DecodePublicWitness(witness).has_value();
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<Verifier> MakeVerifierFromConfig(const util::ConfigManager& config,
                                                 std::string& error) {
    std::string kind = config.GetString(util::ConfigKeys::VERIFIER, "command");

    if (kind == "structural") {
        if (!config.GetBool(util::ConfigKeys::SKIPZKVERIFY, false)) {
            error = "verifier=structural requires -skipzkverify";
            return nullptr;
        }
        LOG_WARN(util::LogCategory::VERIFY)
            << "Using structural verifier; eligibility proofs are NOT cryptographically checked";
        return std::make_unique<StructuralVerifier>();
    }

    if (kind == "command") {
        CommandVerifier::Config cfg;
        cfg.program = config.GetPath(util::ConfigKeys::VERIFIERCMD, "");
        cfg.verificationKey = config.GetPath(util::ConfigKeys::VERIFIERKEY, "");
        if (cfg.program.empty()) {
            error = "verifier=command requires -verifiercmd";
            return nullptr;
        }
        if (cfg.verificationKey.empty()) {
            error = "verifier=command requires -verifierkey";
            return nullptr;
        }
        if (const char* tmp = std::getenv("TMPDIR")) {
            cfg.tempDir = tmp;
        }
        LogInfoF(util::LogCategory::VERIFY, "Using external verifier %s (key %s)",
                 cfg.program.c_str(), cfg.verificationKey.c_str());
        return std::make_unique<CommandVerifier>(std::move(cfg));
    }

    error = "unknown verifier '" + kind + "' (expected command or structural)";
    return nullptr;
}

} // namespace ballot
} // namespace zkvote
