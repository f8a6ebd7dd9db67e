#ifndef CHUNKVAULT_UI_CLI_COMMANDLINE_HPP
#define CHUNKVAULT_UI_CLI_COMMANDLINE_HPP

#include "chunkvault/crypto/ICryptoProvider.hpp"
#include "chunkvault/security/SecureString.hpp"

#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault::ui::cli
{

// In tests: returns a pre-determined string.
using PassphraseReader = std::function<chunkvault::security::SecureString(const std::string&)>;

enum class ExitCode : int
{
    Ok = 0,
    Failure = 1,
    Usage = 2,
};

struct EncryptCommand final
{
    std::string input;
    std::string blob;
    std::string manifest;
    std::string keyOut;
    std::string recipient;
    std::string fileId;
    bool legacyManifest{ false };
    bool rawKey{ false };
    bool registerFile{ false };
    std::uint32_t kdfIterations{ 0U };
    std::uint32_t kdfMemoryKiB{ 0U };
};

struct DecryptCommand final
{
    std::string fileId;
    std::string blob;
    std::string manifest;
    std::string key;
    std::string out;
    bool skipMalformed{ false };
};

// One-shot `chunkvault` command: parses argv with CLI11 and runs a single subcommand.
class CommandLine final
{
public:
    CommandLine(std::ostream& out, std::ostream& err, PassphraseReader passphraseReader);

    // args excludes the program name.
    [[nodiscard]] int run(const std::vector<std::string>& args);

private:
    std::ostream& m_out;
    std::ostream& m_err;
    PassphraseReader m_passphraseReader;

    std::string m_providerName;
    std::string m_dbPath;

    [[nodiscard]] std::unique_ptr<chunkvault::crypto::ICryptoProvider> makeProvider() const;
    void requireDb() const;

    [[nodiscard]] ExitCode doEncrypt(const EncryptCommand& cmd);
    [[nodiscard]] ExitCode doDecrypt(DecryptCommand cmd);
    [[nodiscard]] ExitCode doInspect(const std::string& manifestPath);
    [[nodiscard]] ExitCode doList();
    [[nodiscard]] ExitCode doRemove(const std::string& fileId, bool purgeBlob);
};

} // namespace chunkvault::ui::cli

#endif // CHUNKVAULT_UI_CLI_COMMANDLINE_HPP
