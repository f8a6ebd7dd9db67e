#include "CommandLine.hpp"

#include "chunkvault/core/Base64.hpp"
#include "chunkvault/core/ByteSource.hpp"
#include "chunkvault/core/KdfPolicy.hpp"
#include "chunkvault/core/KeyCustody.hpp"
#include "chunkvault/core/ManifestCodec.hpp"
#include "chunkvault/core/StreamAssembler.hpp"
#include "chunkvault/crypto/providers/NativeProviderFactory.hpp"
#include "chunkvault/security/ScopeWipe.hpp"
#include "chunkvault/security/SecureRandom.hpp"
#include "chunkvault/storage/StorageErrors.hpp"
#include "chunkvault/storage/sqlite/SqliteFileRepositoryFactory.hpp"

#include <CLI/CLI.hpp>
#include <array>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iomanip>
#include <span>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

#if defined(CHKV_ENABLE_OPENSSL)
#include "chunkvault/crypto/providers/OpenSslProviderFactory.hpp"
#endif

namespace chunkvault::ui::cli
{
namespace
{

namespace fs = std::filesystem;

constexpr std::string_view g_kProviderNative{ "native" };
constexpr std::string_view g_kProviderOpenSsl{ "openssl" };

std::string toHex(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::string out{};
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

[[nodiscard]] std::string randomFileId()
{
    constexpr std::size_t kTokenBytes{ 16U };
    std::array<std::uint8_t, kTokenBytes> rnd{};
    if (!chunkvault::security::secureRandomFill(std::span<std::uint8_t>{ rnd }))
    {
        throw std::runtime_error("CSPRNG failure");
    }
    return toHex(std::span<const std::uint8_t>{ rnd });
}

[[nodiscard]] std::uint64_t unixSecondsNow() noexcept
{
    using Clock = std::chrono::system_clock;
    const auto secs{ std::chrono::duration_cast<std::chrono::seconds>(Clock::now().time_since_epoch()) };
    const auto count{ secs.count() };
    if (count < 0)
    {
        return 0U;
    }
    return static_cast<std::uint64_t>(count);
}

[[nodiscard]] std::vector<std::uint8_t> readFileBytes(const fs::path& path)
{
    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        throw std::runtime_error("cannot open " + path.string());
    }
    std::vector<std::uint8_t> out{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
    if (in.bad())
    {
        throw std::runtime_error("cannot read " + path.string());
    }
    return out;
}

void writeFileBytes(const fs::path& path, std::span<const std::uint8_t> bytes)
{
    std::ofstream out{ path, std::ios::binary | std::ios::trunc };
    if (!out)
    {
        throw std::runtime_error("cannot open " + path.string() + " for writing");
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out)
    {
        throw std::runtime_error("cannot write " + path.string());
    }
}

// True when both names resolve to the same file, or would once the missing one is created.
[[nodiscard]] bool samePath(const fs::path& a, const fs::path& b)
{
    std::error_code ec{};
    if (fs::equivalent(a, b, ec))
    {
        return true;
    }
    std::error_code ecA{};
    std::error_code ecB{};
    const auto canonA{ fs::weakly_canonical(a, ecA) };
    const auto canonB{ fs::weakly_canonical(b, ecB) };
    if (ecA || ecB)
    {
        return a.lexically_normal() == b.lexically_normal();
    }
    return canonA == canonB;
}

void restrictToOwner(const fs::path& path, std::ostream& err)
{
#if !defined(_WIN32)
    std::error_code ec{};
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec)
    {
        err << "warning: could not restrict permissions on " << path.string() << "\n";
    }
#else
    (void)path;
    (void)err;
#endif
}

[[nodiscard]] std::span<const std::uint8_t> textBytes(std::string_view s) noexcept
{
    return std::span<const std::uint8_t>{ reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

[[nodiscard]] std::string_view trimmed(std::span<const std::uint8_t> bytes) noexcept
{
    std::string_view s{ reinterpret_cast<const char*>(bytes.data()), bytes.size() };
    constexpr std::string_view kWhitespace{ " \t\r\n" };
    const auto first{ s.find_first_not_of(kWhitespace) };
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last{ s.find_last_not_of(kWhitespace) };
    return s.substr(first, last - first + 1U);
}

void printProgress(std::ostream& out, std::string_view what, const chunkvault::core::ProgressEvent& ev)
{
    out << what << ": chunk " << (ev.chunkIndex + 1U) << "/" << (ev.totalChunks == 0U ? 1U : ev.totalChunks) << " ("
        << std::fixed << std::setprecision(1) << ev.percent << "%)";
    if (ev.skipped)
    {
        out << " skipped";
    }
    out << "\n";
}

// Removes a partially written output unless released.
class OutputCleanup final
{
public:
    explicit OutputCleanup(fs::path p) : m_path{ std::move(p) }
    {
    }
    OutputCleanup(const OutputCleanup&) = delete;
    OutputCleanup& operator=(const OutputCleanup&) = delete;
    OutputCleanup(OutputCleanup&&) = delete;
    OutputCleanup& operator=(OutputCleanup&&) = delete;
    ~OutputCleanup() noexcept
    {
        if (!m_path.empty())
        {
            std::error_code ec{};
            fs::remove(m_path, ec);
        }
    }

    void release() noexcept
    {
        m_path.clear();
    }

private:
    fs::path m_path;
};

} // namespace

CommandLine::CommandLine(std::ostream& out, std::ostream& err, PassphraseReader passphraseReader)
    : m_out(out), m_err(err), m_passphraseReader(std::move(passphraseReader))
{
}

int CommandLine::run(const std::vector<std::string>& args)
{
    CLI::App app{ "chunkvault: chunked client-side file encryption" };
    app.name("chunkvault");
    app.require_subcommand(1);

    const char* envProvider = std::getenv("CHKV_PROVIDER");
    m_providerName = (envProvider != nullptr && *envProvider != '\0') ? envProvider : std::string{ g_kProviderNative };
    m_dbPath.clear();

    app.add_option("--provider", m_providerName, "Crypto backend (default: $CHKV_PROVIDER or native)")
        ->check(CLI::IsMember({ std::string{ g_kProviderNative }, std::string{ g_kProviderOpenSsl } }));
    app.add_option("--db", m_dbPath, "File catalog database");

    ExitCode code{ ExitCode::Ok };

    // ENCRYPT
    EncryptCommand enc{};
    auto* subEnc = app.add_subcommand("encrypt", "Encrypt a file into a chunk blob, a manifest and a key file");
    subEnc->add_option("input", enc.input, "Plaintext file")->required()->check(CLI::ExistingFile);
    subEnc->add_option("-b,--blob", enc.blob, "Output ciphertext blob")->required();
    subEnc->add_option("-m,--manifest", enc.manifest, "Output manifest (default: <blob>.manifest)");
    subEnc->add_option("-k,--key-out", enc.keyOut, "Output key file (default: <blob>.key)");
    auto* recipientOpt =
        subEnc->add_option("-r,--recipient", enc.recipient, "Seal the key for this recipient under a passphrase");
    subEnc->add_flag("--legacy-manifest", enc.legacyManifest, "Write the base64 IV list instead of the binary manifest");
    subEnc->add_flag("--raw-key", enc.rawKey, "Write the master key as unprotected base64 text")->excludes(recipientOpt);
    subEnc->add_flag("--register", enc.registerFile, "Record the file in the catalog given by --db");
    subEnc->add_option("--id", enc.fileId, "Catalog id (default: random)");
    subEnc->add_option("--kdf-iterations", enc.kdfIterations, "Argon2id iterations for --recipient");
    subEnc->add_option("--kdf-memory-kib", enc.kdfMemoryKiB, "Argon2id memory in KiB for --recipient");
    subEnc->callback([&]() { code = doEncrypt(enc); });

    // DECRYPT
    DecryptCommand dec{};
    auto* subDec = app.add_subcommand("decrypt", "Reassemble a file from its blob, manifest and key");
    subDec->add_option("--id", dec.fileId, "Catalog id; fills in blob, manifest and key from --db");
    subDec->add_option("-b,--blob", dec.blob, "Ciphertext blob");
    subDec->add_option("-m,--manifest", dec.manifest, "Manifest (binary or base64 IV list)");
    subDec->add_option("-k,--key", dec.key, "Key file (wrapped key or base64 text)");
    subDec->add_option("-o,--out", dec.out, "Output plaintext file")->required();
    subDec->add_flag("--skip-malformed", dec.skipMalformed, "Skip chunks with a non-positive length instead of failing");
    subDec->callback([&]() { code = doDecrypt(dec); });

    // INSPECT
    std::string inspectPath;
    auto* subInspect = app.add_subcommand("inspect", "Print a manifest");
    subInspect->add_option("manifest", inspectPath, "Manifest file")->required()->check(CLI::ExistingFile);
    subInspect->callback([&]() { code = doInspect(inspectPath); });

    // LIST
    app.add_subcommand("list", "List catalogued files")->callback([&]() { code = doList(); });

    // REMOVE
    std::string removeId;
    bool purge{ false };
    auto* subRemove = app.add_subcommand("remove", "Remove a file from the catalog");
    subRemove->add_option("id", removeId, "Catalog id")->required();
    subRemove->add_flag("--purge", purge, "Also delete the ciphertext blob");
    subRemove->callback([&]() { code = doRemove(removeId, purge); });

    std::vector<std::string> argvStore{};
    argvStore.reserve(args.size() + 1U);
    argvStore.emplace_back("chunkvault");
    argvStore.insert(argvStore.end(), args.begin(), args.end());

    std::vector<char*> argv{};
    argv.reserve(argvStore.size());
    for (auto& arg : argvStore)
    {
        argv.push_back(arg.data());
    }

    try
    {
        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch (const CLI::ParseError& e)
    {
        const int rc = app.exit(e, m_out, m_err);
        return rc == 0 ? static_cast<int>(ExitCode::Ok) : static_cast<int>(ExitCode::Usage);
    }
    catch (const std::exception& e)
    {
        m_err << "error: " << e.what() << "\n";
        return static_cast<int>(ExitCode::Failure);
    }

    return static_cast<int>(code);
}

std::unique_ptr<chunkvault::crypto::ICryptoProvider> CommandLine::makeProvider() const
{
    if (m_providerName == g_kProviderOpenSsl)
    {
#if defined(CHKV_ENABLE_OPENSSL)
        return chunkvault::crypto::providers::makeOpenSslCryptoProvider();
#else
        throw std::runtime_error("this build has no OpenSSL provider");
#endif
    }
    return chunkvault::crypto::providers::makeNativeCryptoProvider();
}

void CommandLine::requireDb() const
{
    if (m_dbPath.empty())
    {
        throw std::runtime_error("--db is required for this command");
    }
}

ExitCode CommandLine::doEncrypt(const EncryptCommand& cmd)
{
    const auto wrapParams = chunkvault::core::resolveArgon2idParams(cmd.kdfIterations, cmd.kdfMemoryKiB);
    if (!wrapParams)
    {
        m_err << "error: --kdf-iterations/--kdf-memory-kib are outside the supported Argon2id range\n";
        return ExitCode::Usage;
    }

    const fs::path blobPath{ cmd.blob };
    const fs::path manifestPath{ cmd.manifest.empty() ? fs::path{ cmd.blob + ".manifest" } : fs::path{ cmd.manifest } };
    const fs::path keyPath{ cmd.keyOut.empty() ? fs::path{ cmd.blob + ".key" } : fs::path{ cmd.keyOut } };
    const std::array<fs::path, 3> outputs{ blobPath, manifestPath, keyPath };
    for (std::size_t i{}; i < outputs.size(); ++i)
    {
        if (samePath(fs::path{ cmd.input }, outputs[i]))
        {
            m_err << "error: " << outputs[i].string() << " would overwrite the input file\n";
            return ExitCode::Usage;
        }
        for (std::size_t j{ i + 1U }; j < outputs.size(); ++j)
        {
            if (samePath(outputs[i], outputs[j]))
            {
                m_err << "error: blob, manifest and key must be written to different files\n";
                return ExitCode::Usage;
            }
        }
    }

    auto crypto = makeProvider();
    chunkvault::core::StreamAssembler assembler{ *crypto };
    chunkvault::core::FileByteSource source{ cmd.input };

    OutputCleanup blobCleanup{ blobPath };
    std::ofstream blobOut{ blobPath, std::ios::binary | std::ios::trunc };
    if (!blobOut)
    {
        throw std::runtime_error("cannot open " + blobPath.string() + " for writing");
    }

    auto uploaded = assembler.encryptStream(
        source,
        [&blobOut](const chunkvault::core::EncryptedChunk& chunk) {
            blobOut.write(reinterpret_cast<const char*>(chunk.cipherText.data()),
                          static_cast<std::streamsize>(chunk.cipherText.size()));
            if (!blobOut)
            {
                throw std::runtime_error("blob write failed");
            }
        },
        [this](const chunkvault::core::ProgressEvent& ev) { printProgress(m_out, "encrypt", ev); });
    blobOut.close();

    if (const auto* failure = std::get_if<chunkvault::core::ChunkFailure>(&uploaded))
    {
        m_err << "error: " << chunkvault::core::describe(*failure) << "\n";
        return ExitCode::Failure;
    }
    if (!blobOut)
    {
        m_err << "error: failed to finish writing " << blobPath.string() << "\n";
        return ExitCode::Failure;
    }
    auto& upload = std::get<chunkvault::core::UploadResult>(uploaded);
    auto wipeExported = chunkvault::security::scopeWipe(upload.exportedKey);

    std::vector<std::uint8_t> manifestBytes{};
    if (cmd.legacyManifest)
    {
        const auto text = chunkvault::core::encodeLegacyManifest(upload.manifest);
        manifestBytes.assign(text.begin(), text.end());
    }
    else
    {
        auto encoded = chunkvault::core::encodeManifestV2(upload.manifest);
        if (const auto* failure = std::get_if<chunkvault::core::ChunkFailure>(&encoded))
        {
            m_err << "error: " << chunkvault::core::describe(*failure) << "\n";
            return ExitCode::Failure;
        }
        manifestBytes = std::move(std::get<std::vector<std::uint8_t>>(encoded));
    }

    std::vector<std::uint8_t> keyBytes{};
    auto wipeKeyBytes = chunkvault::security::scopeWipe(std::span<std::uint8_t>{ keyBytes });
    if (cmd.rawKey)
    {
        const auto text = chunkvault::security::asStringView(upload.exportedKey);
        keyBytes.assign(text.begin(), text.end());
        keyBytes.push_back('\n');
    }
    else
    {
        chunkvault::core::KeyCustody custody{ *crypto };
        auto imported = custody.importRawKey(chunkvault::security::asStringView(upload.exportedKey));
        if (const auto* failure = std::get_if<chunkvault::core::ChunkFailure>(&imported))
        {
            m_err << "error: " << chunkvault::core::describe(*failure) << "\n";
            return ExitCode::Failure;
        }
        const auto& master = std::get<chunkvault::core::MasterKey>(imported);

        chunkvault::core::ChunkResult<chunkvault::core::WrappedKey> wrapped{ chunkvault::core::fail(
            chunkvault::core::ChunkError::CryptoError) };
        if (cmd.recipient.empty())
        {
            wrapped = custody.wrapRawExport(master, cmd.recipient);
        }
        else
        {
            auto passphrase = m_passphraseReader("Passphrase for " + cmd.recipient + ": ");
            auto wipePassphrase = chunkvault::security::scopeWipe(passphrase);
            wrapped = custody.wrapForRecipient(master, cmd.recipient, passphrase, *wrapParams);
        }
        if (const auto* failure = std::get_if<chunkvault::core::ChunkFailure>(&wrapped))
        {
            m_err << "error: " << chunkvault::core::describe(*failure) << "\n";
            return ExitCode::Failure;
        }

        auto encoded = chunkvault::core::encodeWrappedKey(std::get<chunkvault::core::WrappedKey>(wrapped));
        if (const auto* failure = std::get_if<chunkvault::core::ChunkFailure>(&encoded))
        {
            m_err << "error: " << chunkvault::core::describe(*failure) << "\n";
            return ExitCode::Failure;
        }
        keyBytes = std::move(std::get<std::vector<std::uint8_t>>(encoded));
    }
    wipeKeyBytes = chunkvault::security::scopeWipe(std::span<std::uint8_t>{ keyBytes });

    writeFileBytes(manifestPath, manifestBytes);
    writeFileBytes(keyPath, keyBytes);
    restrictToOwner(keyPath, m_err);
    blobCleanup.release();

    if (cmd.registerFile)
    {
        requireDb();
        auto repo = chunkvault::storage::sqlite::makeSqliteFileRepository(m_dbPath);

        chunkvault::storage::FileRecord record{};
        record.fileId = cmd.fileId.empty() ? randomFileId() : cmd.fileId;
        record.fileName = fs::path{ cmd.input }.filename().string();
        record.plainTextBytes = source.size();
        record.manifest = manifestBytes;
        record.wrappedKey = keyBytes;
        record.blobPath = fs::absolute(blobPath).string();
        record.createdAtUnixSeconds = unixSecondsNow();
        repo->storeFile(record);
        m_out << "registered: " << record.fileId << "\n";
    }

    m_out << "encrypted " << source.size() << " bytes into " << upload.manifest.chunkCount() << " chunk(s) using "
          << chunkvault::crypto::cipherSuiteName(crypto->suite()) << "\n";
    return ExitCode::Ok;
}

ExitCode CommandLine::doDecrypt(DecryptCommand cmd)
{
    std::vector<std::uint8_t> manifestBytes{};
    std::vector<std::uint8_t> keyBytes{};
    auto wipeKeyBytes = chunkvault::security::scopeWipe(std::span<std::uint8_t>{ keyBytes });

    if (!cmd.fileId.empty())
    {
        requireDb();
        auto repo = chunkvault::storage::sqlite::makeSqliteFileRepository(m_dbPath);
        auto record = repo->loadFile(cmd.fileId);
        if (cmd.blob.empty())
        {
            cmd.blob = record.blobPath;
        }
        manifestBytes = std::move(record.manifest);
        keyBytes = std::move(record.wrappedKey);
    }

    if (cmd.blob.empty() || (manifestBytes.empty() && cmd.manifest.empty()) ||
        (keyBytes.empty() && cmd.key.empty()))
    {
        m_err << "error: decrypt needs --id or all of --blob, --manifest and --key\n";
        return ExitCode::Usage;
    }
    for (const auto& in : { cmd.blob, cmd.manifest, cmd.key })
    {
        if (!in.empty() && samePath(fs::path{ cmd.out }, fs::path{ in }))
        {
            m_err << "error: --out would overwrite " << in << "\n";
            return ExitCode::Usage;
        }
    }
    if (!cmd.manifest.empty())
    {
        manifestBytes = readFileBytes(cmd.manifest);
    }
    if (!cmd.key.empty())
    {
        keyBytes = readFileBytes(cmd.key);
    }
    wipeKeyBytes = chunkvault::security::scopeWipe(std::span<std::uint8_t>{ keyBytes });

    auto decoded = chunkvault::core::decodeManifest(manifestBytes);
    if (const auto* failure = std::get_if<chunkvault::core::ChunkFailure>(&decoded))
    {
        m_err << "error: " << chunkvault::core::describe(*failure) << "\n";
        return ExitCode::Failure;
    }
    const auto& manifest = std::get<chunkvault::core::ChunkManifest>(decoded);

    auto crypto = makeProvider();
    chunkvault::core::KeyCustody custody{ *crypto };

    chunkvault::core::ChunkResult<chunkvault::core::MasterKey> master{ chunkvault::core::fail(
        chunkvault::core::ChunkError::KeyDerivationFailed) };
    if (chunkvault::core::isWrappedKey(keyBytes))
    {
        auto wrapped = chunkvault::core::decodeWrappedKey(keyBytes);
        if (const auto* failure = std::get_if<chunkvault::core::ChunkFailure>(&wrapped))
        {
            m_err << "error: " << chunkvault::core::describe(*failure) << "\n";
            return ExitCode::Failure;
        }
        const auto& wk = std::get<chunkvault::core::WrappedKey>(wrapped);
        chunkvault::security::SecureString passphrase{};
        auto wipePassphrase = chunkvault::security::scopeWipe(passphrase);
        if (wk.kind() == chunkvault::core::KeyEncapsulationKind::PassphraseWrap)
        {
            passphrase = m_passphraseReader("Passphrase for " + wk.recipientId + ": ");
            wipePassphrase = chunkvault::security::scopeWipe(passphrase);
        }
        master = custody.unwrapKey(wk, passphrase);
    }
    else
    {
        master = custody.importRawKey(trimmed(keyBytes));
    }
    if (const auto* failure = std::get_if<chunkvault::core::ChunkFailure>(&master))
    {
        m_err << "error: " << chunkvault::core::describe(*failure) << "\n";
        return ExitCode::Failure;
    }

    chunkvault::core::FileByteSource blob{ cmd.blob };
    const fs::path outPath{ cmd.out };
    OutputCleanup outCleanup{ outPath };
    std::ofstream out{ outPath, std::ios::binary | std::ios::trunc };
    if (!out)
    {
        throw std::runtime_error("cannot open " + outPath.string() + " for writing");
    }

    chunkvault::core::PipelineOptions options{};
    options.malformedPolicy = cmd.skipMalformed ? chunkvault::core::MalformedChunkPolicy::SkipAndReport
                                                : chunkvault::core::MalformedChunkPolicy::Fail;

    chunkvault::core::StreamAssembler assembler{ *crypto };
    auto downloaded = assembler.decryptStream(
        blob, manifest, std::get<chunkvault::core::MasterKey>(master).bytes(),
        [&out](std::span<const std::uint8_t> plain) {
            out.write(reinterpret_cast<const char*>(plain.data()), static_cast<std::streamsize>(plain.size()));
            if (!out)
            {
                throw std::runtime_error("output write failed");
            }
        },
        [this](const chunkvault::core::ProgressEvent& ev) { printProgress(m_out, "decrypt", ev); }, options);
    out.close();

    if (const auto* failure = std::get_if<chunkvault::core::ChunkFailure>(&downloaded))
    {
        m_err << "error: " << chunkvault::core::describe(*failure) << "\n";
        return ExitCode::Failure;
    }
    if (!out)
    {
        m_err << "error: failed to finish writing " << outPath.string() << "\n";
        return ExitCode::Failure;
    }
    outCleanup.release();

    const auto& report = std::get<chunkvault::core::DownloadReport>(downloaded);
    for (const auto index : report.skippedChunks)
    {
        m_err << "warning: skipped chunk " << index << " (non-positive length in manifest)\n";
    }
    m_out << "decrypted " << report.bytesWritten << " bytes from " << report.chunksDecrypted << " chunk(s)\n";
    return ExitCode::Ok;
}

ExitCode CommandLine::doInspect(const std::string& manifestPath)
{
    const auto bytes = readFileBytes(manifestPath);
    auto decoded = chunkvault::core::decodeManifest(bytes);
    if (const auto* failure = std::get_if<chunkvault::core::ChunkFailure>(&decoded))
    {
        m_err << "error: " << chunkvault::core::describe(*failure) << "\n";
        return ExitCode::Failure;
    }
    const auto& manifest = std::get<chunkvault::core::ChunkManifest>(decoded);

    m_out << "format: " << (chunkvault::core::isManifestV2(bytes) ? "v2" : "legacy") << "\n";
    m_out << "suite: "
          << (manifest.suite ? chunkvault::crypto::cipherSuiteName(*manifest.suite) : std::string_view{ "unrecorded" })
          << "\n";
    m_out << "chunk size: " << manifest.chunkSize << "\n";
    m_out << "plaintext bytes: ";
    if (manifest.plainTextBytes)
    {
        m_out << *manifest.plainTextBytes;
    }
    else
    {
        m_out << "unknown";
    }
    m_out << "\n";
    m_out << "chunks: " << manifest.chunkCount() << "\n";

    for (std::size_t i{}; i < manifest.entries.size(); ++i)
    {
        const auto& entry = manifest.entries[i];
        m_out << "  #" << i << " iv=" << chunkvault::core::encodeBase64(entry.iv) << " length=";
        if (entry.cipherTextBytes)
        {
            m_out << *entry.cipherTextBytes;
        }
        else
        {
            m_out << "implicit";
        }
        m_out << "\n";
    }
    return ExitCode::Ok;
}

ExitCode CommandLine::doList()
{
    requireDb();
    auto repo = chunkvault::storage::sqlite::makeSqliteFileRepository(m_dbPath);
    const auto files = repo->listFiles();
    if (files.empty())
    {
        m_out << "(no files)\n";
        return ExitCode::Ok;
    }
    for (const auto& f : files)
    {
        m_out << f.fileId << "\t" << f.fileName << "\t" << f.plainTextBytes << "\t" << f.blobPath << "\n";
    }
    return ExitCode::Ok;
}

ExitCode CommandLine::doRemove(const std::string& fileId, bool purgeBlob)
{
    requireDb();
    auto repo = chunkvault::storage::sqlite::makeSqliteFileRepository(m_dbPath);

    std::string blobPath{};
    if (purgeBlob)
    {
        try
        {
            blobPath = repo->loadFile(fileId).blobPath;
        }
        catch (const chunkvault::storage::FileNotFound&)
        {
            m_err << "error: no file with id " << fileId << "\n";
            return ExitCode::Failure;
        }
    }

    if (!repo->deleteFile(fileId))
    {
        m_err << "error: no file with id " << fileId << "\n";
        return ExitCode::Failure;
    }

    if (!blobPath.empty())
    {
        std::error_code ec{};
        fs::remove(blobPath, ec);
        if (ec)
        {
            m_err << "warning: could not delete " << blobPath << "\n";
        }
    }
    m_out << "removed: " << fileId << "\n";
    return ExitCode::Ok;
}

} // namespace chunkvault::ui::cli
