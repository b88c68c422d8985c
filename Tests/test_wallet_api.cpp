#include "AddressDerivation.h"
#include "ByteCodec.h"
#include "FakeTransport.h"
#include "KeyVault.h"
#include "TestUtils.h"
#include "WalletAPI.h"
#include <array>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

using json = nlohmann::json;
using TestUtils::FakeTransport;
using TestUtils::hexBytes;
using Vault::ChainType;
using Vault::ErrorCode;

namespace {

const char* const EVM_KEY = "4646464646464646464646464646464646464646464646464646464646464646";
const char* const ED25519_SEED = "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
const char* const BTC_RECIPIENT = "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH";
const char* const USDT = "TR7NHqjeKQxGTCi8q8ZY4pL8otSzgjLj6t";

Chains::SignerConfig testConfig() {
    Chains::SignerConfig config;
    config.evm.rpcUrls = {{1, "https://eth.node.test"}, {56, "https://bsc.node.test"}};
    return config;
}

// Ciphertext as the vault stores it for the standard device secret
std::string sealKey(const std::string& keyHex) {
    auto wrappingKey = KeyVault::DeriveEncryptionKey(TestUtils::deviceSecret());
    if (!wrappingKey) {
        return std::string();
    }
    auto sealed = KeyVault::Encrypt(*wrappingKey, keyHex);
    return sealed ? *sealed : std::string();
}

std::vector<uint8_t> wrongSecret() {
    std::vector<uint8_t> secret = TestUtils::deviceSecret();
    secret.back() ^= 0x80;
    return secret;
}

} // namespace

bool testChainTypeDispatch() {
    TEST_START("Request Chain Families");

    TEST_ASSERT(WalletAPI::ChainTypeOf(EVM::TransactionRequest()) == ChainType::EVM, "EVM request");
    TEST_ASSERT(WalletAPI::ChainTypeOf(Bitcoin::TransferRequest()) == ChainType::BTC, "Bitcoin request");
    TEST_ASSERT(WalletAPI::ChainTypeOf(Solana::TransferRequest()) == ChainType::SVM, "Solana request");
    TEST_ASSERT(WalletAPI::ChainTypeOf(Tron::TransferRequest()) == ChainType::TRON, "TRX request");
    TEST_ASSERT(WalletAPI::ChainTypeOf(Tron::Trc20TransferRequest()) == ChainType::TRON, "TRC20 request");
    TEST_ASSERT(WalletAPI::ChainTypeOf(Ton::TransferRequest()) == ChainType::TON, "TON request");

    TEST_STEP("Transaction ids per family");
    Bitcoin::SignedTransaction btc;
    btc.txid = "ab12";
    TEST_ASSERT(WalletAPI::TransactionIdOf(btc) == "ab12", "Bitcoin uses the txid");
    Solana::SignedTransaction sol;
    sol.signature = "5Ver";
    TEST_ASSERT(WalletAPI::TransactionIdOf(sol) == "5Ver", "Solana uses the signature");
    Ton::SignedTransaction ton;
    ton.hash = "beef";
    TEST_ASSERT(WalletAPI::TransactionIdOf(ton) == "beef", "TON uses the message hash");

    TEST_PASS();
}

bool testGenerateAndUnlock() {
    TEST_START("Generate Wallets Through the Facade");

    FakeTransport transport;
    WalletAPI::MultiChainWallet wallet(testConfig(), transport);

    auto wallets = wallet.GenerateWalletsForChains(TestUtils::deviceSecret(), {ChainType::EVM, ChainType::TON});
    TEST_ASSERT(wallets && wallets->size() == 2, "Two wallets expected");

    for (const Vault::WalletData& data : *wallets) {
        auto address = wallet.GetAddressFromPrivateKey(data.chainType, TestUtils::deviceSecret(),
                                                       data.privateKeyEncrypted);
        TEST_ASSERT(address && *address == data.address,
                    "Address must re-derive for " + Vault::ChainTypeToString(data.chainType));
    }

    auto keyHex = wallet.DecryptPrivateKey(TestUtils::deviceSecret(), (*wallets)[0].privateKeyEncrypted);
    TEST_ASSERT(keyHex && keyHex->size() == 64, "Decrypted key is 64 hex characters");
    Crypto::SecureWipeString(keyHex.data);

    auto locked = wallet.GetAddressFromPrivateKey(ChainType::EVM, wrongSecret(), (*wallets)[0].privateKeyEncrypted);
    TEST_ASSERT(!locked && locked.errorCode == ErrorCode::AuthenticationFailure, "Wrong secret must fail");
    TEST_ASSERT(transport.totalCalls() == 0, "Key management never touches the network");

    TEST_PASS();
}

bool testSignEvmFromVault() {
    TEST_START("EVM Signing From Ciphertext");

    FakeTransport transport;
    WalletAPI::MultiChainWallet wallet(testConfig(), transport);
    const std::string sealed = sealKey(EVM_KEY);
    TEST_ASSERT(!sealed.empty(), "Sealing the key should succeed");

    EVM::TransactionRequest tx;
    tx.to = "0x3535353535353535353535353535353535353535";
    tx.value = "1000000000000000000";
    tx.gasPrice = "20000000000";
    tx.gasLimit = "21000";
    tx.nonce = 9;

    auto signedTx = wallet.SignTransaction(TestUtils::deviceSecret(), sealed, tx);
    TEST_ASSERT(signedTx, "Signing should succeed: " + signedTx.errorMessage);
    TEST_ASSERT(std::holds_alternative<EVM::SignedTransaction>(*signedTx), "EVM result expected");

    const EVM::SignedTransaction& evm = std::get<EVM::SignedTransaction>(*signedTx);
    TEST_ASSERT(evm.rawTransaction ==
                    "0xf86c098504a817c800825208943535353535353535353535353535353535353535880de0b6b3a764000080"
                    "25a028ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276a067cbe9d8997f761aecb7"
                    "03304b3800ccf555c9f3dc64214b297fb1966a3b6d83",
                "EIP-155 raw transaction mismatch");
    TEST_ASSERT(WalletAPI::TransactionIdOf(*signedTx) == evm.transactionHash, "Id is the transaction hash");
    TEST_ASSERT(transport.totalCalls() == 0, "Fully specified transactions need no node");

    TEST_STEP("Wrong device secret");
    auto locked = wallet.SignTransaction(wrongSecret(), sealed, tx);
    TEST_ASSERT(!locked && locked.errorCode == ErrorCode::AuthenticationFailure, "Wrong secret must fail");

    auto sendLocked = wallet.SignAndSendTransaction(wrongSecret(), sealed, tx);
    TEST_ASSERT(!sendLocked && sendLocked.errorCode == ErrorCode::AuthenticationFailure, "Nothing is sent");
    TEST_ASSERT(transport.totalCalls() == 0, "A locked key never reaches the network");

    TEST_PASS();
}

bool testSignBitcoinFromVault() {
    TEST_START("Bitcoin Signing With Explicit UTXOs");

    FakeTransport transport;
    WalletAPI::MultiChainWallet wallet(testConfig(), transport);
    const std::string sealed = sealKey(EVM_KEY);

    Bitcoin::UTXO utxo;
    utxo.txid = std::string(64, 'c');
    utxo.vout = 1;
    utxo.value = 20000;

    Bitcoin::TransferRequest request;
    request.utxos = {utxo};
    request.to = BTC_RECIPIENT;
    request.amount = 15000;
    request.fee = 1000;

    auto signedTx = wallet.SignTransaction(TestUtils::deviceSecret(), sealed, request);
    TEST_ASSERT(signedTx, "Signing should succeed: " + signedTx.errorMessage);
    TEST_ASSERT(std::holds_alternative<Bitcoin::SignedTransaction>(*signedTx), "Bitcoin result expected");

    const Bitcoin::SignedTransaction& btc = std::get<Bitcoin::SignedTransaction>(*signedTx);
    TEST_ASSERT(btc.change == 4000 && btc.fee == 1000, "Change is input minus amount minus fee");
    TEST_ASSERT(WalletAPI::TransactionIdOf(*signedTx) == btc.txid && btc.txid.size() == 64, "Id is the txid");
    TEST_ASSERT(transport.totalCalls() == 0, "Explicit inputs need no UTXO lookup");

    TEST_STEP("Empty input list fetches UTXOs");
    request.utxos.clear();
    auto fetched = wallet.SignTransaction(TestUtils::deviceSecret(), sealed, request);
    TEST_ASSERT(!fetched, "Unscripted lookups fail");
    TEST_ASSERT(transport.totalCalls() > 0, "The UTXO source must be consulted");

    TEST_PASS();
}

bool testSignAccountChains() {
    TEST_START("Solana, TRON and TON Through the Facade");

    FakeTransport transport;
    WalletAPI::MultiChainWallet wallet(testConfig(), transport);

    TEST_STEP("Solana");
    const std::string solanaSealed = sealKey(ED25519_SEED);
    transport.onRpc("getLatestBlockhash",
                    {{"context", {{"slot", 1}}},
                     {"value", {{"blockhash", Codec::EncodeBase58(std::vector<uint8_t>(32, 0x44))},
                                {"lastValidBlockHeight", 100}}}});

    Solana::TransferRequest solana;
    solana.to = Codec::EncodeBase58(std::vector<uint8_t>(32, 0x22));
    solana.lamports = 5000;
    auto solTx = wallet.SignTransaction(TestUtils::deviceSecret(), solanaSealed, solana);
    TEST_ASSERT(solTx && std::holds_alternative<Solana::SignedTransaction>(*solTx),
                "Solana signing should succeed: " + solTx.errorMessage);
    TEST_ASSERT(!WalletAPI::TransactionIdOf(*solTx).empty(), "Signature is the id");

    TEST_STEP("TRON");
    const std::string tronSealed = sealKey(EVM_KEY);
    std::vector<uint8_t> rawData = hexBytes("0a02abcd");
    std::array<uint8_t, 32> txId;
    Crypto::SHA256(rawData.data(), rawData.size(), txId);
    const std::string txIdHex = Codec::BytesToHex(txId.data(), txId.size());
    transport.onPost("https://api.trongrid.io/wallet/createtransaction",
                     {{"txID", txIdHex}, {"raw_data_hex", "0a02abcd"}});

    Tron::TransferRequest tron;
    tron.to = USDT;
    tron.amount = 1000000;
    auto tronTx = wallet.SignTransaction(TestUtils::deviceSecret(), tronSealed, tron);
    TEST_ASSERT(tronTx && std::holds_alternative<Tron::SignedTransaction>(*tronTx),
                "TRON signing should succeed: " + tronTx.errorMessage);
    TEST_ASSERT(WalletAPI::TransactionIdOf(*tronTx) == txIdHex, "txID is the id");

    TEST_STEP("TON");
    const std::string tonSealed = sealKey(ED25519_SEED);
    json seqno;
    seqno["stack"] = json::array({json::array({"num", "0x5"})});
    transport.onGet("https://toncenter.com/api/v2/runGetMethod", {{"ok", true}, {"result", seqno}});

    Ton::TransferRequest ton;
    auto tonDestination = AddressDerivation::DeriveTonAddress(hexBytes(EVM_KEY));
    TEST_ASSERT(tonDestination, "Destination derivation should succeed");
    ton.to = *tonDestination;
    ton.amount = "1000";
    auto tonTx = wallet.SignTransaction(TestUtils::deviceSecret(), tonSealed, ton);
    TEST_ASSERT(tonTx && std::holds_alternative<Ton::SignedTransaction>(*tonTx),
                "TON signing should succeed: " + tonTx.errorMessage);
    TEST_ASSERT(std::get<Ton::SignedTransaction>(*tonTx).seqno == 5, "Fetched seqno is used");

    TEST_PASS();
}

bool testSignMessages() {
    TEST_START("Message Signing Through the Facade");

    FakeTransport transport;
    WalletAPI::MultiChainWallet wallet(testConfig(), transport);
    const std::string sealed = sealKey(ED25519_SEED);

    auto btc = wallet.SignMessage(ChainType::BTC, TestUtils::deviceSecret(), sealed, "hello");
    TEST_ASSERT(!btc && btc.errorCode == ErrorCode::UnsupportedChain, "Bitcoin message signing is unsupported");

    auto ton = wallet.SignMessage(ChainType::TON, TestUtils::deviceSecret(), sealed, "");
    TEST_ASSERT(ton && ton->compare(0, 16, "e5564300c360ac72") == 0, "RFC 8032 signature for the empty message");

    auto evm = wallet.SignMessage(ChainType::EVM, TestUtils::deviceSecret(), sealed, "hello");
    TEST_ASSERT(evm && evm->size() == 132, "0x + 65-byte personal signature");

    auto locked = wallet.SignMessage(ChainType::SVM, wrongSecret(), sealed, "hello");
    TEST_ASSERT(!locked && locked.errorCode == ErrorCode::AuthenticationFailure, "Wrong secret must fail");

    TEST_PASS();
}

bool testQueries() {
    TEST_START("Balance and History Routing");

    FakeTransport transport;
    WalletAPI::MultiChainWallet wallet(testConfig(), transport);

    transport.onRpc("eth_getBalance", "0xde0b6b3a7640000");
    TEST_ASSERT(wallet.GetBalance(ChainType::EVM, "0x3535353535353535353535353535353535353535") ==
                    "1000000000000000000",
                "Empty network defaults to chain 1");
    const size_t evmCalls = transport.totalCalls();
    TEST_ASSERT(wallet.GetBalance(ChainType::EVM, "0x35", "mainnet") == "0", "EVM networks are chain ids");
    TEST_ASSERT(transport.totalCalls() == evmCalls, "Invalid chain ids never reach the node");

    TEST_ASSERT(wallet.GetBalance(ChainType::BTC, BTC_RECIPIENT, "regtest") == "0", "Unknown Bitcoin network");

    transport.onPost("https://api.trongrid.io/wallet/getaccount", {{"balance", 42u}});
    TEST_ASSERT(wallet.GetBalance(ChainType::TRON, USDT) == "42", "TRON defaults to mainnet");

    TEST_ASSERT(wallet.GetTokenBalance(ChainType::TON, "EQtoken", "EQwallet") == "0", "TON has no token balances");
    TEST_ASSERT(wallet.GetTransactionHistory(ChainType::BTC, BTC_RECIPIENT).empty(), "No Bitcoin history source");
    TEST_ASSERT(wallet.GetTransactionHistory(ChainType::SVM, "11111111111111111111111111111111").empty(),
                "No Solana history source");

    TEST_PASS();
}

int main() {
    TestUtils::printTestHeader("Wallet API Tests");
    TestUtils::initializeTestLogger("test_wallet_api.log");

    testChainTypeDispatch();
    testGenerateAndUnlock();
    testSignEvmFromVault();
    testSignBitcoinFromVault();
    testSignAccountChains();
    testSignMessages();
    testQueries();

    Vault::Logger::getInstance().shutdown();
    TestUtils::printTestSummary("Wallet API");

    return (TestGlobals::g_testsFailed == 0) ? 0 : 1;
}
