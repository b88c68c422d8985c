#include "include/Crypto.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>
#include <secp256k1.h>
#include <secp256k1_recovery.h>
#include <sodium.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Crypto {

namespace {

constexpr size_t GCM_KEY_SIZE = 32;
constexpr size_t GCM_IV_SIZE = 12;
constexpr size_t GCM_TAG_SIZE = 16;
constexpr size_t SECP256K1_KEY_SIZE = 32;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

// One randomized context for the whole process; secp256k1 calls on a const context are thread-safe
class Secp256k1Context {
public:
    Secp256k1Context() : m_ctx(secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY)) {
        std::array<uint8_t, 32> seed{};
        if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) == 1) {
            // Unblinded contexts still sign correctly
            (void)secp256k1_context_randomize(m_ctx, seed.data());
        }
        sodium_memzero(seed.data(), seed.size());
    }
    ~Secp256k1Context() { secp256k1_context_destroy(m_ctx); }

    Secp256k1Context(const Secp256k1Context&) = delete;
    Secp256k1Context& operator=(const Secp256k1Context&) = delete;

    const secp256k1_context* get() const { return m_ctx; }

private:
    secp256k1_context* m_ctx;
};

const secp256k1_context* Secp256k1() {
    static const Secp256k1Context context;
    return context.get();
}

// libsodium must be initialized before any crypto_sign_* call
bool EnsureSodium() {
    static std::once_flag once;
    static bool ready = false;
    std::call_once(once, [] { ready = sodium_init() >= 0; });
    return ready;
}

bool SerializePoint(const secp256k1_context* ctx, const secp256k1_pubkey& point, unsigned int flags,
                    std::vector<uint8_t>& out) {
    std::array<uint8_t, 65> buffer{};
    size_t length = buffer.size();
    if (secp256k1_ec_pubkey_serialize(ctx, buffer.data(), &length, &point, flags) != 1) {
        return false;
    }
    out.assign(buffer.begin(), buffer.begin() + length);
    return true;
}

bool PublicKeyFor(const std::vector<uint8_t>& private_key, unsigned int flags, std::vector<uint8_t>& out) {
    if (private_key.size() != SECP256K1_KEY_SIZE) {
        return false;
    }
    const secp256k1_context* ctx = Secp256k1();
    secp256k1_pubkey point;
    if (secp256k1_ec_pubkey_create(ctx, &point, private_key.data()) != 1) {
        return false;
    }
    return SerializePoint(ctx, point, flags, out);
}

} // namespace

// === Random Number Generation ===
bool RandBytes(void* buf, size_t len) {
    return RAND_bytes(static_cast<unsigned char*>(buf), static_cast<int>(len)) == 1;
}

// === Hash Functions ===
bool SHA256(const uint8_t* data, size_t len, std::array<uint8_t, 32>& out) {
    unsigned int written = 0;
    return EVP_Digest(data, len, out.data(), &written, EVP_sha256(), nullptr) == 1 && written == out.size();
}

bool DoubleSHA256(const uint8_t* data, size_t len, std::array<uint8_t, 32>& out) {
    std::array<uint8_t, 32> first;
    if (!SHA256(data, len, first)) {
        return false;
    }
    return SHA256(first.data(), first.size(), out);
}

// === RIPEMD-160 ===
// OpenSSL 3 moved RIPEMD-160 to the legacy provider, so it is computed here.

static uint32_t RIPEMD160_F(uint32_t x, uint32_t y, uint32_t z, int round) {
    if (round < 16)
        return x ^ y ^ z;
    if (round < 32)
        return (x & y) | (~x & z);
    if (round < 48)
        return (x | ~y) ^ z;
    if (round < 64)
        return (x & z) | (y & ~z);
    return x ^ (y | ~z);
}

static inline uint32_t ROTL32(uint32_t value, int bits) {
    return (value << bits) | (value >> (32 - bits));
}

bool RIPEMD160(const uint8_t* data, size_t len, std::array<uint8_t, 20>& out) {
    static const uint32_t KL[5] = {0x00000000, 0x5A827999, 0x6ED9EBA1, 0x8F1BBCDC, 0xA953FD4E};
    static const uint32_t KR[5] = {0x50A28BE6, 0x5C4DD124, 0x6D703EF3, 0x7A6D76E9, 0x00000000};

    // Message word selection, left and right lines
    static const int RL[80] = {0, 1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14, 15,
                               7, 4,  13, 1,  10, 6,  15, 3,  12, 0, 9,  5,  2,  14, 11, 8,
                               3, 10, 14, 4,  9,  15, 8,  1,  2,  7, 0,  6,  13, 11, 5,  12,
                               1, 9,  11, 10, 0,  8,  12, 4,  13, 3, 7,  15, 14, 5,  6,  2,
                               4, 0,  5,  9,  7,  12, 2,  10, 14, 1, 3,  8,  11, 6,  15, 13};
    static const int RR[80] = {5,  14, 7,  0, 9, 2,  11, 4,  13, 6,  15, 8,  1,  10, 3,  12,
                               6,  11, 3,  7, 0, 13, 5,  10, 14, 15, 8,  12, 4,  9,  1,  2,
                               15, 5,  1,  3, 7, 14, 6,  9,  11, 8,  12, 2,  10, 0,  4,  13,
                               8,  6,  4,  1, 3, 11, 15, 0,  5,  12, 2,  13, 9,  7,  10, 14,
                               12, 15, 10, 4, 1, 5,  8,  7,  6,  2,  13, 14, 0,  3,  9,  11};

    // Rotation amounts, left and right lines
    static const int SL[80] = {11, 14, 15, 12, 5,  8,  7,  9,  11, 13, 14, 15, 6,  7,  9,  8,
                               7,  6,  8,  13, 11, 9,  7,  15, 7,  12, 15, 9,  11, 7,  13, 12,
                               11, 13, 6,  7,  14, 9,  13, 15, 14, 8,  13, 6,  5,  12, 7,  5,
                               11, 12, 14, 15, 14, 15, 9,  8,  9,  14, 5,  6,  8,  6,  5,  12,
                               9,  15, 5,  11, 6,  8,  13, 12, 5,  12, 13, 14, 11, 8,  5,  6};
    static const int SR[80] = {8,  9,  9,  11, 13, 15, 15, 5,  7,  7,  8,  11, 14, 14, 12, 6,
                               9,  13, 15, 7,  12, 8,  9,  11, 7,  7,  12, 7,  6,  15, 13, 11,
                               9,  7,  15, 11, 8,  6,  6,  14, 12, 13, 5,  14, 13, 13, 7,  5,
                               15, 5,  8,  11, 14, 14, 6,  14, 6,  9,  12, 9,  12, 5,  15, 8,
                               8,  5,  12, 9,  12, 5,  14, 6,  8,  13, 6,  5,  15, 13, 11, 11};

    uint32_t h[5] = {0x67452301, 0xEFCDAB89, 0x98BADCFE, 0x10325476, 0xC3D2E1F0};

    // Pad to 56 mod 64, then append the bit length little-endian
    size_t padded_len = len + 1;
    while (padded_len % 64 != 56)
        padded_len++;
    std::vector<uint8_t> padded(padded_len + 8, 0);
    if (len > 0) {
        std::memcpy(padded.data(), data, len);
    }
    padded[len] = 0x80;
    uint64_t bit_len = static_cast<uint64_t>(len) * 8;
    for (int i = 0; i < 8; i++) {
        padded[padded_len + i] = static_cast<uint8_t>(bit_len >> (i * 8));
    }

    for (size_t block = 0; block < padded.size(); block += 64) {
        uint32_t X[16];
        for (int i = 0; i < 16; i++) {
            const uint8_t* p = &padded[block + i * 4];
            X[i] = static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
                   (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
        }

        uint32_t al = h[0], bl = h[1], cl = h[2], dl = h[3], el = h[4];
        uint32_t ar = h[0], br = h[1], cr = h[2], dr = h[3], er = h[4];

        for (int i = 0; i < 80; i++) {
            uint32_t t = ROTL32(al + RIPEMD160_F(bl, cl, dl, i) + X[RL[i]] + KL[i / 16], SL[i]) + el;
            al = el;
            el = dl;
            dl = ROTL32(cl, 10);
            cl = bl;
            bl = t;

            t = ROTL32(ar + RIPEMD160_F(br, cr, dr, 79 - i) + X[RR[i]] + KR[i / 16], SR[i]) + er;
            ar = er;
            er = dr;
            dr = ROTL32(cr, 10);
            cr = br;
            br = t;
        }

        uint32_t t = h[1] + cl + dr;
        h[1] = h[2] + dl + er;
        h[2] = h[3] + el + ar;
        h[3] = h[4] + al + br;
        h[4] = h[0] + bl + cr;
        h[0] = t;
    }

    for (int word = 0; word < 5; word++) {
        for (int i = 0; i < 4; i++) {
            out[word * 4 + i] = static_cast<uint8_t>(h[word] >> (i * 8));
        }
    }
    return true;
}

bool Hash160(const uint8_t* data, size_t len, std::array<uint8_t, 20>& out) {
    std::array<uint8_t, 32> sha;
    if (!SHA256(data, len, sha)) {
        return false;
    }
    return RIPEMD160(sha.data(), sha.size(), out);
}

// === Keccak-256 ===
// Original Keccak padding (0x01), not the NIST SHA3 domain byte (0x06).

static const uint64_t KECCAK_ROUND_CONSTANTS[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808AULL, 0x8000000080008000ULL,
    0x000000000000808BULL, 0x0000000080000001ULL, 0x8000000080008081ULL, 0x8000000000008009ULL,
    0x000000000000008AULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000AULL,
    0x000000008000808BULL, 0x800000000000008BULL, 0x8000000000008089ULL, 0x8000000000008003ULL,
    0x8000000000008002ULL, 0x8000000000000080ULL, 0x000000000000800AULL, 0x800000008000000AULL,
    0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL};

static inline uint64_t ROTL64(uint64_t x, int n) {
    return (x << n) | (x >> (64 - n));
}

static void Keccak_f1600(uint64_t state[25]) {
    static const int rotations[24] = {1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
                                      27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44};

    for (int round = 0; round < 24; round++) {
        // Theta
        uint64_t C[5];
        for (int x = 0; x < 5; x++) {
            C[x] = state[x] ^ state[x + 5] ^ state[x + 10] ^ state[x + 15] ^ state[x + 20];
        }
        for (int x = 0; x < 5; x++) {
            uint64_t D = C[(x + 4) % 5] ^ ROTL64(C[(x + 1) % 5], 1);
            for (int y = 0; y < 5; y++) {
                state[x + 5 * y] ^= D;
            }
        }

        // Rho and Pi, walking lanes (x, y) -> (y, 2x + 3y)
        uint64_t B[25];
        B[0] = state[0];
        int x = 1, y = 0;
        for (int i = 0; i < 24; i++) {
            int nx = y;
            int ny = (2 * x + 3 * y) % 5;
            B[nx + 5 * ny] = ROTL64(state[x + 5 * y], rotations[i]);
            x = nx;
            y = ny;
        }

        // Chi
        for (int row = 0; row < 5; row++) {
            for (int col = 0; col < 5; col++) {
                state[col + 5 * row] = B[col + 5 * row] ^
                                       ((~B[(col + 1) % 5 + 5 * row]) & B[(col + 2) % 5 + 5 * row]);
            }
        }

        // Iota
        state[0] ^= KECCAK_ROUND_CONSTANTS[round];
    }
}

static void KeccakAbsorbBlock(uint64_t state[25], const uint8_t* block, size_t rate) {
    for (size_t i = 0; i < rate / 8; i++) {
        uint64_t word = 0;
        for (size_t j = 0; j < 8; j++) {
            word |= static_cast<uint64_t>(block[i * 8 + j]) << (j * 8);
        }
        state[i] ^= word;
    }
    Keccak_f1600(state);
}

bool Keccak256(const uint8_t* data, size_t len, std::array<uint8_t, 32>& out) {
    constexpr size_t rate = 136;  // 1088-bit rate, 512-bit capacity
    uint64_t state[25] = {0};

    size_t offset = 0;
    while (len - offset >= rate) {
        KeccakAbsorbBlock(state, data + offset, rate);
        offset += rate;
    }

    uint8_t last_block[rate] = {0};
    size_t remaining = len - offset;
    if (remaining > 0) {
        std::memcpy(last_block, data + offset, remaining);
    }
    last_block[remaining] ^= 0x01;
    last_block[rate - 1] ^= 0x80;
    KeccakAbsorbBlock(state, last_block, rate);

    for (size_t i = 0; i < 4; i++) {
        for (size_t j = 0; j < 8; j++) {
            out[i * 8 + j] = static_cast<uint8_t>(state[i] >> (j * 8));
        }
    }
    return true;
}

bool HMAC_SHA256(const std::vector<uint8_t>& key, const uint8_t* data, size_t data_len,
                 std::vector<uint8_t>& out) {
    std::array<uint8_t, EVP_MAX_MD_SIZE> mac{};
    unsigned int mac_len = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), data, data_len, mac.data(),
             &mac_len) == nullptr) {
        return false;
    }
    out.assign(mac.begin(), mac.begin() + mac_len);
    SecureClear(mac.data(), mac.size());
    return true;
}

// === Key Derivation ===
bool HKDF_SHA256(const std::vector<uint8_t>& ikm, const std::string& salt, const std::string& info,
                 std::vector<uint8_t>& out, size_t out_len) {
    if (ikm.empty() || out_len == 0) {
        return false;
    }

    PkeyCtxPtr pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    if (!pctx) {
        return false;
    }
    const auto* salt_bytes = reinterpret_cast<const unsigned char*>(salt.data());
    const auto* info_bytes = reinterpret_cast<const unsigned char*>(info.data());
    if (EVP_PKEY_derive_init(pctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(pctx.get(), EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(pctx.get(), ikm.data(), static_cast<int>(ikm.size())) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_salt(pctx.get(), salt_bytes, static_cast<int>(salt.size())) <= 0 ||
        EVP_PKEY_CTX_add1_hkdf_info(pctx.get(), info_bytes, static_cast<int>(info.size())) <= 0) {
        return false;
    }

    SecureBytes derived(out_len);
    size_t produced = out_len;
    if (EVP_PKEY_derive(pctx.get(), derived.data(), &produced) <= 0 || produced != out_len) {
        return false;
    }
    SecureWipeVector(out);
    out = std::move(derived.bytes());
    return true;
}

// === Utility Functions ===
bool ConstantTimeEquals(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
    return a.size() == b.size() && CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// === Memory Security Functions ===
void SecureClear(void* ptr, size_t size) {
    // sodium_memzero does not depend on sodium_init
    if (ptr != nullptr && size > 0) {
        sodium_memzero(ptr, size);
    }
}

// Both wipes grow to capacity first so bytes past size() are cleared too
void SecureWipeVector(std::vector<uint8_t>& vec) {
    vec.resize(vec.capacity());
    SecureClear(vec.data(), vec.size());
    std::vector<uint8_t>().swap(vec);
}

void SecureWipeString(std::string& str) {
    str.resize(str.capacity());
    SecureClear(&str[0], str.size());
    std::string().swap(str);
}

// === AES-256-GCM ===
// 96-bit IV and 128-bit tag; the IV is drawn fresh for every encryption.

bool AES_GCM_Encrypt(const std::vector<uint8_t>& key, const std::vector<uint8_t>& plaintext,
                     const std::vector<uint8_t>& aad, std::vector<uint8_t>& ciphertext,
                     std::vector<uint8_t>& iv, std::vector<uint8_t>& tag) {
    if (key.size() != GCM_KEY_SIZE) {
        return false;
    }
    std::vector<uint8_t> nonce(GCM_IV_SIZE);
    if (!RandBytes(nonce.data(), nonce.size())) {
        return false;
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), nonce.data()) != 1) {
        return false;
    }

    int written = 0;
    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &written, aad.data(), static_cast<int>(aad.size())) != 1) {
        return false;
    }

    std::vector<uint8_t> body(plaintext.size());
    std::vector<uint8_t> mac(GCM_TAG_SIZE);
    int tail = 0;
    if (EVP_EncryptUpdate(ctx.get(), body.data(), &written, plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1 ||
        EVP_EncryptFinal_ex(ctx.get(), body.data() + written, &tail) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(GCM_TAG_SIZE), mac.data()) != 1) {
        return false;
    }

    ciphertext = std::move(body);
    iv = std::move(nonce);
    tag = std::move(mac);
    return true;
}

bool AES_GCM_Decrypt(const std::vector<uint8_t>& key, const std::vector<uint8_t>& ciphertext,
                     const std::vector<uint8_t>& aad, const std::vector<uint8_t>& iv,
                     const std::vector<uint8_t>& tag, std::vector<uint8_t>& plaintext) {
    if (key.size() != GCM_KEY_SIZE || iv.size() != GCM_IV_SIZE || tag.size() != GCM_TAG_SIZE) {
        return false;
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx || EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), iv.data()) != 1) {
        return false;
    }

    int written = 0;
    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &written, aad.data(), static_cast<int>(aad.size())) != 1) {
        return false;
    }

    SecureBytes body(ciphertext.size());
    if (EVP_DecryptUpdate(ctx.get(), body.data(), &written, ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != 1) {
        return false;
    }

    std::vector<uint8_t> expected(tag);
    int tail = 0;
    // The tag is checked by EVP_DecryptFinal_ex; body is wiped on any failure
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(GCM_TAG_SIZE), expected.data()) != 1 ||
        EVP_DecryptFinal_ex(ctx.get(), body.data() + written, &tail) <= 0) {
        return false;
    }

    SecureWipeVector(plaintext);
    plaintext = std::move(body.bytes());
    return true;
}

// === secp256k1 ECDSA ===

bool SignHash(const std::vector<uint8_t>& private_key, const std::array<uint8_t, 32>& hash,
              ECDSASignature& signature) {
    if (private_key.size() != SECP256K1_KEY_SIZE) {
        return false;
    }
    const secp256k1_context* ctx = Secp256k1();

    // libsecp256k1 produces low-S signatures, which is what BIP-62 relay policy requires
    secp256k1_ecdsa_signature sig;
    if (secp256k1_ecdsa_sign(ctx, &sig, hash.data(), private_key.data(), nullptr, nullptr) != 1) {
        return false;
    }

    std::array<uint8_t, 72> der{};
    size_t der_len = der.size();
    std::array<uint8_t, 64> compact{};
    if (secp256k1_ecdsa_signature_serialize_der(ctx, der.data(), &der_len, &sig) != 1 ||
        secp256k1_ecdsa_signature_serialize_compact(ctx, compact.data(), &sig) != 1) {
        return false;
    }

    signature.der_encoded.assign(der.begin(), der.begin() + der_len);
    signature.r.assign(compact.begin(), compact.begin() + 32);
    signature.s.assign(compact.begin() + 32, compact.end());
    return true;
}

bool SignHashRecoverable(const std::vector<uint8_t>& private_key,
                         const std::array<uint8_t, 32>& hash, RecoverableSignature& signature) {
    if (private_key.size() != SECP256K1_KEY_SIZE) {
        return false;
    }
    const secp256k1_context* ctx = Secp256k1();

    secp256k1_ecdsa_recoverable_signature sig;
    if (secp256k1_ecdsa_sign_recoverable(ctx, &sig, hash.data(), private_key.data(), nullptr, nullptr) != 1) {
        return false;
    }

    std::array<uint8_t, 64> compact{};
    int recovery_id = 0;
    secp256k1_ecdsa_recoverable_signature_serialize_compact(ctx, compact.data(), &recovery_id, &sig);

    signature.r.assign(compact.begin(), compact.begin() + 32);
    signature.s.assign(compact.begin() + 32, compact.end());
    signature.recovery_id = recovery_id;
    return true;
}

bool VerifySignature(const std::vector<uint8_t>& public_key, const std::array<uint8_t, 32>& hash,
                     const ECDSASignature& signature) {
    const secp256k1_context* ctx = Secp256k1();

    secp256k1_pubkey key;
    secp256k1_ecdsa_signature sig;
    if (public_key.empty() || signature.der_encoded.empty() ||
        secp256k1_ec_pubkey_parse(ctx, &key, public_key.data(), public_key.size()) != 1 ||
        secp256k1_ecdsa_signature_parse_der(ctx, &sig, signature.der_encoded.data(),
                                            signature.der_encoded.size()) != 1) {
        return false;
    }

    // High-S signatures are rejected here
    return secp256k1_ecdsa_verify(ctx, &sig, hash.data(), &key) == 1;
}

bool RecoverPublicKey(const std::array<uint8_t, 32>& hash, const RecoverableSignature& signature,
                      std::vector<uint8_t>& public_key) {
    if (signature.r.size() != 32 || signature.s.size() != 32 || signature.recovery_id < 0 ||
        signature.recovery_id > 3) {
        return false;
    }
    const secp256k1_context* ctx = Secp256k1();

    std::array<uint8_t, 64> compact{};
    std::copy(signature.r.begin(), signature.r.end(), compact.begin());
    std::copy(signature.s.begin(), signature.s.end(), compact.begin() + 32);

    secp256k1_ecdsa_recoverable_signature sig;
    secp256k1_pubkey key;
    if (secp256k1_ecdsa_recoverable_signature_parse_compact(ctx, &sig, compact.data(),
                                                            signature.recovery_id) != 1 ||
        secp256k1_ecdsa_recover(ctx, &key, &sig, hash.data()) != 1) {
        return false;
    }
    return SerializePoint(ctx, key, SECP256K1_EC_UNCOMPRESSED, public_key);
}

bool DerivePublicKey(const std::vector<uint8_t>& private_key, std::vector<uint8_t>& public_key) {
    return PublicKeyFor(private_key, SECP256K1_EC_COMPRESSED, public_key);
}

bool DeriveUncompressedPublicKey(const std::vector<uint8_t>& private_key,
                                 std::vector<uint8_t>& public_key) {
    return PublicKeyFor(private_key, SECP256K1_EC_UNCOMPRESSED, public_key);
}

// === Ed25519 ===

bool Ed25519SeedFromSecret(const std::vector<uint8_t>& secret, SecureBytes& seed) {
    if (secret.size() != crypto_sign_SEEDBYTES && secret.size() != crypto_sign_SECRETKEYBYTES) {
        return false;
    }
    std::vector<uint8_t> bytes(secret.begin(), secret.begin() + crypto_sign_SEEDBYTES);
    seed = SecureBytes(std::move(bytes));
    return true;
}

bool Ed25519PublicKeyFromSeed(const std::vector<uint8_t>& seed, std::vector<uint8_t>& public_key) {
    if (seed.size() != crypto_sign_SEEDBYTES || !EnsureSodium()) {
        return false;
    }

    std::vector<uint8_t> pk(crypto_sign_PUBLICKEYBYTES);
    SecureBytes sk(crypto_sign_SECRETKEYBYTES);
    if (crypto_sign_seed_keypair(pk.data(), sk.data(), seed.data()) != 0) {
        return false;
    }
    public_key = std::move(pk);
    return true;
}

bool Ed25519Sign(const std::vector<uint8_t>& seed, const uint8_t* message, size_t message_len,
                 std::vector<uint8_t>& signature) {
    if (seed.size() != crypto_sign_SEEDBYTES || !EnsureSodium()) {
        return false;
    }

    std::vector<uint8_t> pk(crypto_sign_PUBLICKEYBYTES);
    SecureBytes sk(crypto_sign_SECRETKEYBYTES);
    if (crypto_sign_seed_keypair(pk.data(), sk.data(), seed.data()) != 0) {
        return false;
    }

    std::vector<uint8_t> sig(crypto_sign_BYTES);
    unsigned long long sig_len = 0;
    if (crypto_sign_detached(sig.data(), &sig_len, message, message_len, sk.data()) != 0) {
        return false;
    }
    sig.resize(static_cast<size_t>(sig_len));
    signature = std::move(sig);
    return true;
}

bool Ed25519Verify(const std::vector<uint8_t>& public_key, const uint8_t* message,
                   size_t message_len, const std::vector<uint8_t>& signature) {
    if (public_key.size() != crypto_sign_PUBLICKEYBYTES || signature.size() != crypto_sign_BYTES ||
        !EnsureSodium()) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(), message, message_len, public_key.data()) == 0;
}

} // namespace Crypto
