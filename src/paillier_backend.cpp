#include "paillier_backend.hpp"

#include "encoding.hpp"

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/multiprecision/miller_rabin.hpp>

#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <sodium.h>

namespace mp = boost::multiprecision;

namespace fl {
namespace {

constexpr std::uint32_t kMinPrimeBits = 128;
constexpr const char* kHandleDomainTag = "freight-ledger:ct:v1";
constexpr const char* kCanonicalZeroTag = "freight-ledger:ct:zero";

bool ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

std::string toHex(const mp::cpp_int& value) {
    std::ostringstream oss;
    oss << std::hex << value;
    return oss.str();
}

mp::cpp_int randomBits(std::uint32_t bits) {
    std::vector<unsigned char> buffer((bits + 7) / 8);
    randombytes_buf(buffer.data(), buffer.size());

    mp::cpp_int value = 0;
    for (unsigned char byte : buffer) {
        value <<= 8;
        value += byte;
    }
    std::size_t excess = buffer.size() * 8 - bits;
    if (excess > 0) {
        value >>= excess;
    }
    return value;
}

mp::cpp_int generatePrime(std::uint32_t bits, std::uint32_t rounds) {
    for (;;) {
        mp::cpp_int candidate = randomBits(bits);
        // Top two bits keep p*q at full width; low bit keeps it odd.
        mp::bit_set(candidate, bits - 1);
        mp::bit_set(candidate, bits - 2);
        mp::bit_set(candidate, 0);
        if (mp::miller_rabin_test(candidate, rounds)) {
            return candidate;
        }
    }
}

mp::cpp_int modInverse(const mp::cpp_int& value, const mp::cpp_int& mod) {
    mp::cpp_int t = 0;
    mp::cpp_int newT = 1;
    mp::cpp_int r = mod;
    mp::cpp_int newR = value % mod;
    while (newR != 0) {
        mp::cpp_int quotient = r / newR;
        mp::cpp_int tmp = t - quotient * newT;
        t = newT;
        newT = tmp;
        tmp = r - quotient * newR;
        r = newR;
        newR = tmp;
    }
    if (r != 1) {
        throw std::runtime_error("Paillier key generation produced a non-invertible lambda");
    }
    if (t < 0) {
        t += mod;
    }
    return t;
}

} // namespace

struct PaillierBackend::Impl {
    mp::cpp_int n;
    mp::cpp_int nSquared;
    mp::cpp_int lambda;
    mp::cpp_int mu;

    std::map<Digest, mp::cpp_int> ciphertexts;
    std::uint64_t sequence = 0;
    CiphertextHandle zeroHandle;

    const mp::cpp_int& lookup(const CiphertextHandle& handle) const {
        if (!handle.isInitialized()) {
            throw std::invalid_argument("ciphertext handle is uninitialized");
        }
        auto it = ciphertexts.find(handle.id());
        if (it == ciphertexts.end()) {
            throw std::invalid_argument("unknown ciphertext handle " + handle.toHex());
        }
        return it->second;
    }

    CiphertextHandle store(const mp::cpp_int& ciphertext) {
        std::string preimage = kHandleDomainTag;
        appendU64(preimage, ++sequence);
        preimage += toHex(ciphertext);
        CiphertextHandle handle(sha256(preimage));
        ciphertexts[handle.id()] = ciphertext;
        return handle;
    }

    mp::cpp_int randomUnit() const {
        std::uint32_t bits = static_cast<std::uint32_t>(mp::msb(n)) + 1;
        for (;;) {
            mp::cpp_int r = randomBits(bits) % n;
            if (r > 0 && mp::gcd(r, n) == 1) {
                return r;
            }
        }
    }

    mp::cpp_int encryptRaw(std::int64_t value) const {
        mp::cpp_int m = value;
        if (m < 0) {
            m += n;
        }
        // g = n + 1, so g^m mod n^2 collapses to 1 + m*n.
        mp::cpp_int gm = (1 + m * n) % nSquared;
        mp::cpp_int rn = mp::powm(randomUnit(), n, nSquared);
        return (gm * rn) % nSquared;
    }
};

PaillierBackend::PaillierBackend(const Config& cfg)
    : impl_(std::make_unique<Impl>()) {
    if (cfg.primeBits < kMinPrimeBits) {
        throw std::invalid_argument("Paillier primes must be at least 128 bits");
    }
    if (cfg.millerRabinRounds == 0) {
        throw std::invalid_argument("Paillier key generation requires Miller-Rabin rounds");
    }
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium for Paillier key generation");
    }

    mp::cpp_int p = generatePrime(cfg.primeBits, cfg.millerRabinRounds);
    mp::cpp_int q = generatePrime(cfg.primeBits, cfg.millerRabinRounds);
    while (q == p) {
        q = generatePrime(cfg.primeBits, cfg.millerRabinRounds);
    }

    impl_->n = p * q;
    impl_->nSquared = impl_->n * impl_->n;
    mp::cpp_int pMinus = p - 1;
    mp::cpp_int qMinus = q - 1;
    impl_->lambda = (pMinus * qMinus) / mp::gcd(pMinus, qMinus);
    impl_->mu = modInverse(impl_->lambda % impl_->n, impl_->n);
}

PaillierBackend::~PaillierBackend() = default;

CiphertextHandle PaillierBackend::add(const CiphertextHandle& lhs, const CiphertextHandle& rhs) {
    const mp::cpp_int& a = impl_->lookup(lhs);
    const mp::cpp_int& b = impl_->lookup(rhs);
    mp::cpp_int sum = (a * b) % impl_->nSquared;
    return impl_->store(sum);
}

CiphertextHandle PaillierBackend::encryptZero() {
    return impl_->store(impl_->encryptRaw(0));
}

CiphertextHandle PaillierBackend::canonicalZero() {
    if (!impl_->zeroHandle.isInitialized()) {
        // Trivial encryption of zero (r = 1); public and deterministic.
        CiphertextHandle handle(sha256(kCanonicalZeroTag));
        impl_->ciphertexts[handle.id()] = mp::cpp_int(1);
        impl_->zeroHandle = handle;
    }
    return impl_->zeroHandle;
}

bool PaillierBackend::isInitialized(const CiphertextHandle& handle) const {
    if (!handle.isInitialized()) {
        return false;
    }
    return impl_->ciphertexts.count(handle.id()) != 0;
}

CiphertextHandle PaillierBackend::encrypt(std::int64_t value) {
    return impl_->store(impl_->encryptRaw(value));
}

std::int64_t PaillierBackend::decrypt(const CiphertextHandle& handle) const {
    const mp::cpp_int& c = impl_->lookup(handle);
    mp::cpp_int u = mp::powm(c, impl_->lambda, impl_->nSquared);
    mp::cpp_int l = (u - 1) / impl_->n;
    mp::cpp_int m = (l * impl_->mu) % impl_->n;
    if (m > impl_->n / 2) {
        m -= impl_->n;
    }
    if (m > std::numeric_limits<std::int64_t>::max() ||
        m < std::numeric_limits<std::int64_t>::min()) {
        throw std::overflow_error("Paillier plaintext exceeds signed 64-bit range");
    }
    return static_cast<std::int64_t>(m);
}

} // namespace fl
