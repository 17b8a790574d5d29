#include <array>
#include <cstddef>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include "file_insights/hash.hpp"

namespace file_insights {

    namespace {
        constexpr std::size_t kBlockBytes = 64;
        constexpr std::size_t kReadChunk = 1 << 16;

        constexpr std::array<std::uint32_t, 8> kInitialState = {
            0x6a09e667U, 0xbb67ae85U, 0x3c6ef372U, 0xa54ff53aU,
            0x510e527fU, 0x9b05688cU, 0x1f83d9abU, 0x5be0cd19U};

        constexpr std::array<std::uint32_t, 64> kRoundConstants = {
            0x428a2f98U, 0x71374491U, 0xb5c0fbcfU, 0xe9b5dba5U, 0x3956c25bU, 0x59f111f1U, 0x923f82a4U, 0xab1c5ed5U,
            0xd807aa98U, 0x12835b01U, 0x243185beU, 0x550c7dc3U, 0x72be5d74U, 0x80deb1feU, 0x9bdc06a7U, 0xc19bf174U,
            0xe49b69c1U, 0xefbe4786U, 0x0fc19dc6U, 0x240ca1ccU, 0x2de92c6fU, 0x4a7484aaU, 0x5cb0a9dcU, 0x76f988daU,
            0x983e5152U, 0xa831c66dU, 0xb00327c8U, 0xbf597fc7U, 0xc6e00bf3U, 0xd5a79147U, 0x06ca6351U, 0x14292967U,
            0x27b70a85U, 0x2e1b2138U, 0x4d2c6dfcU, 0x53380d13U, 0x650a7354U, 0x766a0abbU, 0x81c2c92eU, 0x92722c85U,
            0xa2bfe8a1U, 0xa81a664bU, 0xc24b8b70U, 0xc76c51a3U, 0xd192e819U, 0xd6990624U, 0xf40e3585U, 0x106aa070U,
            0x19a4c116U, 0x1e376c08U, 0x2748774cU, 0x34b0bcb5U, 0x391c0cb3U, 0x4ed8aa4aU, 0x5b9cca4fU, 0x682e6ff3U,
            0x748f82eeU, 0x78a5636fU, 0x84c87814U, 0x8cc70208U, 0x90befffaU, 0xa4506cebU, 0xbef9a3f7U, 0xc67178f2U};

        constexpr std::uint32_t rotate_right(std::uint32_t value, unsigned count) {
            return (value >> count) | (value << (32U - count));
        }

        std::uint32_t load_be32(const unsigned char* bytes) {
            return (static_cast<std::uint32_t>(bytes[0]) << 24) |
                (static_cast<std::uint32_t>(bytes[1]) << 16) |
                (static_cast<std::uint32_t>(bytes[2]) << 8) |
                static_cast<std::uint32_t>(bytes[3]);
        }

        void compress(std::array<std::uint32_t, 8>& state, const unsigned char* block) {
            std::array<std::uint32_t, 64> schedule {};
            for (std::size_t i = 0; i < 16; ++i) {
                schedule[i] = load_be32(block + i * 4);
            }
            for (std::size_t i = 16; i < schedule.size(); ++i) {
                const std::uint32_t w15 = schedule[i - 15];
                const std::uint32_t w2 = schedule[i - 2];
                const std::uint32_t sigma0 = rotate_right(w15, 7) ^ rotate_right(w15, 18) ^ (w15 >> 3);
                const std::uint32_t sigma1 = rotate_right(w2, 17) ^ rotate_right(w2, 19) ^ (w2 >> 10);
                schedule[i] = schedule[i - 16] + sigma0 + schedule[i - 7] + sigma1;
            }

            std::array<std::uint32_t, 8> work = state;
            for (std::size_t i = 0; i < schedule.size(); ++i) {
                const std::uint32_t e = work[4];
                const std::uint32_t a = work[0];
                const std::uint32_t sum1 = rotate_right(e, 6) ^ rotate_right(e, 11) ^ rotate_right(e, 25);
                const std::uint32_t choice = (e & work[5]) ^ (~e & work[6]);
                const std::uint32_t t1 = work[7] + sum1 + choice + kRoundConstants[i] + schedule[i];
                const std::uint32_t sum0 = rotate_right(a, 2) ^ rotate_right(a, 13) ^ rotate_right(a, 22);
                const std::uint32_t majority = (a & work[1]) ^ (a & work[2]) ^ (work[1] & work[2]);
                const std::uint32_t t2 = sum0 + majority;

                for (std::size_t j = 7; j > 0; --j) {
                    work[j] = work[j - 1];
                }
                work[4] += t1;
                work[0] = t1 + t2;
            }

            for (std::size_t i = 0; i < state.size(); ++i) {
                state[i] += work[i];
            }
        }
    }

    std::optional<std::string> sha256_hex(std::istream& input) {
        std::array<std::uint32_t, 8> state = kInitialState;
        std::array<unsigned char, kBlockBytes> pending {};
        std::size_t pending_size = 0;
        std::uint64_t total_bytes = 0;

        std::string chunk(kReadChunk, '\0');
        while (input) {
            input.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
            const auto got = static_cast<std::size_t>(input.gcount());
            total_bytes += got;
            for (std::size_t offset = 0; offset < got; ++offset) {
                pending[pending_size++] = static_cast<unsigned char>(chunk[offset]);
                if (pending_size == kBlockBytes) {
                    compress(state, pending.data());
                    pending_size = 0;
                }
            }
        }
        if (!input.eof() || input.bad()) {
            return std::nullopt;
        }

        // Padding: a single 1 bit, zeros, then the message length in bits.
        pending[pending_size++] = 0x80;
        if (pending_size > kBlockBytes - 8) {
            std::fill(pending.begin() + static_cast<std::ptrdiff_t>(pending_size), pending.end(), 0);
            compress(state, pending.data());
            pending_size = 0;
        }
        std::fill(pending.begin() + static_cast<std::ptrdiff_t>(pending_size), pending.end() - 8, 0);
        const std::uint64_t total_bits = total_bytes * 8;
        for (std::size_t i = 0; i < 8; ++i) {
            pending[kBlockBytes - 1 - i] = static_cast<unsigned char>((total_bits >> (8 * i)) & 0xFF);
        }
        compress(state, pending.data());

        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (std::uint32_t word : state) {
            oss << std::setw(8) << word;
        }
        return oss.str();
    }

    std::optional<std::string> compute_sha256(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }
        return sha256_hex(file);
    }
}
