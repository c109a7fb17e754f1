#include <chrono>
#include <iostream>
#include <fstream>
#include <memory>
#include <vector>
#include <string>
#include <iomanip>

#include "cipher/AES/aes.hpp"
#include "KeyExpansion.hpp"
#include "benchOptions.hpp"
#include "adapters/openssl_adapter.hpp"
#ifdef RIJNDAEL_BENCH_CRYPTOPP
#include "adapters/crypto_pp_adapter.hpp"
#endif

using Clock = std::chrono::high_resolution_clock;

struct BenchResult {
    std::string source;
    std::string algo;
    std::string op;
    double mbps;
    double nsec_per_block;
};

static void fillPattern(std::vector<uint8_t>& v, uint8_t seed) {
    for (size_t i = 0; i < v.size(); ++i)
        v[i] = static_cast<uint8_t>(seed + i);
}

static BenchResult summarize(const std::string& source, const std::string& algo, const std::string& op,
    Clock::duration dur, size_t blocks)
{
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(dur).count();
    double seconds = ns / 1e9;
    double total_bytes = static_cast<double>(blocks) * 16;
    double mbps = (total_bytes / (1024.0 * 1024.0)) / seconds;
    return { source, algo, op, mbps, static_cast<double>(ns) / blocks };
}

// Chains each output into the next input so the compiler cannot drop work.
static std::vector<BenchResult> bench_core(const std::string& algo, size_t keySize, size_t blocks)
{
    std::vector<uint8_t> key(keySize);
    fillPattern(key, 0x11);
    KeySchedule schedule = KeyExpansion::schedule(key);

    std::vector<uint8_t> pt(16);
    fillPattern(pt, 0x33);

    std::vector<BenchResult> out;

    PlainBlock plain = newPlain(pt);
    CipherBlock cipher = AES::encrypt(plain, schedule);

    auto start = Clock::now();
    for (size_t i = 0; i < blocks; ++i) {
        cipher = AES::encrypt(plain, schedule);
        plain = newPlain(cipher.bytes());
    }
    out.push_back(summarize("rijndael", algo, "encrypt", Clock::now() - start, blocks));

    start = Clock::now();
    for (size_t i = 0; i < blocks; ++i) {
        plain = AES::decrypt(cipher, schedule);
        cipher = newCipher(plain.bytes());
    }
    out.push_back(summarize("rijndael", algo, "decrypt", Clock::now() - start, blocks));

    return out;
}

static std::vector<BenchResult> bench_adapter(CipherAdapter& adapter, const std::string& algo,
    size_t keySize, size_t blocks)
{
    std::vector<uint8_t> key(keySize);
    fillPattern(key, 0x11);
    adapter.setKey(key);

    std::vector<uint8_t> buf(16);
    fillPattern(buf, 0x33);

    std::vector<BenchResult> out;

    auto start = Clock::now();
    for (size_t i = 0; i < blocks; ++i)
        adapter.encryptBlock(buf.data(), buf.data());
    out.push_back(summarize(adapter.sourceName(), algo, "encrypt", Clock::now() - start, blocks));

    start = Clock::now();
    for (size_t i = 0; i < blocks; ++i)
        adapter.decryptBlock(buf.data(), buf.data());
    out.push_back(summarize(adapter.sourceName(), algo, "decrypt", Clock::now() - start, blocks));

    return out;
}

int main(int argc, char** argv)
{
    BenchOptions opts;
    try {
        opts = parseBenchArgs(argc, argv);
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n"
                  << "Usage: " << argv[0] << " [--output <file.csv>] [--blocks <n>]\n";
        return 1;
    }
    const std::string& outFile = opts.outFile;
    const size_t blocks = opts.blocks;

    std::vector<std::unique_ptr<CipherAdapter>> adapters;
    adapters.push_back(std::make_unique<OpenSSL_AES_ECB_Adapter>());
#ifdef RIJNDAEL_BENCH_CRYPTOPP
    adapters.push_back(std::make_unique<CryptoPP_AES_ECB_Adapter>());
#endif

    const std::vector<std::pair<std::string, size_t>> variants = {
        { "AES-128", 16 }, { "AES-192", 24 }, { "AES-256", 32 }
    };

    std::vector<BenchResult> results;

    std::cerr << "[*] Starting benchmarks (blocks=" << blocks << ")...\n";

    try {
        for (const auto& [algo, keySize] : variants) {
            std::cerr << "[*] rijndael " << algo << "\n";
            auto core = bench_core(algo, keySize, blocks);
            results.insert(results.end(), core.begin(), core.end());

            for (auto& adapter : adapters) {
                std::cerr << "[*] " << adapter->sourceName() << " " << algo << "\n";
                auto ref = bench_adapter(*adapter, algo, keySize, blocks);
                results.insert(results.end(), ref.begin(), ref.end());
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Benchmark failed: " << e.what() << "\n";
        return 1;
    }

    if (!outFile.empty()) {
        std::ofstream ofs(outFile);
        if (!ofs) {
            std::cerr << "Cannot write " << outFile << "\n";
            return 1;
        }
        ofs << "source,algo,op,throughput_MBps,latency_nsec\n";
        for (auto& r : results) {
            ofs << r.source << ","
                << r.algo << ","
                << r.op << ","
                << std::fixed << std::setprecision(2) << r.mbps << ","
                << std::fixed << std::setprecision(2) << r.nsec_per_block << "\n";
        }
        std::cerr << "\n[*] Results saved to " << outFile << "\n";
    }

    std::cout << "\n=== Summary ===\n";
    std::cout << std::left << std::setw(12) << "Source"
              << std::setw(10) << "Algorithm"
              << std::setw(10) << "Op"
              << std::setw(16) << "Throughput"
              << "Latency\n";
    std::cout << std::string(60, '-') << "\n";
    for (auto& r : results) {
        std::cout << std::left << std::setw(12) << r.source
                  << std::setw(10) << r.algo
                  << std::setw(10) << r.op
                  << std::fixed << std::setprecision(2)
                  << std::setw(11) << r.mbps << " MB/s "
                  << std::setw(10) << r.nsec_per_block << " ns/block\n";
    }

    return 0;
}
