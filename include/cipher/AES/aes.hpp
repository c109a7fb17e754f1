#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <cipher/AES/block.hpp>
#include <cipher/AES/keySchedule.hpp>
#include <cipher/AES/phase.hpp>
#include <cipher/AES/tables.hpp>

// Rijndael round driver for one 16-byte block.
// Round keys come from the caller; no key expansion happens here.
class AES
{
public:
    using State = Block::State;

    struct TraceStep {
        std::string label;
        State state;
    };

    // Encrypt 16-byte block
    static CipherBlock encrypt(const PlainBlock& plain, const KeySchedule& schedule,
        const SBox& sbox = SubstitutionTable::sbox);
    static CipherBlock encrypt(const PlainBlock& plain, const KeySchedule& schedule,
        const std::vector<uint8_t>& sbox);

    static PlainBlock decrypt(const CipherBlock& cipher, const KeySchedule& schedule,
        const SBox& invSbox = SubstitutionTable::inv_sbox);
    static PlainBlock decrypt(const CipherBlock& cipher, const KeySchedule& schedule,
        const std::vector<uint8_t>& invSbox);

    // Same pipelines on a bare state, for callers working in state layout.
    static State encryptState(const State& in, const KeySchedule& schedule, const SBox& sbox);
    static State decryptState(const State& in, const KeySchedule& schedule, const SBox& invSbox);

    // Run the pipeline and record the state after every transformation,
    // labelled like the FIPS-197 appendix C listings.
    static std::vector<TraceStep> traceEncrypt(const PlainBlock& plain, const KeySchedule& schedule,
        const SBox& sbox = SubstitutionTable::sbox);
    static std::vector<TraceStep> traceDecrypt(const CipherBlock& cipher, const KeySchedule& schedule,
        const SBox& invSbox = SubstitutionTable::inv_sbox);

private:
    static State runEncrypt(const State& in, const KeySchedule& schedule, const SBox& sbox,
        std::vector<TraceStep>* trace);
    static State runDecrypt(const State& in, const KeySchedule& schedule, const SBox& invSbox,
        std::vector<TraceStep>* trace);
};
