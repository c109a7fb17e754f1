#include "cipher/AES/aes.hpp"
#include "cipher/AES/round.hpp"

#include <cstdio>

namespace {

std::string roundLabel(size_t round, const char* step)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "round[%2zu].%s", round, step);
    return buf;
}

void record(std::vector<AES::TraceStep>* trace, size_t round, const char* step, const AES::State& st)
{
    if (trace)
        trace->push_back({ roundLabel(round, step), st });
}

} // namespace

CipherBlock AES::encrypt(const PlainBlock& plain, const KeySchedule& schedule, const SBox& sbox)
{
    return CipherBlock(runEncrypt(plain.state(), schedule, sbox, nullptr));
}

CipherBlock AES::encrypt(const PlainBlock& plain, const KeySchedule& schedule, const std::vector<uint8_t>& sbox)
{
    return encrypt(plain, schedule, SubstitutionTable::fromBytes(sbox));
}

PlainBlock AES::decrypt(const CipherBlock& cipher, const KeySchedule& schedule, const SBox& invSbox)
{
    return PlainBlock(runDecrypt(cipher.state(), schedule, invSbox, nullptr));
}

PlainBlock AES::decrypt(const CipherBlock& cipher, const KeySchedule& schedule, const std::vector<uint8_t>& invSbox)
{
    return decrypt(cipher, schedule, SubstitutionTable::fromBytes(invSbox));
}

AES::State AES::encryptState(const State& in, const KeySchedule& schedule, const SBox& sbox)
{
    return runEncrypt(in, schedule, sbox, nullptr);
}

AES::State AES::decryptState(const State& in, const KeySchedule& schedule, const SBox& invSbox)
{
    return runDecrypt(in, schedule, invSbox, nullptr);
}

std::vector<AES::TraceStep> AES::traceEncrypt(const PlainBlock& plain, const KeySchedule& schedule, const SBox& sbox)
{
    std::vector<TraceStep> trace;
    runEncrypt(plain.state(), schedule, sbox, &trace);
    return trace;
}

std::vector<AES::TraceStep> AES::traceDecrypt(const CipherBlock& cipher, const KeySchedule& schedule, const SBox& invSbox)
{
    std::vector<TraceStep> trace;
    runDecrypt(cipher.state(), schedule, invSbox, &trace);
    return trace;
}

AES::State AES::runEncrypt(const State& in, const KeySchedule& schedule, const SBox& sbox,
    std::vector<TraceStep>* trace)
{
    const size_t Nr = schedule.rounds(); // 10, 12, 14

    record(trace, 0, "input", in);
    record(trace, 0, "k_sch", schedule[0]);
    State state = Round::addRoundKey(in, schedule[0]);

    for (size_t round = 1; round < Nr; round++)
    {
        record(trace, round, "start", state);
        state = Round::subBytes(state, sbox);
        record(trace, round, "s_box", state);
        state = Round::shiftRows(state);
        record(trace, round, "s_row", state);
        state = Round::mixColumns(state);
        record(trace, round, "m_col", state);
        record(trace, round, "k_sch", schedule[round]);
        state = Round::addRoundKey(state, schedule[round]);
    }

    // Final round (no MixColumns)
    record(trace, Nr, "start", state);
    state = Round::subBytes(state, sbox);
    record(trace, Nr, "s_box", state);
    state = Round::shiftRows(state);
    record(trace, Nr, "s_row", state);
    record(trace, Nr, "k_sch", schedule[Nr]);
    state = Round::addRoundKey(state, schedule[Nr]);
    record(trace, Nr, "output", state);

    return state;
}

AES::State AES::runDecrypt(const State& in, const KeySchedule& schedule, const SBox& invSbox,
    std::vector<TraceStep>* trace)
{
    const size_t Nr = schedule.rounds();

    record(trace, 0, "iinput", in);
    record(trace, 0, "ik_sch", schedule[Nr]);
    State state = Round::addRoundKey(in, schedule[Nr]);

    for (size_t round = 1; round < Nr; round++)
    {
        const size_t keyIndex = Nr - round;

        record(trace, round, "istart", state);
        state = Round::invShiftRows(state);
        record(trace, round, "is_row", state);
        state = Round::invSubBytes(state, invSbox);
        record(trace, round, "is_box", state);
        record(trace, round, "ik_sch", schedule[keyIndex]);
        state = Round::addRoundKey(state, schedule[keyIndex]);
        record(trace, round, "ik_add", state);
        state = Round::invMixColumns(state);
    }

    record(trace, Nr, "istart", state);
    state = Round::invShiftRows(state);
    record(trace, Nr, "is_row", state);
    state = Round::invSubBytes(state, invSbox);
    record(trace, Nr, "is_box", state);
    record(trace, Nr, "ik_sch", schedule[0]);
    state = Round::addRoundKey(state, schedule[0]);
    record(trace, Nr, "ioutput", state);

    return state;
}
