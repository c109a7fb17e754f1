#include <CLI/CLI.hpp>
#include <fstream>
#include <string>
#include <vector>
#include <iostream>
#include <stdexcept>

#include <cipher/AES/aes.hpp>
#include <cipher/AES/block.hpp>
#include <cipher/AES/keySchedule.hpp>
#include <cipher/AES/phase.hpp>
#include <cipher/AES/tables.hpp>
#include <utils/DataConverter.hpp>

// One hex round key per line, '#' starts a comment.
std::vector<std::vector<uint8_t>> readScheduleFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open schedule file: " + path);
    }

    std::vector<std::vector<uint8_t>> roundKeys;
    std::string line;
    while (std::getline(f, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos)
            line.erase(hash);
        if (line.find_first_not_of(" \t\r\n") == std::string::npos)
            continue;
        roundKeys.push_back(DataConverter::LooseHexToBytes(line));
    }
    return roundKeys;
}

void printTrace(const std::vector<AES::TraceStep>& trace) {
    for (const auto& step : trace) {
        std::cout << step.label << "  " << DataConverter::BytesToHex(Block::toBytes(step.state)) << "\n";
    }
}

int main(int argc, char** argv) {
    CLI::App app{"Rijndael CLI - single-block AES encryption/decryption with a supplied key schedule"};

    std::string block;
    std::string schedule;
    std::string schedule_file;
    std::string operation = "encrypt";
    std::string sbox;
    bool trace = false;

    // Block options
    app.add_option("--block,-b", block, "16-byte block (hex)")->required();

    // Round key options
    auto* scheduleOpt = app.add_option("--schedule,-s", schedule, "Concatenated round keys (hex, 176/208/240 bytes)");
    auto* scheduleFileOpt = app.add_option("--schedule-file,-f", schedule_file, "File with one hex round key per line")
        ->check(CLI::ExistingFile);
    scheduleOpt->excludes(scheduleFileOpt);

    // Operation options
    app.add_option("--operation,-o", operation, "Operation (encrypt, decrypt)")
        ->check(CLI::IsMember({ "encrypt", "decrypt" }));
    app.add_option("--sbox", sbox, "Custom forward S-box (256 bytes hex)");
    app.add_flag("--trace", trace, "Print the state after every transformation");

    CLI11_PARSE(app, argc, argv);

    try {
        if (schedule.empty() && schedule_file.empty()) {
            throw std::runtime_error("One of --schedule or --schedule-file is required");
        }

        auto blockBytes = DataConverter::LooseHexToBytes(block);
        KeySchedule keys = schedule_file.empty()
            ? KeySchedule::fromBytes(DataConverter::LooseHexToBytes(schedule))
            : KeySchedule::fromRoundKeys(readScheduleFile(schedule_file));

        SBox forward = SubstitutionTable::sbox;
        SBox inverse = SubstitutionTable::inv_sbox;
        if (!sbox.empty()) {
            forward = SubstitutionTable::fromBytes(DataConverter::LooseHexToBytes(sbox));
            inverse = SubstitutionTable::invert(forward);
        }

        std::vector<uint8_t> result;
        if (operation == "encrypt") {
            auto plain = newPlain(blockBytes);
            if (trace)
                printTrace(AES::traceEncrypt(plain, keys, forward));
            result = AES::encrypt(plain, keys, forward).bytes();
        } else {
            auto cipher = newCipher(blockBytes);
            if (trace)
                printTrace(AES::traceDecrypt(cipher, keys, inverse));
            result = AES::decrypt(cipher, keys, inverse).bytes();
        }

        std::cout << DataConverter::BytesToHex(result) << std::endl;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
