#pragma once
#include <gtest/gtest.h>
#include <iostream>
#include <string>
#include <vector>

class SummaryReporter : public ::testing::EmptyTestEventListener {
public:
    SummaryReporter()
        : passed_(0), failed_(0) {
    }

    void OnTestEnd(const ::testing::TestInfo& test_info) override {
        const std::string name = std::string(test_info.test_suite_name()) + "." + test_info.name();
        if (test_info.result()->Passed()) {
            ++passed_;
            std::cout << "[PASS] " << name << "\n";
        }
        else {
            ++failed_;
            failedNames_.push_back(name);
            std::cout << "[FAIL] " << name << "\n";
        }
    }

    void OnTestProgramEnd(const ::testing::UnitTest& /*unit_test*/) override {
        std::cout << "\n=== TEST SUMMARY ===\n";
        std::cout << "TOTAL : " << (passed_ + failed_) << "\n";
        std::cout << "PASSED: " << passed_ << "\n";
        std::cout << "FAILED: " << failed_ << "\n";
        for (const auto& name : failedNames_)
            std::cout << "  - " << name << "\n";
        std::cout << "====================\n";
    }

private:
    int passed_;
    int failed_;
    std::vector<std::string> failedNames_;
};
