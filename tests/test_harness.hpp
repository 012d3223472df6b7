#pragma once

#include <exception>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

// Minimal named-test runner shared by the test executables
class TestSuite {
public:
    explicit TestSuite(std::string title) : title_(std::move(title)) {}
    virtual ~TestSuite() = default;

    void runTest(const std::string& name, std::function<bool()> test) {
        std::cout << "  " << name << "... ";
        try {
            if (test()) {
                std::cout << "PASSED" << std::endl;
                passCount++;
            } else {
                std::cout << "FAILED" << std::endl;
                failCount++;
            }
        } catch (const std::exception& e) {
            std::cout << "FAILED (exception: " << e.what() << ")" << std::endl;
            failCount++;
        }
    }

    static bool vectorsEqual(const std::vector<std::string>& a, const std::vector<std::string>& b) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); i++) {
            if (a[i] != b[i]) return false;
        }
        return true;
    }

    // Prints both sides on mismatch
    static bool expectTokens(const std::vector<std::string>& actual, const std::vector<std::string>& expected) {
        if (vectorsEqual(actual, expected)) return true;
        std::cerr << "\n    expected: " << join(expected) << "\n    actual:   " << join(actual) << std::endl;
        return false;
    }

    static std::string join(const std::vector<std::string>& tokens) {
        std::string out = "[";
        for (size_t i = 0; i < tokens.size(); ++i) {
            if (i > 0) out += ", ";
            out += "\"" + tokens[i] + "\"";
        }
        return out + "]";
    }

    static std::string concat(const std::vector<std::string>& tokens) {
        std::string out;
        for (const auto& t : tokens) out += t;
        return out;
    }

    int run() {
        std::cout << "\nRunning " << title_ << "..." << std::endl;
        std::cout << "================================" << std::endl;
        runAll();
        std::cout << "================================" << std::endl;
        std::cout << "Results: " << passCount << " passed, " << failCount << " failed" << std::endl;
        return failCount > 0 ? 1 : 0;
    }

protected:
    virtual void runAll() = 0;

    int passCount = 0;
    int failCount = 0;

private:
    std::string title_;
};

template <typename Suite>
int runSuite() {
    try {
        Suite suite;
        return suite.run();
    } catch (const std::exception& e) {
        std::cerr << "Test setup failed: " << e.what() << std::endl;
        return 1;
    }
}
