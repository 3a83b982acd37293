// =================================================================
// tests/PatchExtractorTest.cpp
// =================================================================
// Unit tests for PatchExtractor component.

#include "Testgate/PatchExtractor.hpp"
#include <cassert>
#include <iostream>
#include <string>

using Testgate::PatchExtractor;

class PatchExtractorTest {
private:
    static std::string wrap(const std::string& body) {
        return std::string("agent says hi\n") + PatchExtractor::BEGIN_MARKER + body +
               PatchExtractor::END_MARKER + "\ntrailing noise\n";
    }

public:
    void testExtractsTrimmedPatch() {
        std::cout << "Testing extraction between markers..." << std::endl;

        auto result = PatchExtractor::extractFromLogs(wrap("\n\ndiff --git a/t/x b/t/x\n+y\n\n"));
        assert(result.found);
        assert(result.patch_text == "diff --git a/t/x b/t/x\n+y");

        std::cout << "✓ Extraction test passed" << std::endl;
    }

    void testMissingMarkers() {
        std::cout << "Testing missing markers..." << std::endl;

        assert(!PatchExtractor::extractFromLogs("no markers here").found);
        assert(!PatchExtractor::extractFromLogs(std::string(PatchExtractor::BEGIN_MARKER) + "diff").found);
        assert(!PatchExtractor::extractFromLogs(std::string("diff") + PatchExtractor::END_MARKER).found);

        // An END before the BEGIN does not count
        std::string reversed = std::string(PatchExtractor::END_MARKER) + "x" + PatchExtractor::BEGIN_MARKER;
        assert(!PatchExtractor::extractFromLogs(reversed).found);

        std::cout << "✓ Missing marker test passed" << std::endl;
    }

    void testFirstPairWins() {
        std::cout << "Testing first marker pair is used..." << std::endl;

        auto result = PatchExtractor::extractFromLogs(wrap("first") + wrap("second"));
        assert(result.found);
        assert(result.patch_text == "first");

        auto empty = PatchExtractor::extractFromLogs(wrap("   "));
        assert(empty.found);
        assert(empty.patch_text.empty());

        std::cout << "✓ First pair test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running PatchExtractor unit tests..." << std::endl;

        testExtractsTrimmedPatch();
        testMissingMarkers();
        testFirstPairWins();

        std::cout << "All PatchExtractor tests passed!" << std::endl;
    }
};

int main() {
    try {
        PatchExtractorTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
