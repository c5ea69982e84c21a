#include <gtest/gtest.h>
#include <LookForge/LookForge.h>

#include <iostream>

int main(int argc, char** argv) {
    // Print library info
    std::cout << "========================================\n";
    std::cout << "LookForge Unit Tests\n";
    std::cout << "Version: " << Look::Forge::GetVersion() << "\n";
    std::cout << "========================================\n\n";

    // Keep library diagnostics out of the test output
    Look::Forge::Platform::SetLogLevel(Look::Forge::Platform::LogLevel::Error);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
