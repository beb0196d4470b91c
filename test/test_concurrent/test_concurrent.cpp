#include <gtest/gtest.h>
#include <iostream>
#include <string_view>
#include <asbridge/asbridge.hpp>
#include <asbridge/concurrent/threading.hpp>

int main(int argc, char* argv[])
{
    ::testing::InitGoogleTest(&argc, argv);

    asbridge::concurrent::prepare_multithread();

    std::string_view options = asGetLibraryOptions();
    if(options.find("AS_NO_THREADS") != options.npos)
        std::cerr << "AS_NO_THREADS" << std::endl;

    return RUN_ALL_TESTS();
}
