#include <gtest/gtest.h>
#include <iostream>
#include <shared_test_lib.hpp>

int main(int argc, char* argv[])
{
    ::testing::InitGoogleTest(&argc, argv);

    if(!asbridge::has_exceptions())
        std::cerr << "AS_NO_EXCEPTIONS" << std::endl;

    return RUN_ALL_TESTS();
}
