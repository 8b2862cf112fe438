#include <gtest/gtest.h>
#include "gltf2mesh/Hasher.hpp"
#include <cstdio>
#include <fstream>
#include <stdexcept>

using gltf2mesh::Hasher;

namespace {

    TEST(HasherTest, Sha256OfKnownInputs) {
        const std::string abc = "abc";
        EXPECT_EQ(Hasher::sha256(std::vector<uint8_t>(abc.begin(), abc.end())),
                  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        EXPECT_EQ(Hasher::sha256({}),
                  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    }

    TEST(HasherTest, FileHashMatchesBufferHash) {
        const std::string path = ::testing::TempDir() + "gltf2mesh_hasher_test.bin";
        {
            std::ofstream out(path, std::ios::binary);
            out << "abc";
        }

        EXPECT_EQ(Hasher::sha256_file(path),
                  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        std::remove(path.c_str());
    }

    TEST(HasherTest, MissingFileThrows) {
        EXPECT_THROW(Hasher::sha256_file(::testing::TempDir() + "gltf2mesh_no_such_file.bin"), std::runtime_error);
    }

} // namespace
