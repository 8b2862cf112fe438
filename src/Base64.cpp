#include "gltf2mesh/Base64.hpp"
#include "gltf2mesh/Errors.hpp"
#include <array>

namespace gltf2mesh {

    namespace {
        const char* const kAlphabet =
                "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        const std::array<int16_t, 256>& lookupTable() {
            static const std::array<int16_t, 256> table = [] {
                std::array<int16_t, 256> t{};
                t.fill(-1);
                for (int16_t i = 0; i < 64; ++i) {
                    t[static_cast<unsigned char>(kAlphabet[i])] = i;
                }
                return t;
            }();
            return table;
        }
    }

    std::vector<uint8_t> Base64::decode(const std::string& input, size_t charStart) {
        if (charStart >= input.size()) {
            return {};
        }

        const auto& lookup = lookupTable();

        size_t end = input.size();
        if (end > charStart && input[end - 1] == '=') { --end; }
        if (end > charStart && input[end - 1] == '=') { --end; }
        size_t len = end - charStart;

        // Oltre la fine dell'input i sestetti valgono 0
        auto sextet = [&](size_t pos) -> uint32_t {
            if (pos >= end) {
                return 0;
            }
            int16_t v = lookup[static_cast<unsigned char>(input[pos])];
            if (v < 0) {
                throw MalformedDataError("Invalid base64 character at offset " + std::to_string(pos));
            }
            return static_cast<uint32_t>(v);
        };

        std::vector<uint8_t> out(len * 3 / 4);

        size_t i = 0;
        size_t j = charStart;
        while (i < out.size()) {
            uint32_t c1 = sextet(j++);
            uint32_t c2 = sextet(j++);
            uint32_t c3 = sextet(j++);
            uint32_t c4 = sextet(j++);

            out[i++] = static_cast<uint8_t>((c1 << 2) | (c2 >> 4));
            if (i < out.size()) out[i++] = static_cast<uint8_t>(((c2 & 15) << 4) | (c3 >> 2));
            if (i < out.size()) out[i++] = static_cast<uint8_t>(((c3 & 3) << 6) | c4);
        }

        return out;
    }

} // namespace gltf2mesh
