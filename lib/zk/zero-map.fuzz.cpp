/* This file is part of Zerokit project.
 * Copyright (c) 2024-2025 Zerokit contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <zk/tiny-str.hpp>
#include <zk/zero-map.hpp>

namespace {
    using namespace zerokit;

    template<typename T>
    void consume(const T &c)
    {
        // every element of an accepted container must be readable
        for (const auto &v: c)
            static_cast<void>(v);
    }
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, const size_t size)
{
    using namespace zerokit;
    const buffer bytes { data, size };
    try {
        consume(fixed_vec<char32_t>::from_bytes(bytes));
    } catch (const zero_copy_error &err) {
        // ignore the library's exceptions
    }
    try {
        consume(var_vec<std::string_view, uint16_t>::from_bytes(bytes));
    } catch (const zero_copy_error &err) {
        // ignore the library's exceptions
    }
    try {
        const auto m = zero_map<std::string_view, zero_map<tiny_str4, var_vec<buffer>>>::from_bytes(bytes);
        for (const auto &[k, v]: m) {
            if (!m.contains(k))
                __builtin_trap();
            consume(v);
        }
    } catch (const zero_copy_error &err) {
        // ignore the library's exceptions
    }
    return 0;
}
