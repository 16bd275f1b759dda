/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DECODA_BITS_HPP
#define DECODA_BITS_HPP

#include <decoda/bytes.hpp>
#include <decoda/primitives.hpp>

namespace decoda {
    template<> struct type_name_for<byte_vector> { static std::string get() { return "ByteVector"; } };
    template<> struct type_name_for<bit_vector> { static std::string get() { return "BitVector"; } };

    // a base64 string
    template<> struct decoder_for<byte_vector> { static decoder<byte_vector> get(); };

    /*
     * A digit from 0 to 8 giving the number of significant bits in the last byte
     * followed by the base64 encoding of the bytes.
     */
    template<> struct decoder_for<bit_vector> { static decoder<bit_vector> get(); };
}

#endif // !DECODA_BITS_HPP
