/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DECODA_DECODA_HPP
#define DECODA_DECODA_HPP

#include <decoda/bits.hpp>
#include <decoda/product.hpp>

#endif // !DECODA_DECODA_HPP
