/* This file is part of Decoda project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <decoda/common/test.hpp>
#include <decoda/logger.hpp>

using namespace decoda;

int main(int argc, char **argv)
{
    if (argc >= 2) {
        logger::info("using test-filter mask: {}", argv[1]);
        cfg<override> = { .filter = argv[1] };
    }
}
