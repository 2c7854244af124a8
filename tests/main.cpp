/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
