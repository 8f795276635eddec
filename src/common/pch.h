// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file pch.h
 * @brief Precompiled header.
 *
 * Standard headers shared by the resolver sources.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>
