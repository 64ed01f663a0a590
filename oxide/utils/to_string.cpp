/*
 * to_string.cpp
 *
 * Copyright (C) 2023-2024 Max Qian
 */

#include "to_string.hpp"

namespace oxide::utils {

auto toString(char value) -> std::string { return std::string(1, value); }

auto toString(bool value) -> std::string { return value ? "true" : "false"; }

}  // namespace oxide::utils
