#pragma once

#include "nlohmann/json.hpp"

/** @brief `nlohmann::json` under the short name used across oxpty. */
using json = nlohmann::json;
