#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief nlohmann::json under the short name used for state dumps.
 */
using json = nlohmann::json;
