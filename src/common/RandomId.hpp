#pragma once

#include <cstddef>
#include <string>

inline const size_t request_id_size = 16;

// Random alphanumeric identifier used for request ids and per-turn correlation ids.
std::string GenerateRandomId(size_t length = request_id_size);
