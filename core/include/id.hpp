#pragma once

#include <string>

namespace ember {

/**
 * @brief Random lowercase hex identifier
 * @param nbytes Number of random bytes, the result has twice as many chars
 */
std::string generate_id(size_t nbytes = 4);

/**
 * @brief Random human readable name like "brave-otter"
 */
std::string generate_name();

} // namespace ember
