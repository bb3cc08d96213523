#pragma once

#include <string>

namespace devicecheck::core {

/**
 * @brief Generates a per-call transaction identifier.
 *
 * Identifiers are random (version 4) UUIDs in canonical form, e.g.
 * "550e8400-e29b-41d4-a716-446655440000". They only need to be unique per
 * call, not unpredictable.
 */
[[nodiscard]] auto generate_transaction_id() -> std::string;

}// namespace devicecheck::core
