#pragma once

namespace distd {

/**
 * @brief Startup self test of the crypto stack.
 *
 * Initializes libsodium and checks the linked BLAKE3 implementation against
 * a known-answer vector, then checks that the parent-combining rule of the
 * hash tree is not BLAKE3's own tree mode.
 *
 * @return true if every check passes.
 */
bool hash_self_test();

} // namespace distd
