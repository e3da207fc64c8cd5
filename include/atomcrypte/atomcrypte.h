/**
 * @file atomcrypte.h
 * @brief AtomCrypte - password-based symmetric encryption engine
 *
 * Unified header for the public API.
 *
 * Pipeline:
 * - KeyDerivation: scrypt + keyed BLAKE2b extract (optional KeyCache)
 * - SBoxGenerator: password/nonce-seeded byte permutation
 * - ChunkRoundPipeline: chunked multi-round transform, scalar or AVX2
 * - MacBinder: HMAC-SHA3-512 over plaintext and ciphertext
 * - RecoveryKeyDeriver: salt-independent alternate key path
 * - DummyDataInjector: empty-input filler and random padding
 *
 * Primitives come from OpenSSL 3 (EVP BLAKE2b, BLAKE2BMAC, HMAC/SHA3-512,
 * scrypt, ChaCha20).
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef ATOMCRYPTE_H
#define ATOMCRYPTE_H

// ============================================================================
// Core
// ============================================================================

#include "atomcrypte/version.h"
#include "atomcrypte/core/common.h"
#include "atomcrypte/core/types.h"
#include "atomcrypte/core/security.h"

#ifdef __cplusplus

#include "atomcrypte/core/errors.h"
#include "atomcrypte/core/cpu_features.h"

// ============================================================================
// Engine
// ============================================================================

#include "atomcrypte/crypto/config.h"
#include "atomcrypte/crypto/thread_strategy.h"
#include "atomcrypte/crypto/key_cache.h"
#include "atomcrypte/crypto/wire_format.h"
#include "atomcrypte/crypto/engine.h"
#include "atomcrypte/crypto/builder.h"
#include "atomcrypte/crypto/nonce.h"

// ============================================================================
// Utilities
// ============================================================================

#include "atomcrypte/utils/encoding.h"
#include "atomcrypte/utils/log.h"
#include "atomcrypte/utils/random.h"

#endif // __cplusplus

#endif // ATOMCRYPTE_H
