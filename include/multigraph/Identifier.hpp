#pragma once                 // ensure this header is included only once per translation unit

#include <string>            // identifiers are plain strings

// Opaque node / edge identifier: hashable, equality-comparable and totally
// ordered (the undirected variant relies on the order to canonicalize couples).
using Identifier = std::string;

// Return a fresh 128-bit random token rendered as 32 lowercase hex digits.
Identifier generateIdentifier();
