#pragma once

namespace trellis::url {

// Decodes within the provided string buffer, compacting percent-encoded
// sequences and translating '+' to plusAs. Returns nullptr on invalid encoding (truncated % or
// non-hex digits) when strictInvalid is true, leaving the buffer in an unspecified partially
// modified state (caller can decide to discard it). With strictInvalid false, invalid sequences
// are kept literally.
// Returns a pointer to the new logical end of the decoded sequence.
// plusAs should be ' ' only for query string values, not for paths.
char* DecodeInPlace(char* first, const char* last, char plusAs = '+', bool strictInvalid = true);

}  // namespace trellis::url
