#pragma once

#include "kvsession/session.hpp"
#include <string>

namespace kvsession
{

// Session data is stored as a YAML mapping whose values carry a local tag
// naming their type:
//
//   "user_id": !int 42
//   "name": !str "alice"
//   "admin": !bool true
//
// Strings that are not valid UTF-8 are stored base64-encoded under !bytes
// and decode back to the same bytes. Throws PayloadError if a session key is
// not valid UTF-8.
std::string encode_payload(const Session::Data& data);

// Empty input decodes to an empty mapping. Throws PayloadError on anything
// that is not a mapping of tagged scalars.
Session::Data decode_payload(const std::string& payload);

} // namespace kvsession
