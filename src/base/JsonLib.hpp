#ifndef __ST_JSON_LIB__
#define __ST_JSON_LIB__

#include "nlohmann/json.hpp"

/**
 * @brief nlohmann::json as `json`.  slipterm uses it for the CBOR payloads
 * of the built-in commands (json::to_cbor / json::from_cbor).
 */
using json = nlohmann::json;

#endif  // __ST_JSON_LIB__
