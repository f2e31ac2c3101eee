#pragma once                 // ensure this header is included only once per translation unit

#include <nlohmann/json.hpp> // nlohmann::json attribute values and bulk documents
#include <map>               // std::map keeps attribute records ordered by key
#include <string>            // std::string keys

// A single attribute value: any JSON value (scalars, arrays, nested objects).
using AttributeValue = nlohmann::json;

// String-keyed attribute record carried by every node and every edge.
using Attributes = std::map<std::string, AttributeValue>;
