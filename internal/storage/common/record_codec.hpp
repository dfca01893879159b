#pragma once

#include <string>

#include "internal/model/value.hpp"
#include "storage/v1/record.pb.h"

namespace mapper::storage {

/*
  Value <-> protobuf conversion for backends that persist rows as bytes.
*/

mapper::storage::v1::FieldValue ToProto(const model::Value& value);
model::Value                    FromProto(const mapper::storage::v1::FieldValue& value);

// Throws StorageError if serialization fails.
std::string EncodeRecord(const model::ValueMap& values);

// Throws StorageError on malformed input.
model::ValueMap DecodeRecord(const std::string& bytes);

} // namespace mapper::storage
