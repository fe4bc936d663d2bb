#pragma once

namespace cbe {

class raw_cbor;

template <typename TSink>
class basic_serializer;

// Serialize/Deserialize capability. A specialization provides
//
//     template <typename TSink>
//     static void serialize(const T& value, basic_serializer<TSink>& serializer);
//     static T deserialize(raw_cbor& raw);
//
// each of which must produce or consume exactly one complete CBOR item.
template <typename T, typename Enable = void>
struct cbor_traits;

}  // namespace cbe
