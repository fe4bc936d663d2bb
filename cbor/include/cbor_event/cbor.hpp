#pragma once

#include <cbor_event/cbor/detail.hpp>
#include <cbor_event/cbor/error.hpp>
#include <cbor_event/cbor/len.hpp>
#include <cbor_event/cbor/raw_cbor.hpp>
#include <cbor_event/cbor/serialize.hpp>
#include <cbor_event/cbor/serializer.hpp>
#include <cbor_event/cbor/sink.hpp>
#include <cbor_event/cbor/special.hpp>
#include <cbor_event/cbor/type.hpp>
#include <cbor_event/cbor/types/array.hpp>
#include <cbor_event/cbor/types/integer.hpp>
#include <cbor_event/cbor/types/map.hpp>
#include <cbor_event/cbor/types/string.hpp>
#include <cbor_event/cbor/types/tag.hpp>
#include <cbor_event/cbor/types/value.hpp>
