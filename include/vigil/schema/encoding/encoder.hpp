#pragma once

// Codec seam for everything the queue serializes: storage rows, operation
// result payloads and commitment preimages. Each codec is a tag with an
// `encoder` specialization; changing the codec changes every persisted byte
// and every commitment.
namespace vigil::schema::encoding {

template <typename Library>
struct encoder;

struct scale_encoder_tag {};

}  // namespace vigil::schema::encoding
