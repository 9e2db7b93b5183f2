#include <vigil/blake3/hash.hpp>
#include <vigil/queue/commitment.hpp>
#include <vigil/schema/encoding/scale/encoder.hpp>
#include <tuple>

using namespace vigil::schema;

namespace {

using encoder_t =
    vigil::schema::encoding::encoder<vigil::schema::encoding::scale_encoder_tag>;

bytes_t make_preimage(const identity_t& to,
                      const amount_t& value,
                      const bytes_view_t& payload,
                      const call_type_t call_type) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{to, to_big_endian(value), make_bytes(payload),
                                   static_cast<uint8_t>(call_type)});
}

}  // namespace

namespace vigil::queue {

hash32_t commitment_hash(const identity_t& to,
                         const amount_t& value,
                         const bytes_view_t& payload,
                         const call_type_t call_type) {
  auto preimage = make_preimage(to, value, payload, call_type);
  return vigil::blake3::hasher{}
      .update(kCommitmentDomain)
      .update(make_bytes_view(preimage))
      .finalize();
}

hash32_t commitment_hash(const action_t& action) {
  return commitment_hash(action.to, action.value, make_bytes_view(action.payload),
                         action.call_type);
}

hash32_t secret_commitment_hash(const identity_t& to,
                                const amount_t& value,
                                const bytes_view_t& payload,
                                const call_type_t call_type,
                                const uint64_t salt) {
  auto preimage = make_preimage(to, value, payload, call_type);
  auto encoder = encoder_t{};
  encoder.append(salt, preimage);
  return vigil::blake3::hasher{}
      .update(kSecretCommitmentDomain)
      .update(make_bytes_view(preimage))
      .finalize();
}

hash32_t secret_commitment_hash(const action_t& action, const uint64_t salt) {
  return secret_commitment_hash(action.to, action.value,
                                make_bytes_view(action.payload),
                                action.call_type, salt);
}

}  // namespace vigil::queue
