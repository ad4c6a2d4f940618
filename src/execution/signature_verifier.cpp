#include <quorum/execution/signature_verifier.hpp>
#include <tuple>

namespace quorum::execution {

quorum::schema::bytes_t make_signing_message(
    quorum::schema::encoding::encoder<
        quorum::schema::encoding::scale_encoder_tag>& encoder,
    const quorum::schema::transaction_t& tx) {
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

}  // namespace quorum::execution
