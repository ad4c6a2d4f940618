#pragma once

#include <quorum/schema/encoding/scale/encoder.hpp>
#include <quorum/schema/primitives.hpp>
#include <quorum/schema/transaction.hpp>
#include <functional>

namespace quorum::execution {

using signature_verifier_t =
    std::function<bool(const quorum::schema::bytes_view_t& message,
                       const quorum::schema::identity_key_t& signer,
                       const quorum::schema::signature_t& signature)>;

/// Bytes covered by the transaction signature: SCALE of
/// (version, chain_id, nonce, signer, payload).
quorum::schema::bytes_t make_signing_message(
    quorum::schema::encoding::encoder<
        quorum::schema::encoding::scale_encoder_tag>& encoder,
    const quorum::schema::transaction_t& tx);

}  // namespace quorum::execution
