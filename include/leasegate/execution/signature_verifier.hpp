#pragma once

#include <leasegate/schema/primitives.hpp>
#include <functional>

namespace leasegate::execution {

using signature_verifier_t =
    std::function<bool(const leasegate::schema::bytes_view_t& message,
                       const leasegate::schema::signer_id_t& signer,
                       const leasegate::schema::signature_t& signature)>;

}  // namespace leasegate::execution
