#include <catch2/catch.hpp>

#include "qwire/errors.hpp"
#include "qwire/identity.hpp"
#include "qwire/util.hpp"

namespace qwire {

static PublicKey counting_key() {
  PublicKey pk{};
  for (std::size_t i = 0; i < pk.size(); ++i) pk[i] = (std::uint8_t)i;
  return pk;
}

TEST_CASE("Public key to identity") {
  CHECK(public_key_to_identity(PublicKey{}) ==
        "AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAELZI");

  PublicKey one{};
  one[0] = 1;
  CHECK(public_key_to_identity(one) ==
        "BAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAHRMK");

  CHECK(public_key_to_identity(counting_key()) ==
        "ICTNHRYOMCXHFAKVFBAYUMTQOJLAMOSOSERKAFGLRAOHFCLLNIHTXMXALAYD");
}

TEST_CASE("Identity to public key") {
  const std::string id = "ICTNHRYOMCXHFAKVFBAYUMTQOJLAMOSOSERKAFGLRAOHFCLLNIHTXMXALAYD";
  CHECK(identity_to_public_key(id) == counting_key());
  CHECK(is_valid_identity(id));

  for (int i = 0; i < 16; ++i) {
    PublicKey pk{};
    rand_bytes(pk.data(), pk.size());
    const std::string text = public_key_to_identity(pk);
    CHECK(text.size() == kIdentityLen);
    CHECK(identity_to_public_key(text) == pk);
  }
}

TEST_CASE("Checksum is not required for conversion") {
  std::string id = public_key_to_identity(counting_key());
  id[kIdentityLen - 1] = id[kIdentityLen - 1] == 'A' ? 'B' : 'A';
  CHECK_FALSE(is_valid_identity(id));
  CHECK(identity_to_public_key(id) == counting_key());
}

TEST_CASE("Malformed identities") {
  CHECK_THROWS_AS(identity_to_public_key(""), PreconditionError);
  CHECK_THROWS_AS(identity_to_public_key(std::string(59, 'A')), PreconditionError);
  CHECK_THROWS_AS(identity_to_public_key(std::string(61, 'A')), PreconditionError);

  std::string lower(kIdentityLen, 'A');
  lower[3] = 'a';
  CHECK_THROWS_AS(identity_to_public_key(lower), PreconditionError);

  // 26^14 - 1 does not fit in 64 bits
  CHECK_THROWS_AS(identity_to_public_key(std::string(kIdentityLen, 'Z')), PreconditionError);
  CHECK_FALSE(is_valid_identity(std::string(kIdentityLen, 'Z')));
}

} // namespace qwire
